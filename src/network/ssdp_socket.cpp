#include "network/ssdp_socket.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

#include "common/logging.hpp"

namespace ssdpkit::network {

using protocol::HeaderSet;
using protocol::Notification;
using protocol::Reply;
using protocol::Search;

SsdpSocket::SsdpSocket(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("SsdpSocket requires a transport");
  }
  group_address_ = transport_->groupAddress();
  transport_->setReceiveHandler(
      [this](const Datagram& datagram) { handleDatagram(datagram); });
}

SsdpSocket::~SsdpSocket() { destroy(); }

void SsdpSocket::setHandlers(Handlers handlers) {
  std::lock_guard lock(handlers_mutex_);
  handlers_ = std::move(handlers);
}

void SsdpSocket::handleDatagram(const Datagram& datagram) {
  Handlers handlers;
  {
    std::lock_guard lock(handlers_mutex_);
    handlers = handlers_;
  }

  const Origin origin{datagram.local, datagram.remote, datagram.from_self};
  auto decoded =
      protocol::decodeDatagram(datagram.payload,
                               datagram.remote.address().to_string(),
                               datagram.remote.port());
  if (!decoded) {
    LOG_MODULE("codec", logging::LogLevel::DEBUG)
        << "Failed to decode datagram from " << datagram.remote.address()
        << ":" << datagram.remote.port() << ": " << decoded.error().cause;
    if (handlers.on_error) {
      handlers.on_error(decoded.error());
    }
    return;
  }

  std::visit(
      [&](const auto& message) {
        using T = std::decay_t<decltype(message)>;
        if constexpr (std::is_same_v<T, Search>) {
          const bool valid =
              message.getHeader(constants::kHeaderMan) ==
                  constants::kDiscoverMan &&
              message.hasHeader(constants::kHeaderSt);
          if (!valid) {
            LOG_MODULE("codec", logging::LogLevel::TRACE)
                << "Ignoring M-SEARCH without discover MAN or ST from "
                << message.host() << ":" << message.port();
            return;
          }
          if (handlers.on_search) handlers.on_search(message, origin);
        } else if constexpr (std::is_same_v<T, Notification>) {
          if (handlers.on_notification) handlers.on_notification(message, origin);
        } else {
          if (handlers.on_reply) handlers.on_reply(message, origin);
        }
      },
      *decoded);
}

auto SsdpSocket::search(const std::string& target, int wait,
                        const HeaderSet& headers) -> SendErrors {
  if (wait < constants::kMinSearchWaitSeconds ||
      wait > constants::kMaxSearchWaitSeconds) {
    throw std::invalid_argument("MX must be between 1 and 5 seconds, got " +
                                std::to_string(wait));
  }

  Search message(constants::kMulticastGroup, constants::kMulticastPort);
  message.setHeaders(headers);
  message.setHeader(constants::kHeaderMan, constants::kDiscoverMan);
  message.setHeader(constants::kHeaderHost, group_address_);
  message.setHeader(constants::kHeaderSt, target);
  message.setHeader(constants::kHeaderMx, static_cast<long long>(wait));
  if (!message.hasHeader(constants::kHeaderExt)) {
    message.setHeader(constants::kHeaderExt, "");
  }
  return send(message);
}

auto SsdpSocket::sendNotification(const std::string& target, const char* nts,
                                  const HeaderSet& headers) -> SendErrors {
  Notification message;
  message.setHeaders(headers);
  message.setHeader(constants::kHeaderHost, group_address_);
  message.setHeader(constants::kHeaderNt, target);
  message.setHeader(constants::kHeaderNts, nts);
  return send(message);
}

auto SsdpSocket::notify(const std::string& target, const HeaderSet& headers)
    -> SendErrors {
  return sendNotification(target, constants::kNtsAlive, headers);
}

auto SsdpSocket::update(const std::string& target, const HeaderSet& headers)
    -> SendErrors {
  return sendNotification(target, constants::kNtsUpdate, headers);
}

auto SsdpSocket::bye(const std::string& target, const HeaderSet& headers)
    -> SendErrors {
  return sendNotification(target, constants::kNtsByeBye, headers);
}

auto SsdpSocket::reply(const Search& request, const Reply& response)
    -> SendErrors {
  return send(response, Destination{request.host(), request.port()});
}

auto SsdpSocket::send(const protocol::Message& message,
                      const Destination& destination) -> SendErrors {
  std::lock_guard lock(transport_mutex_);
  if (!transport_) {
    return {};
  }
  return transport_->send(message.encode(), destination);
}

void SsdpSocket::destroy() {
  {
    std::lock_guard lock(handlers_mutex_);
    handlers_ = Handlers{};
  }
  std::unique_ptr<Transport> released;
  {
    std::lock_guard lock(transport_mutex_);
    released = std::move(transport_);
  }
  // 在锁外关闭：close() 会等待正在执行的接收处理函数，
  // 而处理函数中的回复需要 transport_mutex_
  if (released) {
    released->destroy();
  }
}

}  // namespace ssdpkit::network
