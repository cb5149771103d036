#include "network/multicast_transport.hpp"

#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <mutex>
#include <vector>

#include "common/logging.hpp"
#include "network/error_context.hpp"

namespace ssdpkit::network {

namespace {

auto toString(const udp::endpoint& endpoint) -> std::string {
  return endpoint.address().to_string() + ":" +
         std::to_string(endpoint.port());
}

// 本机所有 IPv4 地址，用于判断数据报是否来自本进程
auto collectLocalAddresses() -> std::vector<net::ip::address> {
  std::vector<net::ip::address> addresses;

  ifaddrs* list = nullptr;
  if (getifaddrs(&list) != 0) {
    LOG_MODULE("transport", logging::LogLevel::WARNING)
        << "Unable to enumerate local interface addresses";
    return addresses;
  }

  for (ifaddrs* current = list; current != nullptr;
       current = current->ifa_next) {
    if (current->ifa_addr == nullptr || current->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    const auto* in = reinterpret_cast<const sockaddr_in*>(current->ifa_addr);
    addresses.emplace_back(
        net::ip::address_v4(ntohl(in->sin_addr.s_addr)));
  }

  freeifaddrs(list);
  return addresses;
}

}  // namespace

class MulticastTransport::Impl : public std::enable_shared_from_this<Impl> {
 public:
  Impl(net::io_context& ioc, TransportOptions options)
      : ioc_(ioc), options_(std::move(options)), socket_(ioc), recv_buffer_() {}

  void open() {
    const auto group = net::ip::make_address_v4(options_.multicast_group);
    bind_address_ = net::ip::make_address_v4(options_.bind_host);
    group_endpoint_ = udp::endpoint(group, options_.port);

    const udp::endpoint listen_endpoint(net::ip::address_v4::any(),
                                        options_.port);
    socket_.open(listen_endpoint.protocol());
    socket_.set_option(net::socket_base::reuse_address(true));
    socket_.bind(listen_endpoint);

    socket_.set_option(net::ip::multicast::hops(options_.ttl));
    socket_.set_option(net::ip::multicast::enable_loopback(options_.loopback));
    if (!bind_address_.is_unspecified()) {
      socket_.set_option(net::ip::multicast::outbound_interface(bind_address_));
    }

    boost::system::error_code ec;
    socket_.set_option(net::ip::multicast::join_group(group, bind_address_), ec);
    if (ec) {
      LOG_MODULE("transport", logging::LogLevel::WARNING)
          << "Failed to join multicast group " << options_.multicast_group
          << " on " << options_.bind_host << ": " << ec.message()
          << ". Only unicast traffic will be received.";
    }

    local_endpoint_ =
        udp::endpoint(bind_address_, socket_.local_endpoint().port());
    local_addresses_ = collectLocalAddresses();

    LOG_MODULE("transport", logging::LogLevel::INFO)
        << "SSDP transport listening on " << toString(local_endpoint_)
        << " (group " << toString(group_endpoint_) << ", ttl " << options_.ttl
        << ", loopback " << (options_.loopback ? "on" : "off") << ")";
  }

  void start() { do_receive(); }

  void setHandler(ReceiveHandler handler) {
    std::lock_guard lock(handler_mutex_);
    handler_ = std::move(handler);
  }

  auto send(const std::string& payload, const Destination& destination)
      -> SendErrors {
    SendErrors errors;

    udp::endpoint target = group_endpoint_;
    if (destination.port) {
      target.port(*destination.port);
    }
    if (destination.address) {
      boost::system::error_code ec;
      const auto address = net::ip::make_address(*destination.address, ec);
      if (ec) {
        errors.push_back(SendError{
            *destination.address + ":" + std::to_string(target.port()), ec});
        return errors;
      }
      target.address(address);
    }

    NetworkContext ctx("send", toString(target));
    if (closed_) {
      errors.push_back(SendError{ctx.endpoint, net::error::bad_descriptor});
      return errors;
    }

    boost::system::error_code ec;
    {
      std::lock_guard lock(send_mutex_);
      ctx.bytes_transferred =
          socket_.send_to(net::buffer(payload), target, 0, ec);
    }
    if (ec) {
      ErrorLogger::logNetworkError(ctx, ec);
      errors.push_back(SendError{ctx.endpoint, ec});
    }
    return errors;
  }

  void close() {
    if (closed_.exchange(true)) {
      return;
    }
    {
      std::lock_guard lock(handler_mutex_);
      handler_ = nullptr;
    }
    net::post(ioc_, [self = shared_from_this()] {
      boost::system::error_code ec;
      self->socket_.close(ec);
      LOG_MODULE("transport", logging::LogLevel::DEBUG)
          << "SSDP transport on " << toString(self->local_endpoint_)
          << " closed";
    });
  }

  auto groupAddress() const -> std::string { return toString(group_endpoint_); }
  auto localEndpoint() const -> udp::endpoint { return local_endpoint_; }

 private:
  void do_receive() {
    if (closed_) return;

    socket_.async_receive_from(
        net::buffer(recv_buffer_), remote_endpoint_,
        [self = shared_from_this()](const boost::system::error_code& ec,
                                    std::size_t bytes_transferred) {
          self->handle_receive(ec, bytes_transferred);
        });
  }

  void handle_receive(const boost::system::error_code& error,
                      std::size_t bytes_transferred) {
    if (error) {
      if (closed_ || ErrorHelper::isShutdown(error)) {
        return;
      }
      NetworkContext ctx("receive", toString(remote_endpoint_));
      ErrorLogger::logNetworkError(ctx, error);
      do_receive();
      return;
    }

    Datagram datagram;
    datagram.payload.assign(recv_buffer_.data(), bytes_transferred);
    datagram.local = local_endpoint_;
    datagram.remote = remote_endpoint_;
    datagram.from_self = isFromSelf(remote_endpoint_);

    {
      std::lock_guard lock(handler_mutex_);
      // 拷贝一份，处理函数内部调用 destroy() 时不会销毁正在执行的对象。
      // 持锁调用，close() 返回后处理函数捕获的对象即可安全释放；
      // 因此处理函数不得等待一个正在调用 close() 的线程所持有的锁
      const auto handler = handler_;
      if (handler && !closed_) {
        try {
          handler(datagram);
        } catch (const std::exception& e) {
          LOG_MODULE("transport", logging::LogLevel::ERROR)
              << "Receive handler threw for datagram from "
              << toString(datagram.remote) << ": " << e.what();
        }
      }
    }

    do_receive();
  }

  auto isFromSelf(const udp::endpoint& remote) const -> bool {
    if (remote.port() != local_endpoint_.port()) {
      return false;
    }
    const auto address = remote.address();
    if (address.is_loopback() || address == net::ip::address(bind_address_)) {
      return true;
    }
    return std::find(local_addresses_.begin(), local_addresses_.end(),
                     address) != local_addresses_.end();
  }

  net::io_context& ioc_;
  TransportOptions options_;
  udp::socket socket_;
  net::ip::address_v4 bind_address_;
  udp::endpoint group_endpoint_;
  udp::endpoint local_endpoint_;
  udp::endpoint remote_endpoint_;
  std::array<char, constants::kReceiveBufferSize> recv_buffer_;
  std::vector<net::ip::address> local_addresses_;

  std::recursive_mutex handler_mutex_;
  ReceiveHandler handler_;
  std::mutex send_mutex_;
  std::atomic<bool> closed_{false};
};

MulticastTransport::MulticastTransport(net::io_context& ioc,
                                       const TransportOptions& options)
    : impl_(std::make_shared<Impl>(ioc, options)) {
  impl_->open();
  impl_->start();
}

MulticastTransport::~MulticastTransport() { destroy(); }

void MulticastTransport::setReceiveHandler(ReceiveHandler handler) {
  impl_->setHandler(std::move(handler));
}

auto MulticastTransport::send(const std::string& payload,
                              const Destination& destination) -> SendErrors {
  return impl_->send(payload, destination);
}

auto MulticastTransport::groupAddress() const -> std::string {
  return impl_->groupAddress();
}

void MulticastTransport::destroy() { impl_->close(); }

auto MulticastTransport::localEndpoint() const -> udp::endpoint {
  return impl_->localEndpoint();
}

}  // namespace ssdpkit::network
