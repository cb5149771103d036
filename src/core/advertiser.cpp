#include "core/advertiser.hpp"

#include <fmt/format.h>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>

#include "common/logging.hpp"
#include "network/multicast_transport.hpp"

namespace ssdpkit::core {

using protocol::HeaderSet;
using protocol::Reply;
using protocol::Search;

namespace {

auto generateUuid() -> std::string {
  boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

auto loadServices(const common::ConfigManager& config) -> ServiceTable {
  ServiceTable services;

  auto section = config.getJson("advertiser.services");
  if (!section) {
    return services;
  }
  if (!section->is_object()) {
    LOG_MODULE("advertiser", logging::LogLevel::WARNING)
        << "Config key 'advertiser.services' must be an object, got "
        << section->type_name();
    return services;
  }

  for (const auto& [service, attributes] : section->items()) {
    if (service.empty()) {
      LOG_MODULE("advertiser", logging::LogLevel::WARNING)
          << "Skipping service with empty type in 'advertiser.services'";
      continue;
    }

    HeaderSet headers;
    if (attributes.is_object()) {
      for (const auto& [name, value] : attributes.items()) {
        if (value.is_string()) {
          headers.set(name, value.get<std::string>());
        } else if (value.is_number_integer()) {
          headers.set(name, value.get<long long>());
        } else {
          headers.set(name, value.dump());
        }
      }
    } else if (!attributes.is_null()) {
      LOG_MODULE("advertiser", logging::LogLevel::WARNING)
          << "Headers of service '" << service
          << "' must be an object, got " << attributes.type_name();
    }
    services.emplace(service, std::move(headers));
  }
  return services;
}

}  // namespace

auto AdvertiserOptions::fromConfig(const common::ConfigManager& config)
    -> AdvertiserOptions {
  AdvertiserOptions options;
  options.transport.bind_host =
      config.getWithDefault<std::string>("ssdp.bind_host",
                                         constants::kDefaultBindHost);
  options.transport.loopback = config.getWithDefault<bool>("ssdp.loopback", false);
  options.transport.ttl = config.getTtl();
  options.interval = config.getInterval("advertiser.interval_ms",
                                        constants::kDefaultAnnounceInterval);

  auto uuid = config.getString("advertiser.uuid");
  if (uuid && !uuid->empty()) {
    options.uuid = *uuid;
  }
  options.services = loadServices(config);
  return options;
}

Advertiser::Advertiser(net::io_context& ioc, AdvertiserOptions options)
    : Advertiser(ioc,
                 std::make_unique<network::MulticastTransport>(
                     ioc, options.transport),
                 options) {}

Advertiser::Advertiser(net::io_context& ioc,
                       std::unique_ptr<network::Transport> transport,
                       AdvertiserOptions options)
    : uuid_(options.uuid ? *options.uuid : generateUuid()),
      authentication_provider_(std::move(options.authentication_provider)),
      socket_(std::make_unique<network::SsdpSocket>(std::move(transport))) {
  for (auto& [service, headers] : options.services) {
    if (service.empty()) {
      throw std::invalid_argument("Service type must not be empty");
    }
    services_.emplace(service, std::move(headers));
  }

  network::SsdpSocket::Handlers handlers;
  handlers.on_search = [this](const Search& request,
                              const network::Origin& origin) {
    handleSearch(request, origin);
  };
  handlers.on_error = [this](const protocol::DecodeError& error) {
    emitError(ErrorKind::Decode, error.describe(), error.payload);
  };
  socket_->setHandlers(std::move(handlers));

  timer_ = std::make_unique<network::PeriodicTimer>(ioc, options.interval,
                                                    [this] { tick(); });
  timer_->start();

  LOG_MODULE("advertiser", logging::LogLevel::INFO)
      << "Advertiser " << uuid_ << " started with " << services_.size()
      << " service(s), interval " << options.interval.count() << "ms";
}

Advertiser::~Advertiser() { destroy(); }

void Advertiser::announce(const std::string& service,
                          const HeaderSet& headers) {
  if (destroyed_) return;
  if (service.empty()) {
    throw std::invalid_argument("Service type must not be empty");
  }

  bool inserted = false;
  {
    std::lock_guard lock(mutex_);
    auto [it, is_new] = services_.insert_or_assign(service, headers);
    inserted = is_new;
  }

  if (inserted) {
    LOG_MODULE("advertiser", logging::LogLevel::DEBUG)
        << "Announcing new service " << service;
    notifyService(service, headers);
  }
}

auto Advertiser::withdraw(const std::string& service) -> bool {
  if (destroyed_) return false;

  {
    std::lock_guard lock(mutex_);
    if (services_.erase(service) == 0) {
      return false;
    }
  }

  LOG_MODULE("advertiser", logging::LogLevel::DEBUG)
      << "Withdrawing service " << service;
  emitErrors(socket_->bye(service, {{constants::kHeaderUsn, usnFor(service)}}));
  return true;
}

auto Advertiser::update(const std::string& service, const HeaderSet& headers)
    -> bool {
  if (destroyed_) return false;
  if (service.empty()) {
    throw std::invalid_argument("Service type must not be empty");
  }

  bool existed = false;
  {
    std::lock_guard lock(mutex_);
    auto [it, is_new] = services_.insert_or_assign(service, headers);
    existed = !is_new;
  }

  HeaderSet outgoing = headers;
  outgoing.set(constants::kHeaderUsn, usnFor(service));
  emitErrors(socket_->update(service, outgoing));
  return existed;
}

void Advertiser::announceNow() {
  if (destroyed_) return;
  tick();
}

auto Advertiser::services() const -> ServiceTable {
  std::lock_guard lock(mutex_);
  return services_;
}

auto Advertiser::addListener(Listener listener) -> ListenerId {
  return events_.connect(std::move(listener));
}

auto Advertiser::removeListener(ListenerId id) -> bool {
  return events_.disconnect(id);
}

void Advertiser::destroy() {
  if (destroyed_.exchange(true)) {
    return;
  }

  ServiceTable remaining;
  {
    std::lock_guard lock(mutex_);
    remaining = services_;
  }

  LOG_MODULE("advertiser", logging::LogLevel::INFO)
      << "Advertiser " << uuid_ << " shutting down, sending byebye for "
      << remaining.size() + 2 << " target(s)";

  const std::string self = identity();
  emitErrors(socket_->bye(self, {{constants::kHeaderUsn, self}}));
  emitErrors(socket_->bye(constants::kTargetRootDevice,
                          {{constants::kHeaderUsn,
                            usnFor(constants::kTargetRootDevice)}}));
  for (const auto& [service, headers] : remaining) {
    emitErrors(socket_->bye(service, {{constants::kHeaderUsn, usnFor(service)}}));
  }

  timer_->stop();
  socket_->destroy();
}

void Advertiser::tick() {
  if (destroyed_) return;

  notifyRootDevices();

  ServiceTable snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = services_;
  }
  for (const auto& [service, headers] : snapshot) {
    notifyService(service, headers);
  }
}

void Advertiser::notifyRootDevices() {
  emitErrors(socket_->notify(
      constants::kTargetRootDevice,
      {{constants::kHeaderUsn, usnFor(constants::kTargetRootDevice)}}));

  const std::string self = identity();
  emitErrors(socket_->notify(self, {{constants::kHeaderUsn, self}}));
}

void Advertiser::notifyService(const std::string& service,
                               const HeaderSet& headers) {
  HeaderSet outgoing = headers;
  outgoing.set(constants::kHeaderUsn, usnFor(service));
  emitErrors(socket_->notify(service, outgoing));
}

void Advertiser::handleSearch(const Search& request,
                              const network::Origin& origin) {
  if (destroyed_) return;

  const std::string target =
      request.getHeader(constants::kHeaderSt).value_or("");
  if (request.getHeader(constants::kHeaderMan) != constants::kDiscoverMan ||
      target.empty()) {
    return;
  }

  if (authentication_provider_ && !authentication_provider_(request.host())) {
    LOG_MODULE("advertiser", logging::LogLevel::DEBUG)
        << "Search for " << target << " from " << request.host()
        << " rejected by authentication provider";
    return;
  }

  std::vector<std::pair<std::string, HeaderSet>> entries;
  const std::string self = identity();

  if (target == constants::kTargetAll) {
    entries.emplace_back(constants::kTargetRootDevice, HeaderSet{});
    entries.emplace_back(self, HeaderSet{});
    std::lock_guard lock(mutex_);
    for (const auto& entry : services_) {
      entries.emplace_back(entry);
    }
  } else if (target == constants::kTargetRootDevice || target == self) {
    entries.emplace_back(target, HeaderSet{});
  } else {
    std::lock_guard lock(mutex_);
    auto it = services_.find(target);
    if (it != services_.end()) {
      entries.emplace_back(*it);
    }
  }

  if (entries.empty()) {
    emitError(ErrorKind::UnknownTarget,
              fmt::format("Unknown target or service: {}", target),
              request.encode());
    return;
  }

  LOG_MODULE("advertiser", logging::LogLevel::DEBUG)
      << "Answering search for " << target << " from " << request.host()
      << ":" << request.port() << " with " << entries.size() << " reply(ies)";

  events_.emit(SearchEvent{target, request, origin.remote, origin.local});
  sendReplies(request, entries);
}

void Advertiser::sendReplies(
    const Search& request,
    const std::vector<std::pair<std::string, HeaderSet>>& entries) {
  for (const auto& [service, headers] : entries) {
    Reply reply;
    reply.setHeaders(headers);
    reply.setHeader(constants::kHeaderSt, service);
    reply.setHeader(constants::kHeaderUsn, usnFor(service));
    emitErrors(socket_->reply(request, reply));
  }
}

void Advertiser::emitErrors(const network::SendErrors& errors) {
  for (const auto& error : errors) {
    emitError(ErrorKind::Send, error.message());
  }
}

void Advertiser::emitError(ErrorKind kind, std::string message,
                           std::string payload) {
  LOG_MODULE("advertiser", logging::LogLevel::DEBUG)
      << "Emitting " << toString(kind) << " error: " << message;
  events_.emit(ErrorEvent{kind, std::move(message), std::move(payload)});
}

auto Advertiser::identity() const -> std::string {
  return fmt::format("uuid:{}", uuid_);
}

// 身份通知使用裸 uuid:<uuid>，其余 USN（包括所有回复）都带服务后缀
auto Advertiser::usnFor(const std::string& service) const -> std::string {
  return fmt::format("uuid:{}::{}", uuid_, service);
}

}  // namespace ssdpkit::core
