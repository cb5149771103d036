#include "core/browser.hpp"

#include "common/logging.hpp"
#include "network/multicast_transport.hpp"

namespace ssdpkit::core {

using protocol::Notification;
using protocol::Reply;

auto BrowserOptions::fromConfig(const common::ConfigManager& config)
    -> BrowserOptions {
  BrowserOptions options;
  options.transport.bind_host =
      config.getWithDefault<std::string>("ssdp.bind_host",
                                         constants::kDefaultBindHost);
  options.transport.loopback = config.getWithDefault<bool>("ssdp.loopback", false);
  options.transport.ttl = config.getTtl();
  options.interval = config.getInterval("browser.interval_ms",
                                        constants::kDefaultSearchInterval);

  auto services = config.getJson("browser.services");
  if (services) {
    if (services->is_string()) {
      options.services.push_back(services->get<std::string>());
    } else if (services->is_array()) {
      for (const auto& service : *services) {
        if (service.is_string()) {
          options.services.push_back(service.get<std::string>());
        } else {
          LOG_MODULE("browser", logging::LogLevel::WARNING)
              << "Ignoring non-string entry in 'browser.services': "
              << service.dump();
        }
      }
    } else {
      LOG_MODULE("browser", logging::LogLevel::WARNING)
          << "Config key 'browser.services' must be a string or an array, got "
          << services->type_name();
    }
  }
  return options;
}

Browser::Browser(net::io_context& ioc, BrowserOptions options)
    : Browser(ioc,
              std::make_unique<network::MulticastTransport>(ioc,
                                                            options.transport),
              options) {}

Browser::Browser(net::io_context& ioc,
                 std::unique_ptr<network::Transport> transport,
                 BrowserOptions options)
    : socket_(std::make_unique<network::SsdpSocket>(std::move(transport))) {
  for (const auto& service : options.services) {
    subscriptions_.insert(normalize(service));
  }

  network::SsdpSocket::Handlers handlers;
  handlers.on_notification = [this](const Notification& notification,
                                    const network::Origin& origin) {
    handleNotification(notification, origin);
  };
  handlers.on_reply = [this](const Reply& reply,
                             const network::Origin& origin) {
    handleReply(reply, origin);
  };
  handlers.on_error = [this](const protocol::DecodeError& error) {
    events_.emit(ErrorEvent{ErrorKind::Decode, error.describe(), error.payload});
  };
  socket_->setHandlers(std::move(handlers));

  timer_ = std::make_unique<network::PeriodicTimer>(ioc, options.interval,
                                                    [this] { searchNow(); });
  timer_->start();

  LOG_MODULE("browser", logging::LogLevel::INFO)
      << "Browser started with " << subscriptions_.size()
      << " subscription(s), interval " << options.interval.count() << "ms";
}

Browser::~Browser() { destroy(); }

auto Browser::normalize(const std::string& service) -> std::string {
  if (service == constants::kTargetWildcard) {
    return constants::kTargetAll;
  }
  return service;
}

void Browser::subscribe(const std::string& service) {
  if (destroyed_) return;

  const std::string target = normalize(service);
  {
    std::lock_guard lock(mutex_);
    if (subscriptions_.count(target) != 0) {
      return;
    }
  }

  browse({target});

  std::lock_guard lock(mutex_);
  subscriptions_.insert(target);
}

auto Browser::unsubscribe(const std::string& service) -> bool {
  std::lock_guard lock(mutex_);
  return subscriptions_.erase(service) != 0;
}

void Browser::searchNow() {
  if (destroyed_) return;

  std::vector<std::string> targets;
  {
    std::lock_guard lock(mutex_);
    targets.assign(subscriptions_.begin(), subscriptions_.end());
  }
  browse(targets);
}

auto Browser::subscriptions() const -> std::set<std::string> {
  std::lock_guard lock(mutex_);
  return subscriptions_;
}

auto Browser::addListener(Listener listener) -> ListenerId {
  return events_.connect(std::move(listener));
}

auto Browser::removeListener(ListenerId id) -> bool {
  return events_.disconnect(id);
}

void Browser::destroy() {
  if (destroyed_.exchange(true)) {
    return;
  }
  LOG_MODULE("browser", logging::LogLevel::INFO) << "Browser shutting down";
  timer_->stop();
  socket_->destroy();
}

void Browser::browse(const std::vector<std::string>& targets) {
  for (const auto& target : targets) {
    LOG_MODULE("browser", logging::LogLevel::TRACE) << "Searching for " << target;
    emitErrors(socket_->search(target));
  }
}

void Browser::handleNotification(const Notification& notification,
                                 const network::Origin& origin) {
  const auto target = notification.getHeader(constants::kHeaderNt);
  if (!target || !isSubscribed(*target)) {
    return;
  }

  if (notification.isAlive() || notification.isUpdate()) {
    events_.emit(DiscoverEvent{*target, notification, origin.remote,
                               origin.local});
  } else if (notification.isByeBye()) {
    events_.emit(WithdrawEvent{*target, notification, origin.remote,
                               origin.local});
  } else {
    LOG_MODULE("browser", logging::LogLevel::DEBUG)
        << "Dropping notification for " << *target << " with NTS '"
        << notification.getHeader(constants::kHeaderNts).value_or("")
        << "'";
  }
}

void Browser::handleReply(const Reply& reply, const network::Origin& origin) {
  const auto target = reply.getHeader(constants::kHeaderSt);
  if (!target || !isSubscribed(*target)) {
    return;
  }
  events_.emit(DiscoverEvent{*target, reply, origin.remote, origin.local});
}

auto Browser::isSubscribed(const std::string& target) const -> bool {
  std::lock_guard lock(mutex_);
  return subscriptions_.count(target) != 0;
}

void Browser::emitErrors(const network::SendErrors& errors) {
  for (const auto& error : errors) {
    events_.emit(ErrorEvent{ErrorKind::Send, error.message(), {}});
  }
}

}  // namespace ssdpkit::core
