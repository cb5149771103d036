#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/config_manager.hpp"
#include "common/constants.hpp"
#include "core/event_channel.hpp"
#include "core/events.hpp"
#include "network/periodic_timer.hpp"
#include "network/ssdp_socket.hpp"
#include "network/transport.hpp"
#include "protocol/header_set.hpp"

namespace ssdpkit::core {

namespace net = boost::asio;

using ServiceTable = std::map<std::string, protocol::HeaderSet>;

/**
 * @brief 认证回调：参数为搜索方的 IP 地址，返回 false 时静默忽略该搜索
 */
using AuthenticationProvider = std::function<bool(const std::string&)>;

struct AdvertiserOptions {
  network::TransportOptions transport;
  std::chrono::milliseconds interval = constants::kDefaultAnnounceInterval;
  // 未指定时生成随机 UUID
  std::optional<std::string> uuid;
  ServiceTable services;
  AuthenticationProvider authentication_provider;

  /**
   * @brief 从配置读取 ssdp.* 与 advertiser.* 键
   */
  static auto fromConfig(const common::ConfigManager& config)
      -> AdvertiserOptions;
};

/**
 * @brief SSDP 服务通告者
 *
 * 构造后立即并按 interval 周期性地为 upnp:rootdevice、uuid:<uuid> 以及
 * 服务表中的每个服务发送 ssdp:alive；自动回复匹配的 M-SEARCH。
 * destroy()（或析构）时为以上所有目标发送 ssdp:byebye。
 *
 * 公共方法线程安全；事件在 io_context 线程或调用方线程上发出，
 * 监听者中可以再调用本对象的公共方法（包括 destroy）。
 */
class Advertiser {
 public:
  using Listener = std::function<void(const AdvertiserEvent&)>;

  explicit Advertiser(net::io_context& ioc, AdvertiserOptions options = {});
  Advertiser(net::io_context& ioc,
             std::unique_ptr<network::Transport> transport,
             AdvertiserOptions options = {});
  ~Advertiser();

  Advertiser(const Advertiser&) = delete;
  auto operator=(const Advertiser&) -> Advertiser& = delete;

  /**
   * @brief 添加或替换一个服务；新服务会立即发送一次 ssdp:alive
   *
   * @throws std::invalid_argument 服务类型为空
   */
  void announce(const std::string& service,
                const protocol::HeaderSet& headers = {});

  /**
   * @brief 移除服务并发送一次 ssdp:byebye
   * @return 服务是否存在
   */
  auto withdraw(const std::string& service) -> bool;

  /**
   * @brief 替换服务的头部并发送一次 ssdp:update
   * @return 服务此前是否已存在
   */
  auto update(const std::string& service, const protocol::HeaderSet& headers)
      -> bool;

  // 立即为根设备、自身标识和所有服务发送 ssdp:alive
  void announceNow();

  [[nodiscard]] auto services() const -> ServiceTable;
  [[nodiscard]] auto uuid() const -> const std::string& { return uuid_; }
  [[nodiscard]] auto destroyed() const -> bool { return destroyed_; }

  auto addListener(Listener listener) -> ListenerId;
  auto removeListener(ListenerId id) -> bool;

  /**
   * @brief 发送告别消息、停止定时器并释放传输层，可重复调用
   */
  void destroy();

 private:
  void tick();
  void handleSearch(const protocol::Search& request,
                    const network::Origin& origin);
  void sendReplies(const protocol::Search& request,
                   const std::vector<std::pair<std::string, protocol::HeaderSet>>&
                       entries);
  void notifyRootDevices();
  void notifyService(const std::string& service,
                     const protocol::HeaderSet& headers);

  void emitErrors(const network::SendErrors& errors);
  void emitError(ErrorKind kind, std::string message, std::string payload = {});

  [[nodiscard]] auto identity() const -> std::string;
  [[nodiscard]] auto usnFor(const std::string& service) const -> std::string;

  std::string uuid_;
  AuthenticationProvider authentication_provider_;
  std::unique_ptr<network::SsdpSocket> socket_;
  std::unique_ptr<network::PeriodicTimer> timer_;
  EventChannel<AdvertiserEvent> events_;

  mutable std::mutex mutex_;
  ServiceTable services_;
  std::atomic<bool> destroyed_{false};
};

}  // namespace ssdpkit::core
