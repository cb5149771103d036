#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "common/config_manager.hpp"
#include "common/constants.hpp"
#include "core/event_channel.hpp"
#include "core/events.hpp"
#include "network/periodic_timer.hpp"
#include "network/ssdp_socket.hpp"
#include "network/transport.hpp"

namespace ssdpkit::core {

namespace net = boost::asio;

struct BrowserOptions {
  network::TransportOptions transport;
  std::chrono::milliseconds interval = constants::kDefaultSearchInterval;
  // 初始订阅，"*" 会被规范化为 ssdp:all
  std::vector<std::string> services;

  /**
   * @brief 从配置读取 ssdp.* 与 browser.* 键，browser.services 可为字符串或数组
   */
  static auto fromConfig(const common::ConfigManager& config) -> BrowserOptions;
};

/**
 * @brief SSDP 服务浏览者
 *
 * 构造后立即并按 interval 周期性地为每个订阅目标发送 M-SEARCH。
 * 对已订阅目标的 Reply 以及 alive/update 通知发出 DiscoverEvent，
 * 对 byebye 通知发出 WithdrawEvent；其余消息静默丢弃。
 */
class Browser {
 public:
  using Listener = std::function<void(const BrowserEvent&)>;

  explicit Browser(net::io_context& ioc, BrowserOptions options = {});
  Browser(net::io_context& ioc, std::unique_ptr<network::Transport> transport,
          BrowserOptions options = {});
  ~Browser();

  Browser(const Browser&) = delete;
  auto operator=(const Browser&) -> Browser& = delete;

  /**
   * @brief 订阅一个目标；新目标会立即单独搜索一次
   */
  void subscribe(const std::string& service);
  auto unsubscribe(const std::string& service) -> bool;

  void searchNow();

  [[nodiscard]] auto subscriptions() const -> std::set<std::string>;
  [[nodiscard]] auto destroyed() const -> bool { return destroyed_; }

  auto addListener(Listener listener) -> ListenerId;
  auto removeListener(ListenerId id) -> bool;

  // 停止定时器并释放传输层，不发送任何消息
  void destroy();

 private:
  static auto normalize(const std::string& service) -> std::string;

  void browse(const std::vector<std::string>& targets);
  void handleNotification(const protocol::Notification& notification,
                          const network::Origin& origin);
  void handleReply(const protocol::Reply& reply, const network::Origin& origin);
  [[nodiscard]] auto isSubscribed(const std::string& target) const -> bool;

  void emitErrors(const network::SendErrors& errors);

  std::unique_ptr<network::SsdpSocket> socket_;
  std::unique_ptr<network::PeriodicTimer> timer_;
  EventChannel<BrowserEvent> events_;

  mutable std::mutex mutex_;
  std::set<std::string> subscriptions_;
  std::atomic<bool> destroyed_{false};
};

}  // namespace ssdpkit::core
