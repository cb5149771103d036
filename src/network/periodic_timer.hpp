#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace ssdpkit::network {

namespace net = boost::asio;

/**
 * @brief 周期定时器：start() 后立即触发一次，之后每隔 interval 触发
 *
 * 回调在 io_context 线程上执行。stop() 可在任意线程调用，包括回调内部；
 * 返回后回调不会再被调用（若另一线程正在执行回调，stop() 会等待其结束）。
 */
class PeriodicTimer {
 public:
  using Callback = std::function<void()>;

  PeriodicTimer(net::io_context& ioc, std::chrono::milliseconds interval,
                Callback callback);
  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&) = delete;
  auto operator=(const PeriodicTimer&) -> PeriodicTimer& = delete;

  void start();
  void stop();

  [[nodiscard]] auto running() const -> bool;
  [[nodiscard]] auto interval() const -> std::chrono::milliseconds;

 private:
  class State;
  std::shared_ptr<State> state_;
};

}  // namespace ssdpkit::network
