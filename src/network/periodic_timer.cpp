#include "network/periodic_timer.hpp"

#include <atomic>
#include <mutex>

#include "common/logging.hpp"

namespace ssdpkit::network {

class PeriodicTimer::State : public std::enable_shared_from_this<State> {
 public:
  State(net::io_context& ioc, std::chrono::milliseconds interval,
        Callback callback)
      : strand_(net::make_strand(ioc)),
        timer_(strand_),
        interval_(interval),
        callback_(std::move(callback)) {}

  void start() {
    if (started_.exchange(true)) {
      return;
    }
    net::post(strand_, [self = shared_from_this()] { self->fire(); });
  }

  void stop() {
    stopped_ = true;
    {
      // 等待其他线程上正在执行的回调结束
      std::lock_guard lock(callback_mutex_);
    }
    net::post(strand_, [self = shared_from_this()] { self->timer_.cancel(); });
  }

  auto running() const -> bool { return started_ && !stopped_; }
  auto interval() const -> std::chrono::milliseconds { return interval_; }

 private:
  void fire() {
    if (stopped_) return;

    {
      std::lock_guard lock(callback_mutex_);
      if (stopped_) return;
      try {
        callback_();
      } catch (const std::exception& e) {
        LOG_ERROR << "Periodic timer callback threw: " << e.what();
      }
    }

    schedule();
  }

  void schedule() {
    if (stopped_) return;

    timer_.expires_after(interval_);
    timer_.async_wait(
        [self = shared_from_this()](const boost::system::error_code& ec) {
          if (ec == net::error::operation_aborted) {
            return;
          }
          self->fire();
        });
  }

  net::strand<net::io_context::executor_type> strand_;
  net::steady_timer timer_;
  std::chrono::milliseconds interval_;
  Callback callback_;
  std::recursive_mutex callback_mutex_;
  std::atomic<bool> started_{false};
  std::atomic<bool> stopped_{false};
};

PeriodicTimer::PeriodicTimer(net::io_context& ioc,
                             std::chrono::milliseconds interval,
                             Callback callback)
    : state_(std::make_shared<State>(ioc, interval, std::move(callback))) {}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start() { state_->start(); }

void PeriodicTimer::stop() { state_->stop(); }

auto PeriodicTimer::running() const -> bool { return state_->running(); }

auto PeriodicTimer::interval() const -> std::chrono::milliseconds {
  return state_->interval();
}

}  // namespace ssdpkit::network
