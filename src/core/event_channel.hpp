#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include "common/logging.hpp"

namespace ssdpkit::core {

using ListenerId = std::uint64_t;

/**
 * @brief 类型化的事件分发器
 *
 * emit() 先在锁内拷贝监听者列表，再在锁外逐个调用，因此监听者可以在
 * 回调中注册/注销监听者或调用所属对象的公共方法。
 * 单个监听者抛出的 std::exception 会被记录，不影响其余监听者。
 */
template <typename Event>
class EventChannel {
 public:
  using Listener = std::function<void(const Event&)>;

  auto connect(Listener listener) -> ListenerId {
    std::lock_guard lock(mutex_);
    const ListenerId id = next_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
  }

  auto disconnect(ListenerId id) -> bool {
    std::lock_guard lock(mutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
      if (it->first == id) {
        listeners_.erase(it);
        return true;
      }
    }
    return false;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    listeners_.clear();
  }

  void emit(const Event& event) const {
    std::vector<std::pair<ListenerId, Listener>> snapshot;
    {
      std::lock_guard lock(mutex_);
      snapshot = listeners_;
    }

    for (const auto& [id, listener] : snapshot) {
      try {
        listener(event);
      } catch (const std::exception& e) {
        LOG_ERROR << "Event listener " << id << " threw: " << e.what();
      }
    }
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return listeners_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<ListenerId, Listener>> listeners_;
  ListenerId next_id_ = 1;
};

}  // namespace ssdpkit::core
