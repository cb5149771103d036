#pragma once

#include <boost/asio/error.hpp>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "network/transport.hpp"
#include "protocol/message.hpp"

namespace ssdpkit::test {

/**
 * @brief 内存中的传输层实现
 *
 * 发送的数据报记录在共享状态中，测试在传输层被销毁后仍可检查；
 * deliver() 以同步方式把一个数据报交给已注册的接收处理函数。
 */
class FakeTransport : public network::Transport {
 public:
  struct Sent {
    std::string payload;
    network::Destination destination;

    [[nodiscard]] auto decode() const -> protocol::AnyMessage {
      auto decoded = protocol::decodeDatagram(payload, "0.0.0.0", 0);
      if (!decoded) {
        throw std::runtime_error(decoded.error().describe());
      }
      return *decoded;
    }

    [[nodiscard]] auto header(const std::string& key) const -> std::string {
      return std::visit(
          [&](const auto& message) { return message.getHeader(key).value_or(""); },
          decode());
    }

    [[nodiscard]] auto isMulticast() const -> bool {
      return !destination.address && !destination.port;
    }
  };

  struct State {
    std::mutex mutex;
    std::vector<Sent> sent;
    ReceiveHandler handler;
    bool destroyed = false;
    bool fail_sends = false;

    auto snapshot() -> std::vector<Sent> {
      std::lock_guard lock(mutex);
      return sent;
    }

    void clear() {
      std::lock_guard lock(mutex);
      sent.clear();
    }
  };

  explicit FakeTransport(std::shared_ptr<State> state)
      : state_(std::move(state)) {}
  ~FakeTransport() override { destroy(); }

  static auto create(std::shared_ptr<State>& state)
      -> std::unique_ptr<FakeTransport> {
    state = std::make_shared<State>();
    return std::make_unique<FakeTransport>(state);
  }

  void setReceiveHandler(ReceiveHandler handler) override {
    std::lock_guard lock(state_->mutex);
    state_->handler = std::move(handler);
  }

  auto send(const std::string& payload, const network::Destination& destination)
      -> network::SendErrors override {
    std::lock_guard lock(state_->mutex);
    if (state_->destroyed) {
      return {network::SendError{"closed", boost::asio::error::bad_descriptor}};
    }
    state_->sent.push_back(Sent{payload, destination});
    if (state_->fail_sends) {
      return {network::SendError{groupAddress(),
                                 boost::asio::error::network_unreachable}};
    }
    return {};
  }

  [[nodiscard]] auto groupAddress() const -> std::string override {
    return "239.255.255.250:1900";
  }

  void destroy() override {
    std::lock_guard lock(state_->mutex);
    state_->destroyed = true;
    state_->handler = nullptr;
  }

  /**
   * @brief 模拟收到一个数据报
   */
  static void deliver(State& state, const std::string& payload,
                      const std::string& remote_address = "192.168.1.50",
                      uint16_t remote_port = 50000) {
    ReceiveHandler handler;
    {
      std::lock_guard lock(state.mutex);
      handler = state.handler;
    }
    if (!handler) {
      return;
    }

    network::Datagram datagram;
    datagram.payload = payload;
    datagram.local = network::udp::endpoint(
        boost::asio::ip::make_address("192.168.1.10"), 1900);
    datagram.remote = network::udp::endpoint(
        boost::asio::ip::make_address(remote_address), remote_port);
    handler(datagram);
  }

 private:
  std::shared_ptr<State> state_;
};

}  // namespace ssdpkit::test
