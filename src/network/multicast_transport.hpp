#pragma once

#include <memory>
#include <string>

#include "network/transport.hpp"

namespace ssdpkit::network {

/**
 * @brief 基于 Boost.Asio 的 UDP 组播传输
 *
 * 绑定到 0.0.0.0:<port>（reuse_address），加入组播组，设置 TTL 与回环。
 * 接收循环运行在调用方提供的 io_context 上；发送为同步 send_to，
 * 失败以 SendError 返回而不抛出。
 *
 * 打开或绑定套接字失败时构造函数抛出 boost::system::system_error；
 * 加入组播组失败只记录警告，单播收发仍然可用。
 */
class MulticastTransport : public Transport {
 public:
  MulticastTransport(net::io_context& ioc, const TransportOptions& options);
  ~MulticastTransport() override;

  MulticastTransport(const MulticastTransport&) = delete;
  auto operator=(const MulticastTransport&) -> MulticastTransport& = delete;

  void setReceiveHandler(ReceiveHandler handler) override;
  auto send(const std::string& payload, const Destination& destination = {})
      -> SendErrors override;
  [[nodiscard]] auto groupAddress() const -> std::string override;
  void destroy() override;

  [[nodiscard]] auto localEndpoint() const -> udp::endpoint;

 private:
  class Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace ssdpkit::network
