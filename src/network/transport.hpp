#pragma once

#include <boost/asio.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/constants.hpp"

namespace ssdpkit::network {

namespace net = boost::asio;
using udp = net::ip::udp;

/**
 * @brief 传输层创建参数
 */
struct TransportOptions {
  std::string bind_host = constants::kDefaultBindHost;
  bool loopback = false;
  int ttl = constants::kDefaultTtl;
  std::string multicast_group = constants::kMulticastGroup;
  std::uint16_t port = constants::kMulticastPort;
};

/**
 * @brief 发送目的地，缺省部分使用组播地址/端口
 */
struct Destination {
  std::optional<std::string> address;
  std::optional<std::uint16_t> port;
};

/**
 * @brief 单个目的地的发送失败
 */
struct SendError {
  std::string destination;
  boost::system::error_code code;

  [[nodiscard]] auto message() const -> std::string {
    return "Failed to send to " + destination + ": " + code.message();
  }
};

using SendErrors = std::vector<SendError>;

/**
 * @brief 入站数据报
 */
struct Datagram {
  std::string payload;
  udp::endpoint local;
  udp::endpoint remote;
  // 数据报是否来自本进程（本层不做过滤，仅供使用者判断）
  bool from_self = false;
};

/**
 * @brief 传输层接口
 *
 * Advertiser / Browser 只依赖此接口，测试中以内存实现替换。
 */
class Transport {
 public:
  using ReceiveHandler = std::function<void(const Datagram&)>;

  virtual ~Transport() = default;

  virtual void setReceiveHandler(ReceiveHandler handler) = 0;

  /**
   * @brief 发送一个数据报，不抛异常
   * @return 每个失败目的地一条错误，全部成功时为空
   */
  virtual auto send(const std::string& payload,
                    const Destination& destination = {}) -> SendErrors = 0;

  // 组播组的 "地址:端口"，用于 HOST 头
  [[nodiscard]] virtual auto groupAddress() const -> std::string = 0;

  /**
   * @brief 释放套接字，可重复调用
   */
  virtual void destroy() = 0;
};

}  // namespace ssdpkit::network
