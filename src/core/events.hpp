#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "network/transport.hpp"
#include "protocol/message.hpp"

namespace ssdpkit::core {

enum class ErrorKind : std::uint8_t {
  Decode,         // 入站数据报无法解码
  Send,           // 某个目的地发送失败
  UnknownTarget,  // 搜索目标既不是根设备/自身也不在服务表中
};

struct ErrorEvent {
  ErrorKind kind;
  std::string message;
  // 相关的原始载荷（解码错误时为收到的数据报）
  std::string payload;
};

/**
 * @brief Advertiser 收到并接受了一个搜索请求
 *
 * target 为请求的 ST（ssdp:all / upnp:rootdevice / uuid:<uuid> / 服务类型）。
 */
struct SearchEvent {
  std::string target;
  protocol::Search request;
  network::udp::endpoint remote;
  network::udp::endpoint local;
};

using Announcement = std::variant<protocol::Reply, protocol::Notification>;

/**
 * @brief Browser 发现了一个已订阅的服务（Reply 或 alive/update 通知）
 */
struct DiscoverEvent {
  std::string service;
  Announcement payload;
  network::udp::endpoint remote;
  network::udp::endpoint local;
};

/**
 * @brief Browser 收到了一个已订阅服务的 byebye 通知
 */
struct WithdrawEvent {
  std::string service;
  protocol::Notification payload;
  network::udp::endpoint remote;
  network::udp::endpoint local;
};

using AdvertiserEvent = std::variant<SearchEvent, ErrorEvent>;
using BrowserEvent = std::variant<DiscoverEvent, WithdrawEvent, ErrorEvent>;

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Decode:
      return "decode";
    case ErrorKind::Send:
      return "send";
    case ErrorKind::UnknownTarget:
      return "unknown-target";
  }
  return "unknown";
}

}  // namespace ssdpkit::core
