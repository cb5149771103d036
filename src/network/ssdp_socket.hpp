#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "common/constants.hpp"
#include "network/transport.hpp"
#include "protocol/message.hpp"

namespace ssdpkit::network {

/**
 * @brief 入站消息的来源信息
 */
struct Origin {
  udp::endpoint local;
  udp::endpoint remote;
  bool from_self = false;
};

/**
 * @brief 传输层之上的 SSDP 收发
 *
 * 入站：按起始行解码数据报并分派到对应处理函数；解码失败交给 on_error。
 * 只有 MAN 为 "ssdp:discover" 且带 ST 的搜索才会交给 on_search。
 *
 * 出站：构造消息、编码并发送，返回每个目的地的发送错误。
 */
class SsdpSocket {
 public:
  struct Handlers {
    std::function<void(const protocol::Search&, const Origin&)> on_search;
    std::function<void(const protocol::Notification&, const Origin&)>
        on_notification;
    std::function<void(const protocol::Reply&, const Origin&)> on_reply;
    std::function<void(const protocol::DecodeError&)> on_error;
  };

  explicit SsdpSocket(std::unique_ptr<Transport> transport);
  ~SsdpSocket();

  SsdpSocket(const SsdpSocket&) = delete;
  auto operator=(const SsdpSocket&) -> SsdpSocket& = delete;

  void setHandlers(Handlers handlers);

  /**
   * @brief 发送 M-SEARCH
   *
   * 设置 MAN、HOST、ST、MX；未给出 EXT 时补一个空 EXT。
   *
   * @param wait MX 秒数，必须在 1-5 之间，否则抛出 std::invalid_argument
   */
  auto search(const std::string& target,
              int wait = constants::kDefaultSearchWaitSeconds,
              const protocol::HeaderSet& headers = {}) -> SendErrors;

  // ssdp:alive / ssdp:update / ssdp:byebye 通知，发往组播组
  auto notify(const std::string& target,
              const protocol::HeaderSet& headers = {}) -> SendErrors;
  auto update(const std::string& target,
              const protocol::HeaderSet& headers = {}) -> SendErrors;
  auto bye(const std::string& target, const protocol::HeaderSet& headers = {})
      -> SendErrors;

  /**
   * @brief 以单播回复一个搜索请求，目的地为请求中记录的 host/port
   */
  auto reply(const protocol::Search& request, const protocol::Reply& response)
      -> SendErrors;

  auto send(const protocol::Message& message,
            const Destination& destination = {}) -> SendErrors;

  /**
   * @brief 停止接收并释放传输层，可重复调用
   */
  void destroy();

 private:
  void handleDatagram(const Datagram& datagram);
  auto sendNotification(const std::string& target, const char* nts,
                        const protocol::HeaderSet& headers) -> SendErrors;

  std::unique_ptr<Transport> transport_;
  std::string group_address_;

  std::mutex handlers_mutex_;
  Handlers handlers_;
  std::mutex transport_mutex_;
};

}  // namespace ssdpkit::network
