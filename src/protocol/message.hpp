#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <variant>

#include "protocol/header_set.hpp"

namespace ssdpkit::protocol {

enum class Method : std::uint8_t { Search, Notify, Reply };

/**
 * @brief 数据报按起始行被识别成的消息种类
 */
enum class MessageKind : std::uint8_t { Search, Notify, Reply };

const char* toString(MessageKind kind);

/**
 * @brief 解码失败：记录尝试的消息种类、原因以及原始载荷
 */
struct DecodeError {
  MessageKind kind;
  std::string cause;
  std::string payload;

  // "[NOTIFY] <cause>:\n<payload>"
  [[nodiscard]] auto describe() const -> std::string;
};

template <typename T>
using DecodeResult = tl::expected<T, DecodeError>;

/**
 * @brief SSDP 消息基类
 *
 * 三种具体消息（Search / Notification / Reply）共享头部集合与编码逻辑，
 * 差别只在起始行。NTS 相关的谓词由头部计算，不单独存储。
 */
class Message {
 public:
  virtual ~Message() = default;

  [[nodiscard]] auto method() const -> Method { return method_; }
  [[nodiscard]] auto isReply() const -> bool { return is_reply_; }

  [[nodiscard]] auto isAlive() const -> bool;
  [[nodiscard]] auto isUpdate() const -> bool;
  [[nodiscard]] auto isByeBye() const -> bool;

  void setHeader(std::string_view key, std::string_view value) {
    headers_.set(key, value);
  }
  void setHeader(std::string_view key, long long value) {
    headers_.set(key, value);
  }
  void setHeaders(const HeaderSet& headers) { headers_.merge(headers); }
  [[nodiscard]] auto getHeader(std::string_view key) const
      -> std::optional<std::string> {
    return headers_.get(key);
  }
  [[nodiscard]] auto hasHeader(std::string_view key) const -> bool {
    return headers_.has(key);
  }
  auto deleteHeader(std::string_view key) -> bool { return headers_.erase(key); }
  void clearHeaders() { headers_.clear(); }
  [[nodiscard]] auto headers() const -> const HeaderSet& { return headers_; }

  /**
   * @brief 序列化为线上格式
   *
   * 起始行、按键排序的 "KEY: value" 行、空行，以 CRLF 连接。
   */
  [[nodiscard]] auto encode() const -> std::string;

 protected:
  Message(Method method, bool is_reply) : method_(method), is_reply_(is_reply) {}
  Message(const Message&) = default;
  Message(Message&&) = default;
  auto operator=(const Message&) -> Message& = default;
  auto operator=(Message&&) -> Message& = default;

  [[nodiscard]] virtual auto startLine() const -> std::string = 0;

  /**
   * @brief 解析头部：丢弃首行，逐行 trim，跳过空行，按第一个冒号切分
   *
   * 不校验必需头部。载荷中含 NUL 字节时视为非文本，返回 DecodeError。
   */
  static auto decodeHeaders(std::string_view payload, MessageKind kind)
      -> DecodeResult<HeaderSet>;

  HeaderSet headers_;

 private:
  Method method_;
  bool is_reply_;
};

/**
 * @brief M-SEARCH 请求
 *
 * host/port 为该搜索的对端地址，回复时以单播发往此处。
 */
class Search : public Message {
 public:
  Search(std::string host, std::uint16_t port);

  [[nodiscard]] auto host() const -> const std::string& { return host_; }
  [[nodiscard]] auto port() const -> std::uint16_t { return port_; }

  static auto decode(std::string_view payload, std::string host,
                     std::uint16_t port) -> DecodeResult<Search>;

 protected:
  [[nodiscard]] auto startLine() const -> std::string override;

 private:
  std::string host_;
  std::uint16_t port_;
};

class Notification : public Message {
 public:
  Notification();

  static auto decode(std::string_view payload) -> DecodeResult<Notification>;

 protected:
  [[nodiscard]] auto startLine() const -> std::string override;
};

class Reply : public Message {
 public:
  Reply();

  static auto decode(std::string_view payload) -> DecodeResult<Reply>;

 protected:
  [[nodiscard]] auto startLine() const -> std::string override;
};

using AnyMessage = std::variant<Search, Notification, Reply>;

/**
 * @brief 按起始行分派：M-SEARCH -> Search，NOTIFY -> Notification，
 *        其余一律视为 Reply
 */
auto classify(std::string_view payload) -> MessageKind;

/**
 * @brief 解码一个入站数据报
 *
 * @param remote_host 发送方地址，作为 Search 的回复目的地
 * @param remote_port 发送方端口
 */
auto decodeDatagram(std::string_view payload, const std::string& remote_host,
                    std::uint16_t remote_port) -> DecodeResult<AnyMessage>;

}  // namespace ssdpkit::protocol
