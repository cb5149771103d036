#include "protocol/message.hpp"

#include <fmt/format.h>

#include "common/constants.hpp"
#include "common/logging.hpp"
#include "common/string_utils.hpp"

namespace ssdpkit::protocol {

namespace {
constexpr const char* kCrlf = "\r\n";
}

const char* toString(MessageKind kind) {
  switch (kind) {
    case MessageKind::Search:
      return "M-SEARCH";
    case MessageKind::Notify:
      return "NOTIFY";
    case MessageKind::Reply:
      return "REPLY";
  }
  return "UNKNOWN";
}

auto DecodeError::describe() const -> std::string {
  return fmt::format("[{}] {}:\n{}", toString(kind), cause, payload);
}

//------------------------------------------------------------------------------
// Message

auto Message::isAlive() const -> bool {
  return getHeader(constants::kHeaderNts) == constants::kNtsAlive;
}

auto Message::isUpdate() const -> bool {
  return getHeader(constants::kHeaderNts) == constants::kNtsUpdate;
}

auto Message::isByeBye() const -> bool {
  return getHeader(constants::kHeaderNts) == constants::kNtsByeBye;
}

auto Message::encode() const -> std::string {
  std::string out = startLine();
  out += kCrlf;
  for (const auto& [key, value] : headers_) {
    out += key;
    out += ": ";
    out += value;
    out += kCrlf;
  }
  out += kCrlf;
  return out;
}

auto Message::decodeHeaders(std::string_view payload, MessageKind kind)
    -> DecodeResult<HeaderSet> {
  if (payload.find('\0') != std::string_view::npos) {
    LOG_MODULE("codec", logging::LogLevel::DEBUG)
        << "Rejecting binary " << toString(kind)
        << " payload: " << common::to_hex(payload.substr(0, 64));
    return tl::make_unexpected(DecodeError{
        kind, "payload is not text", std::string(payload)});
  }

  HeaderSet headers;
  const auto lines = common::split(payload, '\n');
  for (std::size_t i = 1; i < lines.size(); ++i) {
    const std::string line = common::trim(lines[i]);
    if (line.empty()) {
      continue;
    }

    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(std::string_view(line).substr(0, colon));
    if (key.empty()) {
      continue;
    }
    headers.set(key, std::string_view(line).substr(colon + 1));
  }
  return headers;
}

//------------------------------------------------------------------------------
// Search

Search::Search(std::string host, std::uint16_t port)
    : Message(Method::Search, false), host_(std::move(host)), port_(port) {}

auto Search::startLine() const -> std::string {
  return constants::kSearchStartLine;
}

auto Search::decode(std::string_view payload, std::string host,
                    std::uint16_t port) -> DecodeResult<Search> {
  auto headers = decodeHeaders(payload, MessageKind::Search);
  if (!headers) {
    return tl::make_unexpected(std::move(headers.error()));
  }
  Search message(std::move(host), port);
  message.headers_ = std::move(*headers);
  return message;
}

//------------------------------------------------------------------------------
// Notification

Notification::Notification() : Message(Method::Notify, false) {}

auto Notification::startLine() const -> std::string {
  return constants::kNotifyStartLine;
}

auto Notification::decode(std::string_view payload)
    -> DecodeResult<Notification> {
  auto headers = decodeHeaders(payload, MessageKind::Notify);
  if (!headers) {
    return tl::make_unexpected(std::move(headers.error()));
  }
  Notification message;
  message.headers_ = std::move(*headers);
  return message;
}

//------------------------------------------------------------------------------
// Reply

Reply::Reply() : Message(Method::Reply, true) {}

auto Reply::startLine() const -> std::string {
  return constants::kReplyStartLine;
}

auto Reply::decode(std::string_view payload) -> DecodeResult<Reply> {
  auto headers = decodeHeaders(payload, MessageKind::Reply);
  if (!headers) {
    return tl::make_unexpected(std::move(headers.error()));
  }
  Reply message;
  message.headers_ = std::move(*headers);
  return message;
}

//------------------------------------------------------------------------------

auto classify(std::string_view payload) -> MessageKind {
  if (common::starts_with(payload, constants::kSearchMethodPrefix)) {
    return MessageKind::Search;
  }
  if (common::starts_with(payload, constants::kNotifyMethodPrefix)) {
    return MessageKind::Notify;
  }
  return MessageKind::Reply;
}

auto decodeDatagram(std::string_view payload, const std::string& remote_host,
                    std::uint16_t remote_port) -> DecodeResult<AnyMessage> {
  switch (classify(payload)) {
    case MessageKind::Search:
      return Search::decode(payload, remote_host, remote_port)
          .map([](Search&& m) { return AnyMessage(std::move(m)); });
    case MessageKind::Notify:
      return Notification::decode(payload).map(
          [](Notification&& m) { return AnyMessage(std::move(m)); });
    case MessageKind::Reply:
      break;
  }
  return Reply::decode(payload).map(
      [](Reply&& m) { return AnyMessage(std::move(m)); });
}

}  // namespace ssdpkit::protocol
