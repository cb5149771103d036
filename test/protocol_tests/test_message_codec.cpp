#include <gtest/gtest.h>

#include <string>

#include "protocol/message.hpp"

using namespace ssdpkit::protocol;

namespace {

auto makeNotification() -> Notification {
  Notification message;
  message.setHeader("usn", "uuid:U::urn:test:1");
  message.setHeader("NT", "urn:test:1");
  message.setHeader("Nts", "ssdp:alive");
  message.setHeader("host", "239.255.255.250:1900");
  return message;
}

}  // namespace

class MessageCodecTest : public testing::Test {};

TEST_F(MessageCodecTest, EncodeSortsHeadersAndEndsWithBlankLine) {
  const auto encoded = makeNotification().encode();

  EXPECT_EQ(encoded,
            "NOTIFY * HTTP/1.1\r\n"
            "HOST: 239.255.255.250:1900\r\n"
            "NT: urn:test:1\r\n"
            "NTS: ssdp:alive\r\n"
            "USN: uuid:U::urn:test:1\r\n"
            "\r\n");
}

TEST_F(MessageCodecTest, EncodeIsDeterministic) {
  Notification a;
  a.setHeader("B", "2");
  a.setHeader("A", "1");

  Notification b;
  b.setHeader("a", "1");
  b.setHeader("b", "2");

  EXPECT_EQ(a.encode(), a.encode());
  EXPECT_EQ(a.encode(), b.encode());
}

TEST_F(MessageCodecTest, StartLinesPerKind) {
  EXPECT_EQ(Search("239.255.255.250", 1900).encode(),
            "M-SEARCH * HTTP/1.1\r\n\r\n");
  EXPECT_EQ(Notification().encode(), "NOTIFY * HTTP/1.1\r\n\r\n");
  EXPECT_EQ(Reply().encode(), "HTTP/1.1 200 OK\r\n\r\n");
}

TEST_F(MessageCodecTest, HeaderRoundTrip) {
  Reply original;
  original.setHeader("st", "urn:schemas-upnp-org:service:ContentDirectory:1");
  original.setHeader("Location", "http://192.168.1.10:8200/rootDesc.xml");
  original.setHeader("EXT", "");
  original.setHeader("CACHE-CONTROL", "max-age=1800");

  auto decoded = Reply::decode(original.encode());
  ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
  EXPECT_EQ(decoded->headers(), original.headers());
  EXPECT_TRUE(decoded->isReply());
}

/**
 * @brief 解码：丢弃首行、跳过空行、按第一个冒号切分、键大写
 */
TEST_F(MessageCodecTest, DecodeNormalizesLines) {
  const std::string payload =
      "NOTIFY * HTTP/1.1\r\n"
      "  location :  http://10.0.0.2:80/desc.xml  \r\n"
      "\r\n"
      "nt:urn:test:1\n"
      "garbage line without separator\r\n"
      ": empty key\r\n"
      "NTS: ssdp:alive\r\n"
      "nts: ssdp:byebye\r\n"
      "\r\n";

  auto decoded = Notification::decode(payload);
  ASSERT_TRUE(decoded.has_value());

  const auto& headers = decoded->headers();
  EXPECT_EQ(headers.size(), 3u);
  EXPECT_EQ(headers.get("LOCATION"), "http://10.0.0.2:80/desc.xml");
  EXPECT_EQ(headers.get("NT"), "urn:test:1");
  EXPECT_EQ(headers.get("NTS"), "ssdp:byebye");
  EXPECT_TRUE(decoded->isByeBye());
}

TEST_F(MessageCodecTest, DecodeDoesNotRequireHeaders) {
  auto decoded = Search::decode("M-SEARCH * HTTP/1.1\r\n\r\n", "10.0.0.3", 1234);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_TRUE(decoded->headers().empty());
  EXPECT_EQ(decoded->host(), "10.0.0.3");
  EXPECT_EQ(decoded->port(), 1234);
}

TEST_F(MessageCodecTest, NtsPredicates) {
  Notification message;
  EXPECT_FALSE(message.isAlive());
  EXPECT_FALSE(message.isUpdate());
  EXPECT_FALSE(message.isByeBye());

  message.setHeader("NTS", "ssdp:alive");
  EXPECT_TRUE(message.isAlive());

  message.setHeader("NTS", "ssdp:update");
  EXPECT_TRUE(message.isUpdate());
  EXPECT_FALSE(message.isAlive());

  message.setHeader("NTS", "ssdp:byebye");
  EXPECT_TRUE(message.isByeBye());
}

TEST_F(MessageCodecTest, HeaderMutators) {
  Notification message = makeNotification();

  EXPECT_TRUE(message.hasHeader("usn"));
  EXPECT_TRUE(message.deleteHeader("USN"));
  EXPECT_FALSE(message.deleteHeader("USN"));
  EXPECT_FALSE(message.getHeader("USN").has_value());

  message.setHeaders(HeaderSet{{"server", "test/1.0"}, {"NT", "urn:test:2"}});
  EXPECT_EQ(message.getHeader("SERVER"), "test/1.0");
  EXPECT_EQ(message.getHeader("NT"), "urn:test:2");

  message.clearHeaders();
  EXPECT_TRUE(message.headers().empty());
}

TEST_F(MessageCodecTest, ClassifyByStartLine) {
  EXPECT_EQ(classify("M-SEARCH * HTTP/1.1\r\n"), MessageKind::Search);
  EXPECT_EQ(classify("NOTIFY * HTTP/1.1\r\n"), MessageKind::Notify);
  EXPECT_EQ(classify("HTTP/1.1 200 OK\r\n"), MessageKind::Reply);
  EXPECT_EQ(classify("something else entirely"), MessageKind::Reply);
  EXPECT_EQ(classify(""), MessageKind::Reply);
}

TEST_F(MessageCodecTest, DecodeDatagramDispatches) {
  auto search = decodeDatagram(
      "M-SEARCH * HTTP/1.1\r\nMAN: \"ssdp:discover\"\r\nST: ssdp:all\r\n\r\n",
      "192.168.1.20", 40000);
  ASSERT_TRUE(search.has_value());
  ASSERT_TRUE(std::holds_alternative<Search>(*search));
  EXPECT_EQ(std::get<Search>(*search).host(), "192.168.1.20");
  EXPECT_EQ(std::get<Search>(*search).port(), 40000);
  EXPECT_EQ(std::get<Search>(*search).getHeader("MAN"), "\"ssdp:discover\"");

  auto notify = decodeDatagram(makeNotification().encode(), "192.168.1.20", 1900);
  ASSERT_TRUE(notify.has_value());
  EXPECT_TRUE(std::holds_alternative<Notification>(*notify));

  auto reply = decodeDatagram("HTTP/1.1 200 OK\r\nST: urn:test:1\r\n\r\n",
                              "192.168.1.20", 1900);
  ASSERT_TRUE(reply.has_value());
  EXPECT_TRUE(std::holds_alternative<Reply>(*reply));
}

TEST_F(MessageCodecTest, BinaryPayloadIsRejected) {
  std::string payload = "NOTIFY * HTTP/1.1\r\nNT: a";
  payload.push_back('\0');
  payload += "b\r\n\r\n";

  auto result = decodeDatagram(payload, "192.168.1.20", 1900);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, MessageKind::Notify);
  EXPECT_EQ(result.error().payload, payload);

  const auto text = result.error().describe();
  EXPECT_EQ(text.rfind("[NOTIFY] ", 0), 0u);
  EXPECT_NE(text.find(":\n"), std::string::npos);
}

TEST_F(MessageCodecTest, KindNames) {
  EXPECT_STREQ(toString(MessageKind::Search), "M-SEARCH");
  EXPECT_STREQ(toString(MessageKind::Notify), "NOTIFY");
  EXPECT_STREQ(toString(MessageKind::Reply), "REPLY");
}
