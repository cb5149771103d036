#include <gtest/gtest.h>

#include <boost/asio/error.hpp>

#include "network/error_context.hpp"
#include "network/transport.hpp"

using namespace ssdpkit::network;

class ErrorContextTest : public testing::Test {};

TEST_F(ErrorContextTest, NetworkContextCreation) {
  const NetworkContext ctx("send", "239.255.255.250:1900");

  EXPECT_EQ(ctx.operation, "send");
  EXPECT_EQ(ctx.endpoint, "239.255.255.250:1900");
  EXPECT_EQ(ctx.bytes_transferred, 0u);
  EXPECT_GE(std::chrono::steady_clock::now(), ctx.start_time);
}

TEST_F(ErrorContextTest, ErrorHelperTransientErrors) {
  EXPECT_TRUE(ErrorHelper::isTransientError(boost::asio::error::would_block));
  EXPECT_TRUE(ErrorHelper::isTransientError(boost::asio::error::no_buffer_space));
  EXPECT_TRUE(
      ErrorHelper::isTransientError(boost::asio::error::network_unreachable));
  EXPECT_TRUE(ErrorHelper::isTransientError(boost::asio::error::host_unreachable));

  EXPECT_FALSE(ErrorHelper::isTransientError(boost::asio::error::access_denied));
  EXPECT_FALSE(
      ErrorHelper::isTransientError(boost::asio::error::operation_aborted));
}

TEST_F(ErrorContextTest, ErrorHelperShutdown) {
  EXPECT_TRUE(ErrorHelper::isShutdown(boost::asio::error::operation_aborted));
  EXPECT_TRUE(ErrorHelper::isShutdown(boost::asio::error::bad_descriptor));
  EXPECT_FALSE(ErrorHelper::isShutdown(boost::asio::error::connection_refused));
}

TEST_F(ErrorContextTest, LogNetworkErrorDoesNotThrow) {
  NetworkContext ctx("receive", "192.168.1.50:50000");
  ctx.bytes_transferred = 128;

  EXPECT_NO_THROW(ErrorLogger::logNetworkError(
      ctx, boost::asio::error::network_unreachable));
  EXPECT_NO_THROW(ErrorLogger::logNetworkError(
      ctx, boost::asio::error::access_denied, "while replying"));
}

TEST_F(ErrorContextTest, SendErrorMessage) {
  const SendError error{"10.0.0.1:1900", boost::asio::error::host_unreachable};
  const auto message = error.message();
  EXPECT_NE(message.find("10.0.0.1:1900"), std::string::npos);
  EXPECT_EQ(message.rfind("Failed to send to ", 0), 0u);
}
