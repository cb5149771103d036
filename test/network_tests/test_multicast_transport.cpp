#include <gtest/gtest.h>

#include <array>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "network/multicast_transport.hpp"
#include "utils/network_utils.hpp"

namespace net = boost::asio;
using udp = net::ip::udp;
using namespace ssdpkit::network;
using namespace std::chrono_literals;

class MulticastTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    port_ = ssdpkit::test::get_available_udp_port();
    ASSERT_NE(port_, 0);

    TransportOptions options;
    options.port = port_;
    options.loopback = true;
    transport_ = std::make_unique<MulticastTransport>(ioc_, options);

    work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        ioc_.get_executor());
    io_thread_ = std::thread([this] { ioc_.run(); });
  }

  void TearDown() override {
    if (transport_) {
      transport_->destroy();
    }
    work_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) {
      io_thread_.join();
    }
  }

  auto waitForDatagram(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !received_.empty(); });
  }

  void installRecorder() {
    transport_->setReceiveHandler([this](const Datagram& datagram) {
      std::lock_guard lock(mutex_);
      received_.push_back(datagram);
      cv_.notify_all();
    });
  }

  net::io_context ioc_;
  std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_;
  std::thread io_thread_;
  uint16_t port_ = 0;
  std::unique_ptr<MulticastTransport> transport_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Datagram> received_;
};

TEST_F(MulticastTransportTest, GroupAddressUsesConfiguredPort) {
  EXPECT_EQ(transport_->groupAddress(),
            "239.255.255.250:" + std::to_string(port_));
  EXPECT_EQ(transport_->localEndpoint().port(), port_);
}

TEST_F(MulticastTransportTest, ReceivesUnicastDatagram) {
  installRecorder();

  net::io_context client_ioc;
  udp::socket client(client_ioc, udp::endpoint(udp::v4(), 0));
  const std::string payload = "HTTP/1.1 200 OK\r\nST: urn:test:1\r\n\r\n";
  client.send_to(net::buffer(payload),
                 udp::endpoint(net::ip::make_address_v4("127.0.0.1"), port_));

  ASSERT_TRUE(waitForDatagram(2s));
  std::lock_guard lock(mutex_);
  EXPECT_EQ(received_[0].payload, payload);
  EXPECT_EQ(received_[0].remote.port(), client.local_endpoint().port());
  EXPECT_FALSE(received_[0].from_self);
}

TEST_F(MulticastTransportTest, SendsToExplicitDestination) {
  net::io_context client_ioc;
  udp::socket client(client_ioc, udp::endpoint(udp::v4(), 0));
  const auto client_port = client.local_endpoint().port();

  const auto errors =
      transport_->send("NOTIFY * HTTP/1.1\r\n\r\n",
                       Destination{std::string("127.0.0.1"), client_port});
  ASSERT_TRUE(errors.empty()) << errors.front().message();

  std::array<char, 512> buffer{};
  udp::endpoint sender;
  client.non_blocking(true);

  std::size_t bytes = 0;
  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (std::chrono::steady_clock::now() < deadline) {
    boost::system::error_code ec;
    bytes = client.receive_from(net::buffer(buffer), sender, 0, ec);
    if (!ec) break;
    std::this_thread::sleep_for(10ms);
  }

  ASSERT_GT(bytes, 0u);
  EXPECT_EQ(std::string(buffer.data(), bytes), "NOTIFY * HTTP/1.1\r\n\r\n");
  EXPECT_EQ(sender.port(), port_);
}

TEST_F(MulticastTransportTest, InvalidDestinationAddressIsReported) {
  const auto errors =
      transport_->send("x", Destination{std::string("not-an-address"), 1900});
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].destination.find("not-an-address"), std::string::npos);
}

/**
 * @brief 来自本机同端口的数据报被标记为 from_self
 */
TEST_F(MulticastTransportTest, LoopbackTrafficIsFlaggedAsSelf) {
  installRecorder();

  const auto errors = transport_->send(
      "M-SEARCH * HTTP/1.1\r\n\r\n", Destination{std::string("127.0.0.1"), port_});
  ASSERT_TRUE(errors.empty());

  ASSERT_TRUE(waitForDatagram(2s));
  std::lock_guard lock(mutex_);
  EXPECT_TRUE(received_[0].from_self);
}

TEST_F(MulticastTransportTest, SendAfterDestroyFails) {
  transport_->destroy();
  transport_->destroy();

  const auto errors = transport_->send("x");
  ASSERT_EQ(errors.size(), 1u);
}
