#include <fmt/format.h>
#include <glog/logging.h>

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>

#include "common/config_manager.hpp"
#include "common/logging.hpp"
#include "core/advertiser.hpp"
#include "core/browser.hpp"

namespace net = boost::asio;

// 用于优雅地处理 Ctrl+C / SIGTERM
static std::atomic<bool> g_stop_signal(false);

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_stop_signal = true;
  }
}

namespace {

void printUsage(const char* program) {
  fmt::print(stderr,
             "Usage: {} [--config <file>] advertise <service>...\n"
             "       {} [--config <file>] browse <service>...\n",
             program, program);
}

auto describe(const ssdpkit::network::udp::endpoint& endpoint) -> std::string {
  return fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
}

void printEvent(const ssdpkit::core::AdvertiserEvent& event) {
  std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ssdpkit::core::SearchEvent>) {
          fmt::print("search  {:<40} from {}\n", e.target, describe(e.remote));
        } else {
          fmt::print("error   [{}] {}\n", ssdpkit::core::toString(e.kind),
                     e.message);
        }
      },
      event);
}

void printEvent(const ssdpkit::core::BrowserEvent& event) {
  std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ssdpkit::core::DiscoverEvent>) {
          const auto usn = std::visit(
              [](const auto& message) {
                return message.getHeader("USN").value_or("-");
              },
              e.payload);
          fmt::print("discover {:<40} {} from {}\n", e.service, usn,
                     describe(e.remote));
        } else if constexpr (std::is_same_v<T, ssdpkit::core::WithdrawEvent>) {
          fmt::print("withdraw {:<40} {} from {}\n", e.service,
                     e.payload.getHeader("USN").value_or("-"),
                     describe(e.remote));
        } else {
          fmt::print("error    [{}] {}\n", ssdpkit::core::toString(e.kind),
                     e.message);
        }
      },
      event);
}

void waitForStopSignal() {
  while (!g_stop_signal) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  google::InitGoogleLogging(argv[0]);
  FLAGS_logtostderr = true;

  std::string config_file;
  std::string mode;
  std::vector<std::string> services;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_file = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      printUsage(argv[0]);
      return 0;
    } else if (mode.empty()) {
      mode = arg;
    } else {
      services.push_back(arg);
    }
  }

  if (mode != "advertise" && mode != "browse") {
    printUsage(argv[0]);
    return 2;
  }

  auto& config = ssdpkit::common::ConfigManager::getInstance();
  if (!config_file.empty()) {
    auto loaded = config.loadFromFile(config_file);
    if (!loaded) {
      LOG(ERROR) << loaded.error().message;
      return 1;
    }
  }
  if (!config.validateConfig()) {
    LOG(ERROR) << "Invalid configuration, refusing to start";
    return 1;
  }

  ssdpkit::logging::Logger::InitFromConfigManager(argv[0]);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  net::io_context ioc;
  auto work = net::make_work_guard(ioc);

  std::unique_ptr<ssdpkit::core::Advertiser> advertiser;
  std::unique_ptr<ssdpkit::core::Browser> browser;

  try {
    if (mode == "advertise") {
      auto options = ssdpkit::core::AdvertiserOptions::fromConfig(config);
      for (const auto& service : services) {
        options.services.emplace(service, ssdpkit::protocol::HeaderSet{});
      }
      advertiser = std::make_unique<ssdpkit::core::Advertiser>(ioc, options);
      advertiser->addListener(
          [](const ssdpkit::core::AdvertiserEvent& event) { printEvent(event); });
      LOG(INFO) << "Advertising as uuid:" << advertiser->uuid() << " with "
                << advertiser->services().size() << " service(s)";
    } else {
      auto options = ssdpkit::core::BrowserOptions::fromConfig(config);
      options.services.insert(options.services.end(), services.begin(),
                              services.end());
      if (options.services.empty()) {
        options.services.emplace_back(ssdpkit::constants::kTargetAll);
      }
      browser = std::make_unique<ssdpkit::core::Browser>(ioc, options);
      browser->addListener(
          [](const ssdpkit::core::BrowserEvent& event) { printEvent(event); });
      LOG(INFO) << "Browsing for " << browser->subscriptions().size()
                << " target(s)";
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to start " << mode << ": " << e.what();
    ssdpkit::logging::Logger::shutdown();
    return 1;
  }

  std::thread io_thread([&ioc] { ioc.run(); });

  LOG(INFO) << "ssdpkit daemon running. Press Ctrl+C to exit.";
  waitForStopSignal();
  LOG(INFO) << "Caught stop signal, shutting down...";

  if (advertiser) advertiser->destroy();
  if (browser) browser->destroy();

  work.reset();
  io_thread.join();

  advertiser.reset();
  browser.reset();

  LOG(INFO) << "Shutdown complete.";
  ssdpkit::logging::Logger::shutdown();
  google::ShutdownGoogleLogging();
  return 0;
}
