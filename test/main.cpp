#include <gtest/gtest.h>

#include "common/logging.hpp"

auto main(int argc, char** argv) -> int {
  // 为所有测试统一初始化日志系统
  ssdpkit::logging::LogConfig config =
      ssdpkit::logging::LogConfig::loadFromConfigManager();
  config.log_directory = "./logs/tests";
  config.global_level = ssdpkit::logging::LogLevel::DEBUG;
  config.file_enabled = true;
  config.console_enabled = false;
  config.max_files = 10;
  ssdpkit::logging::Logger::Init(argv[0], config);

  testing::InitGoogleTest(&argc, argv);
  const int result = RUN_ALL_TESTS();

  ssdpkit::logging::Logger::shutdown();
  return result;
}
