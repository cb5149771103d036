#pragma once

/**
 * @file error_context.hpp
 * @brief 网络错误的上下文记录
 */

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>

#include "common/logging.hpp"

namespace ssdpkit::network {

/**
 * @brief 网络操作的上下文信息
 */
struct NetworkContext {
  std::string operation;  // 操作类型 (e.g., "send", "receive")
  std::string endpoint;   // 对端 "地址:端口"
  std::chrono::steady_clock::time_point start_time;
  size_t bytes_transferred = 0;

  NetworkContext(std::string op, std::string ep)
      : operation(std::move(op)),
        endpoint(std::move(ep)),
        start_time(std::chrono::steady_clock::now()) {}
};

class ErrorHelper {
 public:
  /**
   * @brief 判断是否是暂时性错误（接口未就绪、缓冲区满等）
   */
  static bool isTransientError(const boost::system::error_code& ec) {
    return ec == boost::asio::error::would_block ||
           ec == boost::asio::error::try_again ||
           ec == boost::asio::error::no_buffer_space ||
           ec == boost::asio::error::network_unreachable ||
           ec == boost::asio::error::host_unreachable;
  }

  /**
   * @brief 判断是否是主动关闭导致的错误
   */
  static bool isShutdown(const boost::system::error_code& ec) {
    return ec == boost::asio::error::operation_aborted ||
           ec == boost::asio::error::bad_descriptor;
  }
};

class ErrorLogger {
 public:
  static void logNetworkError(const NetworkContext& ctx,
                              const boost::system::error_code& ec,
                              const std::string& additional_info = "") {
    const auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - ctx.start_time);

    LOG_MODULE("transport", ErrorHelper::isTransientError(ec)
                                ? logging::LogLevel::WARNING
                                : logging::LogLevel::ERROR)
        << "Network error in " << ctx.operation
        << " operation - Endpoint: " << ctx.endpoint
        << ", Duration: " << duration_ms.count() << "ms"
        << ", Bytes: " << ctx.bytes_transferred << ", Error: " << ec.message()
        << (additional_info.empty() ? "" : ", Info: " + additional_info);
  }
};

}  // namespace ssdpkit::network
