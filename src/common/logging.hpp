#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// 避免与日志等级枚举冲突
#ifdef ERROR
#undef ERROR
#endif
#ifdef DEBUG
#undef DEBUG
#endif

namespace ssdpkit::logging {

enum class LogLevel : std::uint8_t {
  TRACE = 0,
  DEBUG,
  INFO,
  WARNING,
  ERROR,
  FATAL
};

/**
 * @brief 日志条目
 */
struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level = LogLevel::INFO;
  std::string file;
  int line = 0;
  std::string function;
  std::thread::id thread_id;
  std::string module;
  std::string message;
};

/**
 * @brief 日志配置
 */
struct LogConfig {
  LogLevel global_level = LogLevel::INFO;
  bool file_enabled = false;
  bool console_enabled = true;

  // 文件输出
  std::string log_directory = "./logs";
  std::string filename_pattern = "{program}.log";
  size_t max_file_size_mb = 10;
  size_t max_files = 5;
  bool auto_flush = true;

  // 控制台输出
  bool console_colored = true;
  LogLevel console_min_level = LogLevel::INFO;

  std::string format_pattern =
      "[{timestamp}] [{level}] {module}[{location}] {message}";

  // 模块级别，例如 {"codec": DEBUG}
  std::map<std::string, LogLevel> module_levels;

  // 从 ConfigManager 的 logging.* 读取
  static LogConfig loadFromConfigManager();

  void applyEnvironmentOverrides();

  static LogLevel parseLogLevel(const std::string& level_str);
};

const char* toString(LogLevel level);

enum class LogOutputType : std::uint8_t { FILE, CONSOLE, MEMORY_BUFFER };

/**
 * @brief 日志输出流接口
 */
class LogOutputStream {
 public:
  virtual ~LogOutputStream() = default;
  virtual void write(const LogEntry& entry, const std::string& formatted) = 0;
  virtual void flush() = 0;
  virtual LogOutputType getType() const = 0;
  virtual bool accepts(LogLevel /*level*/) const { return true; }
};

/**
 * @brief 基于占位符模式的格式化器
 *
 * 支持 {timestamp} {level} {location} {function} {thread} {module}
 * {message}，未知占位符原样输出。
 */
class LogFormatter {
 public:
  explicit LogFormatter(std::string pattern);
  std::string format(const LogEntry& entry) const;

 private:
  using Piece = std::function<std::string(const LogEntry&)>;

  std::string pattern_;
  std::vector<Piece> pieces_;

  void compile();
};

/**
 * @brief 全局/模块等级过滤
 */
class LevelFilter {
 public:
  void setGlobalLevel(LogLevel level);
  void setModuleLevel(const std::string& module, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& module) const;
  bool shouldLog(LogLevel level, const std::string& module) const {
    return level >= getEffectiveLevel(module);
  }

 private:
  LogLevel global_level_ = LogLevel::INFO;
  std::map<std::string, LogLevel> module_levels_;
  mutable std::shared_mutex mutex_;
};

/**
 * @brief 按大小轮转的文件输出
 */
class FileLogStream : public LogOutputStream {
 public:
  FileLogStream(const std::string& directory,
                const std::string& filename_pattern,
                const std::string& program_name, size_t max_size_mb,
                size_t max_files, bool auto_flush);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  LogOutputType getType() const override { return LogOutputType::FILE; }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  size_t max_bytes_;
  size_t max_files_;
  bool auto_flush_;

  std::ofstream file_;
  size_t written_ = 0;
  std::mutex mutex_;

  void rotate();
};

/**
 * @brief 输出到 stderr，可选 ANSI 颜色
 */
class ConsoleLogStream : public LogOutputStream {
 public:
  explicit ConsoleLogStream(bool colored = true,
                            LogLevel min_level = LogLevel::INFO);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override;
  LogOutputType getType() const override { return LogOutputType::CONSOLE; }
  bool accepts(LogLevel level) const override { return level >= min_level_; }

 private:
  bool colored_;
  LogLevel min_level_;
  std::mutex mutex_;
};

/**
 * @brief 内存缓冲输出（用于测试）
 */
class MemoryLogStream : public LogOutputStream {
 public:
  explicit MemoryLogStream(size_t max_entries = 1000);

  void write(const LogEntry& entry, const std::string& formatted) override;
  void flush() override {}
  LogOutputType getType() const override {
    return LogOutputType::MEMORY_BUFFER;
  }

  std::vector<std::string> getEntries() const;
  void clear();

 private:
  size_t max_entries_;
  std::vector<std::string> entries_;
  mutable std::mutex mutex_;
};

/**
 * @brief 进程级日志器（单例）
 */
class Logger {
 public:
  static void Init(const std::string& program_name, const LogConfig& config);
  static void InitFromConfigManager(const std::string& program_name);

  static void addOutputStream(std::unique_ptr<LogOutputStream> stream);
  static void removeOutputStream(LogOutputType type);

  static void setGlobalLevel(LogLevel level);
  static void setModuleLevel(const std::string& module, LogLevel level);
  static LogLevel getEffectiveLevel(const std::string& module = "");

  static void flush();
  static void shutdown();

  static bool shouldLog(LogLevel level, const std::string& module = "");
  static void log(LogLevel level, const char* file, int line,
                  const char* function, const std::string& message,
                  const std::string& module = "");

  // 流式日志：析构时提交
  class LogStream {
   public:
    LogStream(const char* file, int line, const char* function, LogLevel level,
              std::string module = "");
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& val) {
      if (enabled_) {
        buffer_ << val;
      }
      return *this;
    }

   private:
    std::ostringstream buffer_;
    const char* file_;
    int line_;
    const char* function_;
    LogLevel level_;
    std::string module_;
    bool enabled_;
  };

 private:
  Logger() = default;
  ~Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  static Logger& instance();

  std::string program_name_;
  LevelFilter filter_;
  std::unique_ptr<LogFormatter> formatter_;
  std::vector<std::unique_ptr<LogOutputStream>> streams_;
  std::atomic<bool> initialized_{false};
  mutable std::mutex mutex_;
};

#define LOG_TRACE                                                          \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::TRACE)
#define LOG_DEBUG                                                          \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::DEBUG)
#define LOG_INFO                                                           \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::INFO)
#define LOG_WARNING                                                        \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::WARNING)
#define LOG_ERROR                                                          \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::ERROR)
#define LOG_FATAL                                                          \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        ::ssdpkit::logging::LogLevel::FATAL)

// 模块化日志，例如 LOG_MODULE("codec", ::ssdpkit::logging::LogLevel::DEBUG)
#define LOG_MODULE(module, level)                                          \
  ::ssdpkit::logging::Logger::LogStream(__FILE__, __LINE__, __FUNCTION__, \
                                        level, module)

}  // namespace ssdpkit::logging
