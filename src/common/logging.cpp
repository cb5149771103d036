#include "logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>

#include "common/config_manager.hpp"

namespace ssdpkit::logging {

// ======================== LogConfig ========================

LogConfig LogConfig::loadFromConfigManager() {
  const auto& config = ::ssdpkit::common::ConfigManager::getInstance();
  LogConfig log_config;

  log_config.global_level = parseLogLevel(
      config.getWithDefault<std::string>("logging.level", "INFO"));
  log_config.file_enabled =
      config.getWithDefault<bool>("logging.file_enabled", false);
  log_config.console_enabled =
      config.getWithDefault<bool>("logging.console_enabled", true);

  log_config.log_directory = config.getWithDefault<std::string>(
      "logging.file.directory", log_config.log_directory);
  log_config.filename_pattern = config.getWithDefault<std::string>(
      "logging.file.filename_pattern", log_config.filename_pattern);
  log_config.max_file_size_mb = static_cast<size_t>(
      config.getWithDefault<int>("logging.file.max_size_mb", 10));
  log_config.max_files =
      static_cast<size_t>(config.getWithDefault<int>("logging.file.max_files", 5));

  log_config.console_colored =
      config.getWithDefault<bool>("logging.console.colored", true);
  log_config.console_min_level = parseLogLevel(
      config.getWithDefault<std::string>("logging.console.min_level", "INFO"));

  log_config.format_pattern = config.getWithDefault<std::string>(
      "logging.format.pattern", log_config.format_pattern);

  if (config.hasKey("logging.module_levels")) {
    const auto document = config.getConfig();
    for (const auto& [module, level] :
         document["logging"]["module_levels"].items()) {
      if (level.is_string()) {
        log_config.module_levels[module] =
            parseLogLevel(level.get<std::string>());
      }
    }
  }

  return log_config;
}

void LogConfig::applyEnvironmentOverrides() {
  if (const char* level = std::getenv("SSDPKIT_LOG_LEVEL")) {
    global_level = parseLogLevel(level);
  }
  if (const char* dir = std::getenv("SSDPKIT_LOG_DIR")) {
    log_directory = dir;
    file_enabled = true;
  }
  if (const char* console = std::getenv("SSDPKIT_LOG_CONSOLE")) {
    const std::string value(console);
    console_enabled = (value == "true" || value == "1");
  }
}

LogLevel LogConfig::parseLogLevel(const std::string& level_str) {
  std::string upper = level_str;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "TRACE") return LogLevel::TRACE;
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (upper == "FATAL") return LogLevel::FATAL;

  return LogLevel::INFO;
}

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::TRACE:
      return "TRACE";
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARN";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::FATAL:
      return "FATAL";
  }
  return "UNKN";
}

// ======================== LogFormatter ========================

LogFormatter::LogFormatter(std::string pattern) : pattern_(std::move(pattern)) {
  compile();
}

std::string LogFormatter::format(const LogEntry& entry) const {
  std::string result;
  result.reserve(192);
  for (const auto& piece : pieces_) {
    result += piece(entry);
  }
  return result;
}

void LogFormatter::compile() {
  static const std::regex placeholder(R"(\{([a-z]+)\})");

  std::size_t cursor = 0;
  for (std::sregex_iterator it(pattern_.begin(), pattern_.end(), placeholder),
       end;
       it != end; ++it) {
    const auto& match = *it;
    const auto position = static_cast<std::size_t>(match.position());
    if (position > cursor) {
      std::string literal = pattern_.substr(cursor, position - cursor);
      pieces_.emplace_back([literal](const LogEntry&) { return literal; });
    }

    const std::string name = match[1].str();
    if (name == "timestamp") {
      pieces_.emplace_back([](const LogEntry& entry) {
        const auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            entry.timestamp.time_since_epoch()) %
                        1000;
        std::tm local_tm{};
        localtime_r(&time, &local_tm);
        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
      });
    } else if (name == "level") {
      pieces_.emplace_back(
          [](const LogEntry& entry) { return std::string(toString(entry.level)); });
    } else if (name == "location") {
      pieces_.emplace_back([](const LogEntry& entry) {
        const auto slash = entry.file.find_last_of("/\\");
        const std::string base = slash == std::string::npos
                                     ? entry.file
                                     : entry.file.substr(slash + 1);
        return base + ":" + std::to_string(entry.line);
      });
    } else if (name == "function") {
      pieces_.emplace_back([](const LogEntry& entry) { return entry.function; });
    } else if (name == "thread") {
      pieces_.emplace_back([](const LogEntry& entry) {
        std::ostringstream oss;
        oss << entry.thread_id;
        return oss.str();
      });
    } else if (name == "module") {
      pieces_.emplace_back([](const LogEntry& entry) {
        return entry.module.empty() ? std::string()
                                    : "[" + entry.module + "] ";
      });
    } else if (name == "message") {
      pieces_.emplace_back([](const LogEntry& entry) { return entry.message; });
    } else {
      std::string literal = match.str();
      pieces_.emplace_back([literal](const LogEntry&) { return literal; });
    }

    cursor = position + static_cast<std::size_t>(match.length());
  }

  if (cursor < pattern_.size()) {
    std::string literal = pattern_.substr(cursor);
    pieces_.emplace_back([literal](const LogEntry&) { return literal; });
  }
}

// ======================== LevelFilter ========================

void LevelFilter::setGlobalLevel(LogLevel level) {
  std::unique_lock lock(mutex_);
  global_level_ = level;
}

void LevelFilter::setModuleLevel(const std::string& module, LogLevel level) {
  std::unique_lock lock(mutex_);
  module_levels_[module] = level;
}

LogLevel LevelFilter::getEffectiveLevel(const std::string& module) const {
  std::shared_lock lock(mutex_);
  if (!module.empty()) {
    const auto it = module_levels_.find(module);
    if (it != module_levels_.end()) {
      return it->second;
    }
  }
  return global_level_;
}

// ======================== FileLogStream ========================

FileLogStream::FileLogStream(const std::string& directory,
                             const std::string& filename_pattern,
                             const std::string& program_name,
                             size_t max_size_mb, size_t max_files,
                             bool auto_flush)
    : max_bytes_(max_size_mb * 1024 * 1024),
      max_files_(max_files),
      auto_flush_(auto_flush) {
  std::string filename = filename_pattern;
  const auto pos = filename.find("{program}");
  if (pos != std::string::npos) {
    const auto slash = program_name.find_last_of("/\\");
    filename.replace(pos, 9,
                     slash == std::string::npos
                         ? program_name
                         : program_name.substr(slash + 1));
  }

  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  path_ = (std::filesystem::path(directory) / filename).string();

  file_.open(path_, std::ios::app);
  if (file_.is_open()) {
    file_.seekp(0, std::ios::end);
    written_ = static_cast<size_t>(file_.tellp());
  }
}

void FileLogStream::write(const LogEntry& /*entry*/,
                          const std::string& formatted) {
  std::lock_guard lock(mutex_);
  if (!file_.is_open()) {
    return;
  }

  file_ << formatted << '\n';
  written_ += formatted.size() + 1;
  if (auto_flush_) {
    file_.flush();
  }

  if (max_bytes_ > 0 && written_ > max_bytes_) {
    rotate();
  }
}

void FileLogStream::flush() {
  std::lock_guard lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
  }
}

void FileLogStream::rotate() {
  file_.close();

  std::error_code ec;
  // path.N -> path.N+1, 最老的文件被覆盖
  for (size_t i = max_files_; i > 1; --i) {
    const std::string from = path_ + "." + std::to_string(i - 1);
    const std::string to = path_ + "." + std::to_string(i);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
    }
  }
  std::filesystem::rename(path_, path_ + ".1", ec);

  file_.open(path_, std::ios::trunc);
  written_ = 0;
}

// ======================== ConsoleLogStream ========================

ConsoleLogStream::ConsoleLogStream(bool colored, LogLevel min_level)
    : colored_(colored), min_level_(min_level) {}

void ConsoleLogStream::write(const LogEntry& entry,
                             const std::string& formatted) {
  std::lock_guard lock(mutex_);
  if (!colored_) {
    std::cerr << formatted << '\n';
    return;
  }

  const char* color = "";
  switch (entry.level) {
    case LogLevel::TRACE:
      color = "\033[37m";
      break;
    case LogLevel::DEBUG:
      color = "\033[36m";
      break;
    case LogLevel::INFO:
      color = "\033[32m";
      break;
    case LogLevel::WARNING:
      color = "\033[33m";
      break;
    case LogLevel::ERROR:
      color = "\033[31m";
      break;
    case LogLevel::FATAL:
      color = "\033[35m";
      break;
  }
  std::cerr << color << formatted << "\033[0m" << '\n';
}

void ConsoleLogStream::flush() {
  std::lock_guard lock(mutex_);
  std::cerr.flush();
}

// ======================== MemoryLogStream ========================

MemoryLogStream::MemoryLogStream(size_t max_entries)
    : max_entries_(max_entries) {}

void MemoryLogStream::write(const LogEntry& /*entry*/,
                            const std::string& formatted) {
  std::lock_guard lock(mutex_);
  entries_.push_back(formatted);
  if (entries_.size() > max_entries_) {
    entries_.erase(entries_.begin());
  }
}

std::vector<std::string> MemoryLogStream::getEntries() const {
  std::lock_guard lock(mutex_);
  return entries_;
}

void MemoryLogStream::clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
}

// ======================== Logger ========================

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::Init(const std::string& program_name, const LogConfig& config) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);

  self.program_name_ = program_name;
  self.filter_.setGlobalLevel(config.global_level);
  for (const auto& [module, level] : config.module_levels) {
    self.filter_.setModuleLevel(module, level);
  }
  self.formatter_ = std::make_unique<LogFormatter>(config.format_pattern);

  self.streams_.clear();
  if (config.file_enabled) {
    self.streams_.push_back(std::make_unique<FileLogStream>(
        config.log_directory, config.filename_pattern, program_name,
        config.max_file_size_mb, config.max_files, config.auto_flush));
  }
  if (config.console_enabled) {
    self.streams_.push_back(std::make_unique<ConsoleLogStream>(
        config.console_colored, config.console_min_level));
  }

  self.initialized_ = true;
}

void Logger::InitFromConfigManager(const std::string& program_name) {
  LogConfig config = LogConfig::loadFromConfigManager();
  config.applyEnvironmentOverrides();
  Init(program_name, config);
}

void Logger::addOutputStream(std::unique_ptr<LogOutputStream> stream) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.streams_.push_back(std::move(stream));
}

void Logger::removeOutputStream(LogOutputType type) {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  self.streams_.erase(
      std::remove_if(self.streams_.begin(), self.streams_.end(),
                     [type](const auto& s) { return s->getType() == type; }),
      self.streams_.end());
}

void Logger::setGlobalLevel(LogLevel level) {
  instance().filter_.setGlobalLevel(level);
}

void Logger::setModuleLevel(const std::string& module, LogLevel level) {
  instance().filter_.setModuleLevel(module, level);
}

LogLevel Logger::getEffectiveLevel(const std::string& module) {
  return instance().filter_.getEffectiveLevel(module);
}

void Logger::flush() {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  for (auto& stream : self.streams_) {
    stream->flush();
  }
}

void Logger::shutdown() {
  auto& self = instance();
  std::lock_guard lock(self.mutex_);
  for (auto& stream : self.streams_) {
    stream->flush();
  }
  self.streams_.clear();
  self.formatter_.reset();
  self.initialized_ = false;
}

bool Logger::shouldLog(LogLevel level, const std::string& module) {
  auto& self = instance();
  if (!self.initialized_) {
    return false;
  }
  return self.filter_.shouldLog(level, module);
}

void Logger::log(LogLevel level, const char* file, int line,
                 const char* function, const std::string& message,
                 const std::string& module) {
  auto& self = instance();

  LogEntry entry;
  entry.timestamp = std::chrono::system_clock::now();
  entry.level = level;
  entry.file = file;
  entry.line = line;
  entry.function = function;
  entry.thread_id = std::this_thread::get_id();
  entry.module = module;
  entry.message = message;

  std::lock_guard lock(self.mutex_);
  if (!self.formatter_) {
    return;
  }
  const std::string formatted = self.formatter_->format(entry);
  for (auto& stream : self.streams_) {
    if (stream->accepts(level)) {
      stream->write(entry, formatted);
    }
  }
}

// ======================== LogStream ========================

Logger::LogStream::LogStream(const char* file, int line, const char* function,
                             LogLevel level, std::string module)
    : file_(file),
      line_(line),
      function_(function),
      level_(level),
      module_(std::move(module)),
      enabled_(Logger::shouldLog(level, module_)) {}

Logger::LogStream::~LogStream() {
  if (enabled_) {
    Logger::log(level_, file_, line_, function_, buffer_.str(), module_);
  }
}

}  // namespace ssdpkit::logging
