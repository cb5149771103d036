#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <tl/expected.hpp>

namespace ssdpkit::common {

/**
 * @brief 配置错误类型
 */
struct ConfigError {
  std::string message;

  explicit ConfigError(std::string msg) : message(std::move(msg)) {}
};

/**
 * @brief 配置结果类型
 */
template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

/**
 * @brief 配置管理器
 *
 * 基于 nlohmann/json 的进程级配置，键使用点分路径（如 "ssdp.ttl"）。
 * 读取结果以 tl::expected 返回，调用方决定是否回退到默认值。
 *
 * 支持的环境变量覆盖：
 * - SSDPKIT_BIND_HOST -> ssdp.bind_host
 * - SSDPKIT_LOOPBACK  -> ssdp.loopback
 * - SSDPKIT_TTL       -> ssdp.ttl
 */
class ConfigManager {
 public:
  static ConfigManager& getInstance();

  // 加载配置
  ConfigResult<void> loadFromFile(const std::string& filename);
  ConfigResult<void> loadFromJson(const nlohmann::json& json);

  ConfigResult<std::string> getString(const std::string& key) const;
  ConfigResult<int> getInt(const std::string& key) const;
  ConfigResult<bool> getBool(const std::string& key) const;
  ConfigResult<double> getDouble(const std::string& key) const;
  ConfigResult<nlohmann::json> getJson(const std::string& key) const;

  // 获取配置值，不存在或类型不符时返回默认值
  template <typename T>
  T getWithDefault(const std::string& key, const T& default_value) const;

  /**
   * @brief 组播 TTL，范围 1-255，非法时使用 constants::kDefaultTtl
   */
  int getTtl() const;

  /**
   * @brief 读取毫秒间隔，非正数时使用默认值
   */
  std::chrono::milliseconds getInterval(
      const std::string& key, std::chrono::milliseconds default_value) const;

  template <typename T>
  void set(const std::string& key, const T& value);

  bool hasKey(const std::string& key) const;

  ConfigResult<void> saveToFile(const std::string& filename) const;

  nlohmann::json getConfig() const;

  bool validateConfig() const;

  // 清空所有配置（测试用）
  void reset();

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  mutable std::shared_mutex mutex_;
  nlohmann::json config_ = nlohmann::json::object();

  // 以下方法假设调用者已持有锁
  ConfigResult<nlohmann::json> lookupNoLock(const std::string& key) const;
  void setNoLock(const std::string& key, nlohmann::json value);
  void loadEnvironmentVariables();
};

template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value);
template <>
void ConfigManager::set<int>(const std::string& key, const int& value);
template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value);
template <>
void ConfigManager::set<double>(const std::string& key, const double& value);
template <>
void ConfigManager::set<nlohmann::json>(const std::string& key,
                                        const nlohmann::json& value);

template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const;
template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const;
template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const;
template <>
double ConfigManager::getWithDefault<double>(const std::string& key,
                                             const double& default_value) const;

}  // namespace ssdpkit::common
