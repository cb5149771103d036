#include "config_manager.hpp"

#include <cstdlib>
#include <fstream>

#include "common/constants.hpp"
#include "common/logging.hpp"

namespace ssdpkit::common {

using json = nlohmann::json;

ConfigManager& ConfigManager::getInstance() {
  static ConfigManager instance;
  return instance;
}

ConfigResult<void> ConfigManager::loadFromFile(const std::string& filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open config file: " + filename});
  }

  try {
    json document;
    file >> document;
    if (!document.is_object()) {
      return tl::make_unexpected(
          ConfigError{"Config root must be an object: " + filename});
    }

    std::unique_lock lock(mutex_);
    config_ = std::move(document);
    loadEnvironmentVariables();
  } catch (const json::exception& e) {
    return tl::make_unexpected(ConfigError{"Failed to parse config file " +
                                           filename + ": " + e.what()});
  }

  LOG_INFO << "Loaded config from: " << filename;
  return {};
}

ConfigResult<void> ConfigManager::loadFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    return tl::make_unexpected(ConfigError{"Config root must be an object"});
  }

  std::unique_lock lock(mutex_);
  config_ = json;
  loadEnvironmentVariables();
  return {};
}

ConfigResult<nlohmann::json> ConfigManager::getJson(
    const std::string& key) const {
  std::shared_lock lock(mutex_);
  return lookupNoLock(key);
}

ConfigResult<std::string> ConfigManager::getString(
    const std::string& key) const {
  auto value = getJson(key);
  if (!value) {
    return tl::make_unexpected(value.error());
  }
  if (!value->is_string()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not a string, got " +
                                           value->type_name()});
  }
  return value->get<std::string>();
}

ConfigResult<int> ConfigManager::getInt(const std::string& key) const {
  auto value = getJson(key);
  if (!value) {
    return tl::make_unexpected(value.error());
  }
  if (!value->is_number_integer()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not an integer, got " +
                                           value->type_name()});
  }
  return value->get<int>();
}

ConfigResult<bool> ConfigManager::getBool(const std::string& key) const {
  auto value = getJson(key);
  if (!value) {
    return tl::make_unexpected(value.error());
  }
  if (!value->is_boolean()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not a boolean, got " +
                                           value->type_name()});
  }
  return value->get<bool>();
}

ConfigResult<double> ConfigManager::getDouble(const std::string& key) const {
  auto value = getJson(key);
  if (!value) {
    return tl::make_unexpected(value.error());
  }
  if (!value->is_number()) {
    return tl::make_unexpected(ConfigError{"Value at key '" + key +
                                           "' is not a number, got " +
                                           value->type_name()});
  }
  return value->get<double>();
}

bool ConfigManager::hasKey(const std::string& key) const {
  return getJson(key).has_value();
}

int ConfigManager::getTtl() const {
  const int ttl = getWithDefault<int>("ssdp.ttl", constants::kDefaultTtl);
  if (ttl < 1 || ttl > 255) {
    LOG_WARNING << "Invalid multicast TTL " << ttl
                << " in config key 'ssdp.ttl', using default "
                << constants::kDefaultTtl;
    return constants::kDefaultTtl;
  }
  return ttl;
}

std::chrono::milliseconds ConfigManager::getInterval(
    const std::string& key, std::chrono::milliseconds default_value) const {
  const int value =
      getWithDefault<int>(key, static_cast<int>(default_value.count()));
  if (value <= 0) {
    LOG_WARNING << "Invalid interval " << value << " in config key '" << key
                << "', using default " << default_value.count() << "ms";
    return default_value;
  }
  return std::chrono::milliseconds(value);
}

ConfigResult<void> ConfigManager::saveToFile(
    const std::string& filename) const {
  std::ofstream file(filename);
  if (!file.is_open()) {
    return tl::make_unexpected(
        ConfigError{"Failed to open file for writing: " + filename});
  }

  std::shared_lock lock(mutex_);
  file << config_.dump(4);
  if (!file) {
    return tl::make_unexpected(
        ConfigError{"Failed to write config to file: " + filename});
  }
  return {};
}

nlohmann::json ConfigManager::getConfig() const {
  std::shared_lock lock(mutex_);
  return config_;
}

bool ConfigManager::validateConfig() const {
  std::shared_lock lock(mutex_);
  bool is_valid = true;

  auto expect_type = [&](const std::string& key, auto predicate,
                         const char* expected) {
    auto value = lookupNoLock(key);
    if (value.has_value() && !predicate(*value)) {
      LOG_ERROR << "Invalid config key '" << key << "': expected " << expected
                << ", got " << value->type_name();
      is_valid = false;
    }
  };

  expect_type("ssdp.bind_host", [](const json& v) { return v.is_string(); },
              "string");
  expect_type("ssdp.loopback", [](const json& v) { return v.is_boolean(); },
              "boolean");
  expect_type("advertiser.uuid", [](const json& v) { return v.is_string(); },
              "string");
  expect_type("advertiser.services",
              [](const json& v) { return v.is_object(); }, "object");
  expect_type("browser.services",
              [](const json& v) { return v.is_string() || v.is_array(); },
              "string or array");

  auto ttl = lookupNoLock("ssdp.ttl");
  if (ttl.has_value()) {
    if (!ttl->is_number_integer() || ttl->get<int>() < 1 ||
        ttl->get<int>() > 255) {
      LOG_ERROR << "Invalid multicast TTL: " << ttl->dump()
                << " (must be an integer between 1-255)";
      is_valid = false;
    }
  }

  for (const char* key : {"advertiser.interval_ms", "browser.interval_ms"}) {
    auto interval = lookupNoLock(key);
    if (interval.has_value() &&
        (!interval->is_number_integer() || interval->get<int>() <= 0)) {
      LOG_ERROR << "Invalid interval in config key '" << key
                << "': " << interval->dump();
      is_valid = false;
    }
  }

  if (is_valid) {
    LOG_DEBUG << "Configuration validation passed";
  } else {
    LOG_ERROR << "Configuration validation failed";
  }
  return is_valid;
}

void ConfigManager::reset() {
  std::unique_lock lock(mutex_);
  config_ = json::object();
}

ConfigResult<nlohmann::json> ConfigManager::lookupNoLock(
    const std::string& key) const {
  const json* current = &config_;

  std::size_t start = 0;
  while (start <= key.size()) {
    const auto end = key.find('.', start);
    const std::string part = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!part.empty()) {
      if (!current->is_object()) {
        return tl::make_unexpected(ConfigError{"Key not found: " + key});
      }
      const auto it = current->find(part);
      if (it == current->end()) {
        return tl::make_unexpected(ConfigError{"Key not found: " + key});
      }
      current = &*it;
    }

    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }

  return *current;
}

void ConfigManager::setNoLock(const std::string& key, nlohmann::json value) {
  json* current = &config_;

  std::size_t start = 0;
  while (true) {
    const auto end = key.find('.', start);
    const std::string part = key.substr(
        start, end == std::string::npos ? std::string::npos : end - start);

    if (!current->is_object()) {
      *current = json::object();
    }
    if (end == std::string::npos) {
      (*current)[part] = std::move(value);
      return;
    }
    if (!part.empty()) {
      current = &(*current)[part];
    }
    start = end + 1;
  }
}

void ConfigManager::loadEnvironmentVariables() {
  if (const char* host = std::getenv("SSDPKIT_BIND_HOST")) {
    setNoLock("ssdp.bind_host", std::string(host));
  }

  if (const char* loopback = std::getenv("SSDPKIT_LOOPBACK")) {
    const std::string value(loopback);
    setNoLock("ssdp.loopback", value == "true" || value == "1");
  }

  if (const char* ttl = std::getenv("SSDPKIT_TTL")) {
    try {
      setNoLock("ssdp.ttl", std::stoi(ttl));
    } catch (const std::exception& e) {
      LOG_WARNING << "Invalid SSDPKIT_TTL value: " << ttl << " (" << e.what()
                  << ")";
    }
  }
}

template <>
void ConfigManager::set<std::string>(const std::string& key,
                                     const std::string& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<int>(const std::string& key, const int& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<bool>(const std::string& key, const bool& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<double>(const std::string& key, const double& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
void ConfigManager::set<nlohmann::json>(const std::string& key,
                                        const nlohmann::json& value) {
  std::unique_lock lock(mutex_);
  setNoLock(key, value);
}

template <>
std::string ConfigManager::getWithDefault<std::string>(
    const std::string& key, const std::string& default_value) const {
  auto result = getString(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key << "': '"
              << default_value << "' (reason: " << result.error().message
              << ")";
    return default_value;
  }
  return result.value();
}

template <>
int ConfigManager::getWithDefault<int>(const std::string& key,
                                       const int& default_value) const {
  auto result = getInt(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << default_value
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

template <>
bool ConfigManager::getWithDefault<bool>(const std::string& key,
                                         const bool& default_value) const {
  auto result = getBool(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << (default_value ? "true" : "false")
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

template <>
double ConfigManager::getWithDefault<double>(
    const std::string& key, const double& default_value) const {
  auto result = getDouble(key);
  if (!result.has_value()) {
    LOG_DEBUG << "Using default value for config key '" << key
              << "': " << default_value
              << " (reason: " << result.error().message << ")";
    return default_value;
  }
  return result.value();
}

}  // namespace ssdpkit::common
