#include "protocol/header_set.hpp"

#include "common/string_utils.hpp"

namespace ssdpkit::protocol {

HeaderSet::HeaderSet(
    std::initializer_list<std::pair<std::string, std::string>> init) {
  for (const auto& [key, value] : init) {
    set(key, value);
  }
}

auto HeaderSet::normalizeKey(std::string_view key) -> std::string {
  return common::to_upper(common::trim(key));
}

void HeaderSet::set(std::string_view key, std::string_view value) {
  entries_[normalizeKey(key)] = common::trim(value);
}

void HeaderSet::set(std::string_view key, long long value) {
  entries_[normalizeKey(key)] = std::to_string(value);
}

auto HeaderSet::get(std::string_view key) const -> std::optional<std::string> {
  const auto it = entries_.find(normalizeKey(key));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto HeaderSet::has(std::string_view key) const -> bool {
  return entries_.count(normalizeKey(key)) > 0;
}

auto HeaderSet::erase(std::string_view key) -> bool {
  return entries_.erase(normalizeKey(key)) > 0;
}

void HeaderSet::merge(const HeaderSet& other) {
  for (const auto& [key, value] : other.entries_) {
    entries_[key] = value;
  }
}

}  // namespace ssdpkit::protocol
