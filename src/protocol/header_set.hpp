#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ssdpkit::protocol {

/**
 * @brief 大小写不敏感的 SSDP 头部集合
 *
 * 键在写入和查找时都会被去除首尾空白并转为大写，值在写入时去除首尾空白。
 * 重复写入覆盖旧值。迭代顺序按键的字典序，保证序列化结果确定。
 */
class HeaderSet {
 public:
  using container_type = std::map<std::string, std::string>;
  using const_iterator = container_type::const_iterator;

  HeaderSet() = default;
  HeaderSet(std::initializer_list<std::pair<std::string, std::string>> init);

  void set(std::string_view key, std::string_view value);
  void set(std::string_view key, long long value);

  [[nodiscard]] auto get(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto has(std::string_view key) const -> bool;
  auto erase(std::string_view key) -> bool;
  void clear() { entries_.clear(); }

  // 将 other 中的所有条目写入本集合（覆盖同名键）
  void merge(const HeaderSet& other);

  [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }
  [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }

  auto begin() const -> const_iterator { return entries_.begin(); }
  auto end() const -> const_iterator { return entries_.end(); }

  auto operator==(const HeaderSet& other) const -> bool {
    return entries_ == other.entries_;
  }
  auto operator!=(const HeaderSet& other) const -> bool {
    return !(*this == other);
  }

  static auto normalizeKey(std::string_view key) -> std::string;

 private:
  container_type entries_;
};

}  // namespace ssdpkit::protocol
