#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ssdpkit::common {

namespace {
constexpr std::string_view kWhitespace = " \t\r\n\v\f";
}

auto to_hex(std::string_view input) -> std::string {
  std::stringstream ss;
  ss << std::hex << std::setfill('0');
  for (unsigned char c : input) {
    ss << std::setw(2) << static_cast<int>(c);
  }
  return ss.str();
}

auto trim(std::string_view input) -> std::string {
  const auto first = input.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(kWhitespace);
  return std::string(input.substr(first, last - first + 1));
}

auto to_upper(std::string_view input) -> std::string {
  std::string result(input);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

auto starts_with(std::string_view input, std::string_view prefix) -> bool {
  return input.size() >= prefix.size() &&
         input.compare(0, prefix.size(), prefix) == 0;
}

auto split(std::string_view input, char delimiter)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = input.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.push_back(input.substr(start));
      break;
    }
    parts.push_back(input.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

}  // namespace ssdpkit::common
