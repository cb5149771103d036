#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ssdpkit::common {

/**
 * @brief 将字符串转换为十六进制表示
 * @param input 输入字符串
 * @return 十六进制表示的字符串
 */
std::string to_hex(std::string_view input);

/**
 * @brief 去除首尾空白字符（空格、制表符、CR、LF）
 */
std::string trim(std::string_view input);

/**
 * @brief 转换为大写（仅 ASCII）
 */
std::string to_upper(std::string_view input);

bool starts_with(std::string_view input, std::string_view prefix);

/**
 * @brief 按单个字符切分，保留空片段
 */
std::vector<std::string_view> split(std::string_view input, char delimiter);

}  // namespace ssdpkit::common
