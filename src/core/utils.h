#pragma once

#include <string>
#include <chrono>
#include <vector>

namespace hron {
namespace utils {

// 当前时间，格式：YYYY-MM-DD HH:MM:SS.mmm
std::string now_string();

std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);

// 按单个分隔符切分，保留空段
std::vector<std::string> split(const std::string& s, char sep);

// 按空白切分，丢弃空段
std::vector<std::string> split_whitespace(const std::string& s);

// 整段都是十进制数字才返回 true，写入 out
bool parse_int(const std::string& s, int& out);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

} // namespace utils
} // namespace hron
