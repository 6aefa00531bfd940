#pragma once
#include <string>

namespace hron {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// 解析 "debug"/"info"/"warn"/"error"（大小写不敏感），无法识别时返回 fallback
LogLevel parseLogLevel(const std::string& s, LogLevel fallback = LogLevel::Info);

class Logger {
public:
    static void debug(const std::string& msg, const std::string& component = "system");
    static void info(const std::string& msg, const std::string& component = "system");
    static void warn(const std::string& msg, const std::string& component = "system");
    static void error(const std::string& msg, const std::string& component = "system");

    static std::string level_to_string(LogLevel level);

private:
    static void write(LogLevel level, const std::string& msg, const std::string& component);
};

} // namespace hron
