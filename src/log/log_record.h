#pragma once
#include <string>
#include <unordered_map>
#include <chrono>
#include <cstdint>
#include "log/logger.h"

namespace hron::core {

struct LogRecord {
    // ---- content ----
    LogLevel level{LogLevel::Info};
    std::string component{"system"};       // lexer / parser / eval / cron / config / system
    std::string message;

    // ---- timing ----
    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};

    // ---- extra fields ----
    std::unordered_map<std::string, std::string> fields; // 任意扩展字段

    // 序列号（由 LogManager 分配）
    std::uint64_t seq{0};
};

// 小工具：把 time_point 转成毫秒时间戳
inline std::int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

} // namespace hron::core
