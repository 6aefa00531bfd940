#include "log/logger.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include "log_manager.h"
#include "log/log_record.h"
#include "utils.h"

namespace hron {

LogLevel parseLogLevel(const std::string& s, LogLevel fallback) {
    const std::string v = utils::to_lower(utils::trim(s));
    if (v == "debug") return LogLevel::Debug;
    if (v == "info")  return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return fallback;
}

void Logger::debug(const std::string& msg, const std::string& component) {
    write(LogLevel::Debug, msg, component);
}

void Logger::info(const std::string& msg, const std::string& component) {
    write(LogLevel::Info, msg, component);
}

void Logger::warn(const std::string& msg, const std::string& component) {
    write(LogLevel::Warn, msg, component);
}

void Logger::error(const std::string& msg, const std::string& component) {
    write(LogLevel::Error, msg, component);
}

void Logger::write(LogLevel level, const std::string& msg, const std::string& component) {
    core::LogRecord rec;
    rec.level = level;
    rec.component = component;
    rec.message = msg;
    rec.ts = std::chrono::system_clock::now();

    try {
        core::LogManager::instance().emit(rec);
    } catch (const std::exception& ex) {
        // sink 出错时退回到 stderr，日志不能丢
        std::cerr << utils::now_string() << " [" << level_to_string(level) << "] "
                  << msg << " (sink failure: " << ex.what() << ")" << std::endl;
    }
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "UNK";
    }
}

} // namespace hron
