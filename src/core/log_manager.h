#pragma once
#include <deque>
#include <memory>
#include <vector>
#include <mutex>

#include "log/log_record.h"
#include "log_sink.h"

namespace hron::core {

class Config;

// 统一入口：分配 seq、按级别过滤、保留最近的记录、再分发给 sinks
class LogManager {
public:
    static LogManager& instance();

    void init(std::size_t tailCapacity = 500);

    void emit(const LogRecord& rec);

    void setMinLevel(LogLevel lv);
    LogLevel minLevel() const;

    // sinks
    void addSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setSinks(std::vector<std::shared_ptr<ILogSink>> sinks);

    // 查询最近 n 条
    std::vector<LogRecord> tail(std::size_t n) const;
    void clearTail();

private:
    LogManager() = default;

private:
    mutable std::mutex _mu;
    LogLevel _minLevel{LogLevel::Info};
    std::uint64_t _nextSeq{1};
    std::size_t _tailCapacity{500};
    std::deque<LogRecord> _tail;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

// 按配置安装 console / file sink 与最低级别
void initLogging(const Config& cfg);

} // namespace hron::core
