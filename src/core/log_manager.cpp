#include "log_manager.h"
#include <algorithm>
#include <cstddef>
#include "config.h"
#include "log_sink_console.h"
#include "log/log_sink_file.h"

namespace hron::core {

LogManager& LogManager::instance() {
    static LogManager g;
    return g;
}

void LogManager::init(std::size_t tailCapacity) {
    std::lock_guard<std::mutex> lk(_mu);
    _tailCapacity = tailCapacity;
    while (_tail.size() > _tailCapacity) _tail.pop_front();
}

void LogManager::emit(const LogRecord& rec) {
    LogRecord stored;
    std::vector<std::shared_ptr<ILogSink>> sinksSnapshot;

    {
        std::lock_guard<std::mutex> lk(_mu);
        if (rec.level < _minLevel) return;

        stored = rec;
        stored.seq = _nextSeq++;

        if (_tailCapacity > 0) {
            _tail.push_back(stored);
            while (_tail.size() > _tailCapacity) _tail.pop_front();
        }

        // 拷贝 sinks（避免锁内做 IO）
        sinksSnapshot = _sinks;
    }

    for (auto& s : sinksSnapshot) {
        if (s) s->consume(stored);
    }
}

void LogManager::setMinLevel(LogLevel lv) {
    std::lock_guard<std::mutex> lk(_mu);
    _minLevel = lv;
}

LogLevel LogManager::minLevel() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _minLevel;
}

void LogManager::addSink(std::shared_ptr<ILogSink> sink)
{
    if (!sink) return;
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.push_back(std::move(sink));
}

void LogManager::clearSinks()
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks.clear();
}

void LogManager::setSinks(std::vector<std::shared_ptr<ILogSink>> sinks)
{
    std::lock_guard<std::mutex> lk(_mu);
    _sinks = std::move(sinks);
}

std::vector<LogRecord> LogManager::tail(std::size_t n) const {
    std::lock_guard<std::mutex> lk(_mu);
    const std::size_t count = std::min(n, _tail.size());
    return std::vector<LogRecord>(_tail.end() - static_cast<std::ptrdiff_t>(count), _tail.end());
}

void LogManager::clearTail() {
    std::lock_guard<std::mutex> lk(_mu);
    _tail.clear();
}

void initLogging(const Config& cfg) {
    auto& lm = LogManager::instance();
    lm.init(cfg.log_tail());
    lm.setMinLevel(cfg.log_level());

    std::vector<std::shared_ptr<ILogSink>> sinks;
    if (cfg.log_console()) {
        sinks.push_back(std::make_shared<ConsoleLogSink>());
    }
    if (!cfg.log_path().empty()) {
        FileLogSink::Options opt;
        opt.path = cfg.log_path();
        sinks.push_back(std::make_shared<FileLogSink>(opt));
    }
    lm.setSinks(std::move(sinks));
}

} // namespace hron::core
