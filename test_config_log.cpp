#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

#include "core/config.h"
#include "core/hron_error.h"
#include "core/log_formatter.h"
#include "core/log_manager.h"
#include "log/log_sink_file.h"
#include "log/logger.h"
#include "schedule.h"

using namespace nlohmann::json_literals;
using hron::LogLevel;
using hron::Logger;
using hron::core::Config;
using hron::core::LogManager;
using hron::core::LogRecord;

namespace fs = std::filesystem;

// 收集到内存里，便于断言
class CaptureSink : public hron::core::ILogSink {
public:
    void consume(const LogRecord& rec) override { records.push_back(rec); }
    std::vector<LogRecord> records;
};

static fs::path tmpDir() {
    const char* p = std::getenv("HRON_TEST_TMPDIR");
    return p ? fs::path(p) : fs::temp_directory_path();
}

static std::string readFile(const fs::path& p) {
    std::ifstream ifs(p);
    std::stringstream buf;
    buf << ifs.rdbuf();
    return buf.str();
}

// 每个用例前恢复日志状态
static void resetLogging() {
    auto& lm = LogManager::instance();
    lm.clearSinks();
    lm.clearTail();
    lm.init(500);
    lm.setMinLevel(LogLevel::Info);
}

static void test_config_from_json() {
    auto& cfg = Config::instance();
    cfg.reset();
    assert(cfg.log_level() == LogLevel::Info);
    assert(cfg.log_console());
    assert(cfg.log_path().empty());
    assert(cfg.log_tail() == 500);

    const json j = R"({
        "log": {
            "level": "DEBUG",
            "console": false,
            "path": "logs/hron.log",
            "tail": 50
        }
    })"_json;
    assert(cfg.load_from_string(j.dump()));
    assert(cfg.log_level() == LogLevel::Debug);
    assert(!cfg.log_console());
    assert(cfg.log_path() == "logs/hron.log");
    assert(cfg.log_tail() == 50);

    // 只覆盖出现的字段；无法识别的级别保留原值
    assert(cfg.load_from_string(R"({"log": {"level": "verbose", "tail": -1}})"));
    assert(cfg.log_level() == LogLevel::Debug);
    assert(cfg.log_tail() == 50);

    // 坏 JSON 返回 false，不动已有配置
    assert(!cfg.load_from_string("{ not json"));
    assert(cfg.log_path() == "logs/hron.log");

    cfg.reset();
    assert(cfg.log_level() == LogLevel::Info);
    std::cout << "[OK] config from json\n";
}

static void test_config_from_file() {
    auto& cfg = Config::instance();
    cfg.reset();

    const fs::path path = tmpDir() / "hron_test_config.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"log": {"level": "warn", "console": true}})"_json.dump(2);
    }
    assert(cfg.load(path.string()));
    assert(cfg.log_level() == LogLevel::Warn);
    assert(cfg.log_console());
    fs::remove(path);

    assert(!cfg.load((tmpDir() / "hron_missing_config.json").string()));
    cfg.reset();
    std::cout << "[OK] config from file\n";
}

static void test_config_from_env() {
    auto& cfg = Config::instance();
    cfg.reset();

    setenv("HRON_LOG_LEVEL", "error", 1);
    setenv("HRON_LOG_CONSOLE", "false", 1);
    setenv("HRON_LOG_PATH", "/var/log/hron.log", 1);
    cfg.load_from_env();
    assert(cfg.log_level() == LogLevel::Error);
    assert(!cfg.log_console());
    assert(cfg.log_path() == "/var/log/hron.log");

    // 无法识别的值不覆盖
    setenv("HRON_LOG_CONSOLE", "maybe", 1);
    setenv("HRON_LOG_LEVEL", "loud", 1);
    cfg.load_from_env();
    assert(!cfg.log_console());
    assert(cfg.log_level() == LogLevel::Error);

    unsetenv("HRON_LOG_LEVEL");
    unsetenv("HRON_LOG_CONSOLE");
    unsetenv("HRON_LOG_PATH");
    cfg.reset();
    std::cout << "[OK] config from env\n";
}

static void test_parse_log_level() {
    assert(hron::parseLogLevel("debug") == LogLevel::Debug);
    assert(hron::parseLogLevel(" Warning ") == LogLevel::Warn);
    assert(hron::parseLogLevel("ERROR") == LogLevel::Error);
    assert(hron::parseLogLevel("?", LogLevel::Warn) == LogLevel::Warn);
    assert(Logger::level_to_string(LogLevel::Info) == "INFO");
    std::cout << "[OK] parse log level\n";
}

static void test_level_filter_and_sinks() {
    resetLogging();
    auto sink = std::make_shared<CaptureSink>();
    LogManager::instance().addSink(sink);

    Logger::debug("dropped", "test");
    Logger::info("kept info", "test");
    Logger::warn("kept warn", "test");
    assert(sink->records.size() == 2);
    assert(sink->records[0].message == "kept info");
    assert(sink->records[1].level == LogLevel::Warn);
    assert(sink->records[1].component == "test");
    assert(sink->records[1].seq > sink->records[0].seq);

    LogManager::instance().setMinLevel(LogLevel::Debug);
    Logger::debug("now visible", "test");
    assert(sink->records.size() == 3);

    LogManager::instance().setMinLevel(LogLevel::Error);
    assert(LogManager::instance().minLevel() == LogLevel::Error);
    Logger::warn("filtered", "test");
    assert(sink->records.size() == 3);

    resetLogging();
    std::cout << "[OK] level filter / sinks\n";
}

static void test_tail() {
    resetLogging();
    auto& lm = LogManager::instance();
    lm.init(3);
    for (int i = 0; i < 5; ++i) {
        Logger::info("line " + std::to_string(i), "test");
    }
    const auto recent = lm.tail(10);
    assert(recent.size() == 3);
    assert(recent.front().message == "line 2");
    assert(recent.back().message == "line 4");
    assert(lm.tail(1).front().message == "line 4");

    lm.clearTail();
    assert(lm.tail(10).empty());
    resetLogging();
    std::cout << "[OK] tail\n";
}

static void test_formatter() {
    LogRecord r;
    r.level = LogLevel::Warn;
    r.component = "parser";
    r.message = "bad \"input\"\nline";
    r.seq = 7;
    r.fields["zone"] = "UTC";
    r.fields["input"] = "every day";

    const std::string line = hron::core::LogFormatter::instance().formatLine(r);
    assert(line.rfind("ts=[", 0) == 0);
    assert(line.find(" level=[WARN]") != std::string::npos);
    assert(line.find(" component=parser seq=7") != std::string::npos);
    assert(line.find(" msg=\"bad \\\"input\\\"\\nline\"") != std::string::npos);
    // 扩展字段按 key 排序
    const auto inputPos = line.find(" input=every day");
    const auto zonePos = line.find(" zone=UTC");
    assert(inputPos != std::string::npos && zonePos != std::string::npos);
    assert(inputPos < zonePos);
    assert(line.find('\n') == std::string::npos);
    std::cout << "[OK] formatter\n";
}

static void test_file_sink() {
    resetLogging();
    const fs::path path = tmpDir() / "hron_log_test" / "hron.log";
    fs::remove_all(path.parent_path());

    hron::core::FileLogSink::Options opt;
    opt.path = path.string();
    auto sink = std::make_shared<hron::core::FileLogSink>(opt);
    assert(sink->path() == path.string());
    LogManager::instance().addSink(sink);

    Logger::warn("written to file", "test");
    Logger::info("second line", "test");

    const std::string content = readFile(path);
    assert(content.find("level=[WARN] component=test") != std::string::npos);
    assert(content.find("msg=\"written to file\"") != std::string::npos);
    assert(content.find("msg=\"second line\"") != std::string::npos);

    bool thrown = false;
    try {
        hron::core::FileLogSink bad(hron::core::FileLogSink::Options{"", true});
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    resetLogging();
    fs::remove_all(path.parent_path());
    std::cout << "[OK] file sink\n";
}

static void test_init_logging_from_config() {
    resetLogging();
    auto& cfg = Config::instance();
    cfg.reset();

    const fs::path path = tmpDir() / "hron_init_logging.log";
    fs::remove(path);
    json j;
    j["log"]["level"] = "debug";
    j["log"]["console"] = false;
    j["log"]["path"] = path.string();
    j["log"]["tail"] = 2;
    assert(cfg.load_from_string(j.dump()));

    hron::core::initLogging(cfg);
    assert(LogManager::instance().minLevel() == LogLevel::Debug);

    Logger::debug("from config", "test");
    assert(readFile(path).find("msg=\"from config\"") != std::string::npos);

    Logger::info("a", "test");
    Logger::info("b", "test");
    assert(LogManager::instance().tail(10).size() == 2);

    cfg.reset();
    resetLogging();
    fs::remove(path);
    std::cout << "[OK] init logging from config\n";
}

static void test_library_logs() {
    resetLogging();
    LogManager::instance().setMinLevel(LogLevel::Debug);

    // 时区加载失败会先记一条 eval 组件的告警
    bool thrown = false;
    try {
        hron::Schedule::parse("every day at 09:00 in Nowhere/Atlantis");
    } catch (const hron::HronError& e) {
        thrown = true;
        assert(e.kind() == hron::ErrorKind::Eval);
    }
    assert(thrown);

    bool sawEvalWarn = false;
    for (const auto& r : LogManager::instance().tail(50)) {
        if (r.component == "eval" && r.level == LogLevel::Warn) sawEvalWarn = true;
    }
    assert(sawEvalWarn);

    // toCron 拒绝时留一条 cron 组件的调试日志
    thrown = false;
    try {
        hron::Schedule::parse("every 2 days at 09:00").toCron();
    } catch (const hron::HronError& e) {
        thrown = true;
        assert(e.kind() == hron::ErrorKind::Cron);
    }
    assert(thrown);
    const auto last = LogManager::instance().tail(1);
    assert(last.size() == 1 && last[0].component == "cron" && last[0].level == LogLevel::Debug);

    resetLogging();
    std::cout << "[OK] library logs\n";
}

int main() {
    test_config_from_json();
    test_config_from_file();
    test_config_from_env();
    test_parse_log_level();
    test_level_filter_and_sinks();
    test_tail();
    test_formatter();
    test_file_sink();
    test_init_logging_from_config();
    test_library_logs();
    std::cout << "\nALL config / log tests passed\n";
    return 0;
}
