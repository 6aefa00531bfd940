// log_sink_file.cpp
#include "log_sink_file.h"
#include "core/log_formatter.h"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;
namespace hron::core {

FileLogSink::FileLogSink(Options opt) : _opt(std::move(opt)) {
    if (_opt.path.empty()) {
        throw std::invalid_argument("日志文件路径为空");
    }
}

void FileLogSink::ensureOpen_() {
    if (_ofs.is_open()) return;

    auto parent = fs::path(_opt.path).parent_path();
    if (!parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
    }
    _ofs.open(_opt.path, std::ios::app);
    if (!_ofs.is_open()) {
        throw std::runtime_error("无法打开日志文件: " + _opt.path);
    }
}

void FileLogSink::consume(const LogRecord& rec) {
    std::lock_guard<std::mutex> lk(_mu);
    ensureOpen_();
    const std::string line = LogFormatter::instance().formatLine(rec);

    _ofs << line << "\n";

    if (_opt.flushEachLine) {
        _ofs.flush();
    }
}

}
