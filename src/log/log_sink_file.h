// log_sink_file.h
#pragma once
#include "core/log_sink.h"
#include <fstream>
#include <string>
#include <mutex>

namespace hron::core {

class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "./logs/hron.log";
        bool flushEachLine = true;
    };

    explicit FileLogSink(Options opt);
    void consume(const LogRecord& rec) override;

    const std::string& path() const { return _opt.path; }

private:
    void ensureOpen_();

private:
    Options _opt;
    std::ofstream _ofs;
    std::mutex _mu;
};

}
