#pragma once
#include <string>
#include "log/log_record.h"

namespace hron::core {

// 一行文本，例：
// ts=[2026-02-06 12:00:00.000] level=[DEBUG] component=parser seq=3 msg="expected time (HH:MM)" input=every day at
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

private:
    LogFormatter() = default;

    static const char* levelName_(LogLevel lv);
    static std::string escapeMsg_(const std::string& s);
};

} // namespace hron::core
