#include "log_formatter.h"
#include <map>
#include <sstream>
#include "utils.h"
namespace hron::core {

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

const char* LogFormatter::levelName_(LogLevel lv) {
    switch (lv) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default:              return "INFO";
    }
}

std::string LogFormatter::escapeMsg_(const std::string& s) {
    // 单行日志，最小转义就够用
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else if (c == '\t') out += "\\t";
        else if (c == '"')  out += "\\\"";
        else out += c;
    }
    return out;
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::ostringstream oss;

    oss << "ts=[" << utils::formatTimestampMs(r.ts) << ']'
        << " level=[" << levelName_(r.level) << "]"
        << " component=" << r.component
        << " seq=" << static_cast<unsigned long long>(r.seq);

    oss << " msg=\"" << escapeMsg_(r.message) << "\"";

    // extra fields 按 key 排序输出，保证行内容稳定
    std::map<std::string, std::string> sorted(r.fields.begin(), r.fields.end());
    for (const auto& kv : sorted) {
        oss << " " << kv.first << "=" << escapeMsg_(kv.second);
    }

    return oss.str();
}

} // namespace hron::core
