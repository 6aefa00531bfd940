#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace hron {

enum class ErrorKind {
    Lex,
    Parse,
    Eval,
    Cron,
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Lex:   return "lex";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::Eval:  return "eval";
        case ErrorKind::Cron:  return "cron";
    }
    return "unknown";
}

// 源文本中的半开区间 [start, end)，按字节偏移
struct Span {
    std::size_t start{0};
    std::size_t end{0};

    bool operator==(const Span& o) const { return start == o.start && end == o.end; }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

class HronError : public std::runtime_error {
public:
    HronError(ErrorKind kind,
              const std::string& message,
              std::optional<Span> span = std::nullopt,
              std::string input = {},
              std::string suggestion = {});

    ErrorKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }
    const std::optional<Span>& span() const { return m_span; }
    const std::string& input() const { return m_input; }
    const std::string& suggestion() const { return m_suggestion; }

    // error: <msg>
    //   <input>
    //   ^^^^ try: "<suggestion>"
    std::string displayRich() const;

private:
    ErrorKind m_kind;
    std::string m_message;
    std::optional<Span> m_span;
    std::string m_input;
    std::string m_suggestion;
};

HronError lexError(const std::string& message, Span span, const std::string& input);
HronError parseError(const std::string& message, Span span, const std::string& input,
                     const std::string& suggestion = {});
HronError evalError(const std::string& message);
HronError cronError(const std::string& message);

} // namespace hron
