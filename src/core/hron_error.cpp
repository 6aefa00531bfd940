#include "hron_error.h"
#include <sstream>
#include <utility>

namespace hron {

HronError::HronError(ErrorKind kind,
                     const std::string& message,
                     std::optional<Span> span,
                     std::string input,
                     std::string suggestion)
    : std::runtime_error(message),
      m_kind(kind),
      m_message(message),
      m_span(span),
      m_input(std::move(input)),
      m_suggestion(std::move(suggestion)) {}

std::string HronError::displayRich() const {
    const bool hasSource = (m_kind == ErrorKind::Lex || m_kind == ErrorKind::Parse)
                           && m_span.has_value() && !m_input.empty();
    if (!hasSource) {
        return "error: " + m_message;
    }

    std::ostringstream oss;
    oss << "error: " << m_message << "\n";
    oss << "  " << m_input << "\n";

    // 下划线起点要算上前面两个空格的缩进
    const std::size_t width = m_span->end > m_span->start ? m_span->end - m_span->start : 1;
    oss << std::string(m_span->start + 2, ' ') << std::string(width, '^');

    if (!m_suggestion.empty()) {
        oss << " try: \"" << m_suggestion << "\"";
    }
    return oss.str();
}

HronError lexError(const std::string& message, Span span, const std::string& input) {
    return HronError(ErrorKind::Lex, message, span, input);
}

HronError parseError(const std::string& message, Span span, const std::string& input,
                     const std::string& suggestion) {
    return HronError(ErrorKind::Parse, message, span, input, suggestion);
}

HronError evalError(const std::string& message) {
    return HronError(ErrorKind::Eval, message);
}

HronError cronError(const std::string& message) {
    return HronError(ErrorKind::Cron, message);
}

} // namespace hron
