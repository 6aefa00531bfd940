#include "lexer.h"
#include <cctype>
#include <unordered_map>
#include "core/utils.h"
#include "log/logger.h"

namespace hron::lexer {

using ast::IntervalUnit;
using ast::MonthName;
using ast::OrdinalPosition;
using ast::Weekday;

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Every:         return "'every'";
        case TokenKind::On:            return "'on'";
        case TokenKind::At:            return "'at'";
        case TokenKind::From:          return "'from'";
        case TokenKind::To:            return "'to'";
        case TokenKind::In:            return "'in'";
        case TokenKind::Of:            return "'of'";
        case TokenKind::The:           return "'the'";
        case TokenKind::Last:          return "'last'";
        case TokenKind::Except:        return "'except'";
        case TokenKind::Until:         return "'until'";
        case TokenKind::Starting:      return "'starting'";
        case TokenKind::During:        return "'during'";
        case TokenKind::Year:          return "'year'";
        case TokenKind::Day:           return "'day'";
        case TokenKind::Weekday:       return "'weekday'";
        case TokenKind::Weekend:       return "'weekend'";
        case TokenKind::Weeks:         return "'weeks'";
        case TokenKind::Month:         return "'month'";
        case TokenKind::Nearest:       return "'nearest'";
        case TokenKind::Next:          return "'next'";
        case TokenKind::Previous:      return "'previous'";
        case TokenKind::DayName:       return "day name";
        case TokenKind::MonthName:     return "month name";
        case TokenKind::Ordinal:       return "ordinal";
        case TokenKind::IntervalUnit:  return "interval unit";
        case TokenKind::Number:        return "number";
        case TokenKind::OrdinalNumber: return "ordinal number";
        case TokenKind::Time:          return "time";
        case TokenKind::IsoDate:       return "ISO date";
        case TokenKind::Timezone:      return "timezone";
        case TokenKind::Comma:         return "','";
    }
    return "token";
}

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool isWordChar(char c) { return isAlpha(c) || isDigit(c) || c == '_'; }
bool isWhitespace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

Token keyword(TokenKind k) {
    Token t;
    t.kind = k;
    return t;
}

Token dayKw(Weekday d) {
    Token t = keyword(TokenKind::DayName);
    t.dayName = d;
    return t;
}

Token monthKw(MonthName m) {
    Token t = keyword(TokenKind::MonthName);
    t.monthName = m;
    return t;
}

Token ordinalKw(OrdinalPosition o) {
    Token t = keyword(TokenKind::Ordinal);
    t.ordinal = o;
    return t;
}

Token unitKw(IntervalUnit u) {
    Token t = keyword(TokenKind::IntervalUnit);
    t.unit = u;
    return t;
}

// 进程级只读词表，首次使用时构造
const std::unordered_map<std::string, Token>& keywordTable() {
    static const std::unordered_map<std::string, Token> table = {
        {"every",    keyword(TokenKind::Every)},
        {"on",       keyword(TokenKind::On)},
        {"at",       keyword(TokenKind::At)},
        {"from",     keyword(TokenKind::From)},
        {"to",       keyword(TokenKind::To)},
        {"in",       keyword(TokenKind::In)},
        {"of",       keyword(TokenKind::Of)},
        {"the",      keyword(TokenKind::The)},
        {"last",     keyword(TokenKind::Last)},
        {"except",   keyword(TokenKind::Except)},
        {"until",    keyword(TokenKind::Until)},
        {"starting", keyword(TokenKind::Starting)},
        {"during",   keyword(TokenKind::During)},
        {"year",     keyword(TokenKind::Year)},
        {"years",    keyword(TokenKind::Year)},
        {"day",      keyword(TokenKind::Day)},
        {"days",     keyword(TokenKind::Day)},
        {"weekday",  keyword(TokenKind::Weekday)},
        {"weekdays", keyword(TokenKind::Weekday)},
        {"weekend",  keyword(TokenKind::Weekend)},
        {"weekends", keyword(TokenKind::Weekend)},
        {"week",     keyword(TokenKind::Weeks)},
        {"weeks",    keyword(TokenKind::Weeks)},
        {"month",    keyword(TokenKind::Month)},
        {"months",   keyword(TokenKind::Month)},
        {"nearest",  keyword(TokenKind::Nearest)},
        {"next",     keyword(TokenKind::Next)},
        {"previous", keyword(TokenKind::Previous)},
        // 星期
        {"monday",    dayKw(Weekday::Monday)},
        {"mon",       dayKw(Weekday::Monday)},
        {"tuesday",   dayKw(Weekday::Tuesday)},
        {"tue",       dayKw(Weekday::Tuesday)},
        {"wednesday", dayKw(Weekday::Wednesday)},
        {"wed",       dayKw(Weekday::Wednesday)},
        {"thursday",  dayKw(Weekday::Thursday)},
        {"thu",       dayKw(Weekday::Thursday)},
        {"friday",    dayKw(Weekday::Friday)},
        {"fri",       dayKw(Weekday::Friday)},
        {"saturday",  dayKw(Weekday::Saturday)},
        {"sat",       dayKw(Weekday::Saturday)},
        {"sunday",    dayKw(Weekday::Sunday)},
        {"sun",       dayKw(Weekday::Sunday)},
        // 月份
        {"january",   monthKw(MonthName::Jan)},
        {"jan",       monthKw(MonthName::Jan)},
        {"february",  monthKw(MonthName::Feb)},
        {"feb",       monthKw(MonthName::Feb)},
        {"march",     monthKw(MonthName::Mar)},
        {"mar",       monthKw(MonthName::Mar)},
        {"april",     monthKw(MonthName::Apr)},
        {"apr",       monthKw(MonthName::Apr)},
        {"may",       monthKw(MonthName::May)},
        {"june",      monthKw(MonthName::Jun)},
        {"jun",       monthKw(MonthName::Jun)},
        {"july",      monthKw(MonthName::Jul)},
        {"jul",       monthKw(MonthName::Jul)},
        {"august",    monthKw(MonthName::Aug)},
        {"aug",       monthKw(MonthName::Aug)},
        {"september", monthKw(MonthName::Sep)},
        {"sep",       monthKw(MonthName::Sep)},
        {"october",   monthKw(MonthName::Oct)},
        {"oct",       monthKw(MonthName::Oct)},
        {"november",  monthKw(MonthName::Nov)},
        {"nov",       monthKw(MonthName::Nov)},
        {"december",  monthKw(MonthName::Dec)},
        {"dec",       monthKw(MonthName::Dec)},
        // 序数词
        {"first",  ordinalKw(OrdinalPosition::First)},
        {"second", ordinalKw(OrdinalPosition::Second)},
        {"third",  ordinalKw(OrdinalPosition::Third)},
        {"fourth", ordinalKw(OrdinalPosition::Fourth)},
        {"fifth",  ordinalKw(OrdinalPosition::Fifth)},
        // 间隔单位
        {"min",     unitKw(IntervalUnit::Minutes)},
        {"mins",    unitKw(IntervalUnit::Minutes)},
        {"minute",  unitKw(IntervalUnit::Minutes)},
        {"minutes", unitKw(IntervalUnit::Minutes)},
        {"hour",    unitKw(IntervalUnit::Hours)},
        {"hours",   unitKw(IntervalUnit::Hours)},
        {"hr",      unitKw(IntervalUnit::Hours)},
        {"hrs",     unitKw(IntervalUnit::Hours)},
    };
    return table;
}

} // namespace

Lexer::Lexer(std::string input) : m_input(std::move(input)) {}

bool Lexer::is_eof() const {
    return m_pos >= m_input.size();
}

char Lexer::peek() const {
    return is_eof() ? '\0' : m_input[m_pos];
}

void Lexer::skip_whitespace() {
    while (!is_eof() && isWhitespace(m_input[m_pos])) {
        ++m_pos;
    }
}

HronError Lexer::fail(const std::string& message, Span span) const {
    Logger::debug(message + " at " + std::to_string(span.start) + " in \"" + m_input + "\"", "lexer");
    return lexError(message, span, m_input);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (true) {
        skip_whitespace();
        if (is_eof()) {
            break;
        }

        if (m_afterIn) {
            m_afterIn = false;
            tokens.push_back(lexTimezone());
            continue;
        }

        const std::size_t start = m_pos;
        const char ch = peek();

        if (ch == ',') {
            ++m_pos;
            Token t;
            t.kind = TokenKind::Comma;
            t.span = {start, m_pos};
            tokens.push_back(t);
            continue;
        }
        if (isDigit(ch)) {
            tokens.push_back(lexNumberOrTimeOrDate());
            continue;
        }
        if (isAlpha(ch)) {
            tokens.push_back(lexWord());
            continue;
        }

        throw fail(std::string("unexpected character '") + ch + "'", {start, start + 1});
    }
    return tokens;
}

Token Lexer::lexTimezone() {
    skip_whitespace();
    const std::size_t start = m_pos;
    while (!is_eof() && !isWhitespace(m_input[m_pos])) {
        ++m_pos;
    }
    if (m_pos == start) {
        throw fail("expected timezone after 'in'", {start, start + 1});
    }
    Token t;
    t.kind = TokenKind::Timezone;
    t.span = {start, m_pos};
    t.text = m_input.substr(start, m_pos - start);
    return t;
}

Token Lexer::lexNumberOrTimeOrDate() {
    const std::size_t start = m_pos;
    while (!is_eof() && isDigit(m_input[m_pos])) {
        ++m_pos;
    }
    const std::string digits = m_input.substr(start, m_pos - start);
    const std::size_t len = m_input.size();

    // ISO 日期：YYYY-MM-DD（只看形状，日历合法性由 parser 检查）
    if (digits.size() == 4 && peek() == '-') {
        if (len - start >= 10
            && m_input[start + 4] == '-'
            && isDigit(m_input[start + 5]) && isDigit(m_input[start + 6])
            && m_input[start + 7] == '-'
            && isDigit(m_input[start + 8]) && isDigit(m_input[start + 9])) {
            m_pos = start + 10;
            Token t;
            t.kind = TokenKind::IsoDate;
            t.span = {start, m_pos};
            t.text = m_input.substr(start, 10);
            return t;
        }
    }

    // 时间：H:MM 或 HH:MM
    if ((digits.size() == 1 || digits.size() == 2) && peek() == ':') {
        std::size_t p = m_pos + 1;
        const std::size_t minStart = p;
        while (p < len && isDigit(m_input[p])) {
            ++p;
        }
        if (p - minStart == 2) {
            const int hour = std::stoi(digits);
            const int minute = std::stoi(m_input.substr(minStart, 2));
            m_pos = p;
            if (hour > 23 || minute > 59) {
                throw fail("invalid time", {start, m_pos});
            }
            Token t;
            t.kind = TokenKind::Time;
            t.span = {start, m_pos};
            t.hour = hour;
            t.minute = minute;
            return t;
        }
    }

    int num = 0;
    if (!utils::parse_int(digits, num)) {
        throw fail("invalid number", {start, m_pos});
    }

    // 序数后缀：st / nd / rd / th
    if (m_pos + 1 < len) {
        const std::string suffix = utils::to_lower(m_input.substr(m_pos, 2));
        if (suffix == "st" || suffix == "nd" || suffix == "rd" || suffix == "th") {
            m_pos += 2;
            Token t;
            t.kind = TokenKind::OrdinalNumber;
            t.span = {start, m_pos};
            t.number = num;
            return t;
        }
    }

    Token t;
    t.kind = TokenKind::Number;
    t.span = {start, m_pos};
    t.number = num;
    return t;
}

Token Lexer::lexWord() {
    const std::size_t start = m_pos;
    while (!is_eof() && isWordChar(m_input[m_pos])) {
        ++m_pos;
    }
    const std::string word = utils::to_lower(m_input.substr(start, m_pos - start));
    const Span span{start, m_pos};

    const auto& table = keywordTable();
    auto it = table.find(word);
    if (it == table.end()) {
        throw fail("unknown keyword '" + word + "'", span);
    }

    Token t = it->second;
    t.span = span;
    if (t.kind == TokenKind::In) {
        m_afterIn = true;
    }
    return t;
}

std::vector<Token> tokenize(const std::string& input) {
    Lexer lx(input);
    return lx.tokenize();
}

} // namespace hron::lexer
