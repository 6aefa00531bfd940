#include "parser.h"
#include <cstdio>
#include "ast/calendar.h"
#include "lexer/lexer.h"
#include "log/logger.h"

namespace hron::parser {

using lexer::Token;
using lexer::TokenKind;

Parser::Parser(std::vector<Token> tokens, std::string input)
    : m_tokens(std::move(tokens)), m_input(std::move(input)) {}

// ---------------- token 游标 ----------------

const Token* Parser::peek() const {
    return m_pos < m_tokens.size() ? &m_tokens[m_pos] : nullptr;
}

bool Parser::check(TokenKind kind) const {
    const Token* t = peek();
    return t != nullptr && t->kind == kind;
}

const Token& Parser::advance() {
    return m_tokens[m_pos++];
}

Span Parser::endSpan() const {
    if (m_tokens.empty()) return {0, 0};
    const std::size_t end = m_tokens.back().span.end;
    return {end, end};
}

Span Parser::currentSpan() const {
    const Token* t = peek();
    return t ? t->span : endSpan();
}

std::string Parser::tokenText(const Token& tok) const {
    return m_input.substr(tok.span.start, tok.span.end - tok.span.start);
}

HronError Parser::error(const std::string& message, Span span, const std::string& suggestion) const {
    Logger::debug(message + " at " + std::to_string(span.start) + " in \"" + m_input + "\"", "parser");
    return parseError(message, span, m_input, suggestion);
}

HronError Parser::expected(const std::string& what, const std::string& suggestion) const {
    const Token* t = peek();
    if (t == nullptr) {
        return error("expected " + what, endSpan(), suggestion);
    }
    return error("expected " + what + ", got '" + tokenText(*t) + "'", t->span, suggestion);
}

const Token& Parser::consume(TokenKind kind, const std::string& what) {
    if (!check(kind)) {
        throw expected(what);
    }
    return advance();
}

// ---------------- 顶层 ----------------

ast::ScheduleData Parser::parse() {
    ast::ScheduleData schedule = parseExpression();
    if (peek() != nullptr) {
        throw error("unexpected tokens after expression", currentSpan());
    }
    return schedule;
}

ast::ScheduleData Parser::parseExpression() {
    ast::ScheduleData schedule;

    if (check(TokenKind::Every)) {
        advance();
        schedule.expr = parseEvery();
    } else if (check(TokenKind::On)) {
        advance();
        schedule.expr = parseOn();
    } else if (check(TokenKind::Ordinal) || check(TokenKind::Last)) {
        schedule.expr = parseOrdinalRepeat();
    } else {
        throw expected("'every', 'on', or an ordinal (first, second, ...)");
    }

    parseTrailingClauses(schedule);
    return schedule;
}

// 固定顺序：except -> until -> starting -> during -> in
void Parser::parseTrailingClauses(ast::ScheduleData& schedule) {
    if (check(TokenKind::Except)) {
        advance();
        schedule.except.push_back(parseDateSpec("ISO date or month-day in exception"));
        while (check(TokenKind::Comma)) {
            advance();
            schedule.except.push_back(parseDateSpec("ISO date or month-day in exception"));
        }
    }

    if (check(TokenKind::Until)) {
        advance();
        schedule.until = parseDateSpec("ISO date or month-day after 'until'");
    }

    if (check(TokenKind::Starting)) {
        advance();
        if (!check(TokenKind::IsoDate)) {
            throw expected("ISO date (YYYY-MM-DD) after 'starting'");
        }
        const Token& tok = advance();
        validateIsoDate(tok.text, tok.span, "invalid starting date");
        schedule.anchor = tok.text;
    }

    if (check(TokenKind::During)) {
        advance();
        schedule.during = parseMonthList();
    }

    if (check(TokenKind::In)) {
        advance();
        if (!check(TokenKind::Timezone)) {
            throw expected("timezone after 'in'");
        }
        schedule.timezone = advance().text;
    }
}

// ---------------- every ... ----------------

ast::ScheduleExpr Parser::parseEvery() {
    const Token* t = peek();
    if (t == nullptr) {
        throw expected("repeater after 'every'");
    }

    switch (t->kind) {
        case TokenKind::Year:
            advance();
            return parseYearRepeat(1);
        case TokenKind::Day:
            return parseDayRepeat(1, ast::DayFilter::every());
        case TokenKind::Weekday:
            advance();
            return parseDayRepeat(1, ast::DayFilter::weekday());
        case TokenKind::Weekend:
            advance();
            return parseDayRepeat(1, ast::DayFilter::weekend());
        case TokenKind::DayName:
            return parseDayRepeat(1, ast::DayFilter::list(parseDayList()));
        case TokenKind::Month:
            advance();
            return parseMonthRepeat(1);
        case TokenKind::Number:
            return parseNumberRepeat();
        default:
            throw expected("day, weekday, weekend, year, day name, month, or number after 'every'");
    }
}

ast::ScheduleExpr Parser::parseNumberRepeat() {
    const int interval = parseInterval();

    const Token* t = peek();
    const TokenKind kind = t ? t->kind : TokenKind::Comma;
    if (t != nullptr) {
        switch (kind) {
            case TokenKind::Weeks:
                advance();
                return parseWeekRepeat(interval);
            case TokenKind::IntervalUnit:
                return parseIntervalRepeat(interval);
            case TokenKind::Day:
                return parseDayRepeat(interval, ast::DayFilter::every());
            case TokenKind::Month:
                advance();
                return parseMonthRepeat(interval);
            case TokenKind::Year:
                advance();
                return parseYearRepeat(interval);
            default:
                break;
        }
    }
    throw expected("'weeks', 'min', 'minutes', 'hour', 'hours', 'day(s)', 'month(s)', or 'year(s)' after number");
}

ast::ScheduleExpr Parser::parseDayRepeat(int interval, ast::DayFilter days) {
    if (days.kind == ast::DayFilter::Kind::Every) {
        consume(TokenKind::Day, "'day'");
    }
    consume(TokenKind::At, "'at'");

    ast::DayRepeat expr;
    expr.interval = interval;
    expr.days = std::move(days);
    expr.times = parseTimeList();
    return expr;
}

ast::ScheduleExpr Parser::parseIntervalRepeat(int interval) {
    ast::IntervalRepeat expr;
    expr.interval = interval;
    expr.unit = advance().unit;

    consume(TokenKind::From, "'from'");
    const Span fromSpan = currentSpan();
    expr.from = parseTime();
    consume(TokenKind::To, "'to'");
    expr.to = parseTime();

    if (expr.from.totalMinutes() > expr.to.totalMinutes()) {
        throw error("interval window start must not be after end",
                    {fromSpan.start, m_tokens[m_pos - 1].span.end});
    }

    if (check(TokenKind::On)) {
        advance();
        expr.dayFilter = parseDayTarget();
    }
    return expr;
}

ast::ScheduleExpr Parser::parseWeekRepeat(int interval) {
    consume(TokenKind::On, "'on'");

    ast::WeekRepeat expr;
    expr.interval = interval;
    expr.days = parseDayList();
    consume(TokenKind::At, "'at'");
    expr.times = parseTimeList();
    return expr;
}

ast::ScheduleExpr Parser::parseMonthRepeat(int interval) {
    consume(TokenKind::On, "'on'");
    consume(TokenKind::The, "'the'");

    ast::MonthRepeat expr;
    expr.interval = interval;

    const Token* t = peek();
    const TokenKind kind = t ? t->kind : TokenKind::Comma;
    if (t != nullptr && kind == TokenKind::Last) {
        advance();
        if (check(TokenKind::Day)) {
            advance();
            expr.target = ast::LastDayTarget{};
        } else if (check(TokenKind::Weekday)) {
            advance();
            expr.target = ast::LastWeekdayTarget{};
        } else if (check(TokenKind::DayName)) {
            expr.target = ast::OrdinalWeekdayTarget{ast::OrdinalPosition::Last, advance().dayName};
        } else {
            throw expected("'day', 'weekday', or day name after 'last'");
        }
    } else if (t != nullptr && kind == TokenKind::Ordinal) {
        const ast::OrdinalPosition ord = advance().ordinal;
        if (!check(TokenKind::DayName)) {
            throw expected("day name after ordinal");
        }
        expr.target = ast::OrdinalWeekdayTarget{ord, advance().dayName};
    } else if (t != nullptr && kind == TokenKind::OrdinalNumber) {
        expr.target = ast::DaysTarget{parseOrdinalDayList()};
    } else if (t != nullptr
               && (kind == TokenKind::Next || kind == TokenKind::Previous || kind == TokenKind::Nearest)) {
        expr.target = parseNearestWeekdayTarget();
    } else {
        throw expected("ordinal day (1st, 15th), 'last', or '[next|previous] nearest' after 'the'");
    }

    consume(TokenKind::At, "'at'");
    expr.times = parseTimeList();
    return expr;
}

ast::MonthTarget Parser::parseNearestWeekdayTarget() {
    ast::NearestWeekdayTarget target;
    if (check(TokenKind::Next)) {
        advance();
        target.direction = ast::NearestDirection::Next;
    } else if (check(TokenKind::Previous)) {
        advance();
        target.direction = ast::NearestDirection::Previous;
    }

    consume(TokenKind::Nearest, "'nearest'");
    consume(TokenKind::Weekday, "'weekday'");
    consume(TokenKind::To, "'to'");

    if (!check(TokenKind::OrdinalNumber)) {
        throw expected("ordinal day number");
    }
    const Token& tok = advance();
    validateDayOfMonth(tok.number, tok.span);
    target.day = tok.number;
    return target;
}

// ---------------- first monday of every month ... ----------------

ast::ScheduleExpr Parser::parseOrdinalRepeat() {
    ast::OrdinalRepeat expr;
    expr.ordinal = parseOrdinalPosition();

    if (!check(TokenKind::DayName)) {
        throw expected("day name after ordinal");
    }
    expr.weekday = advance().dayName;

    consume(TokenKind::Of, "'of'");
    consume(TokenKind::Every, "'every'");

    if (check(TokenKind::Number)) {
        expr.interval = parseInterval();
    }

    consume(TokenKind::Month, "'month'");
    consume(TokenKind::At, "'at'");
    expr.times = parseTimeList();
    return expr;
}

// ---------------- every year on ... ----------------

ast::ScheduleExpr Parser::parseYearRepeat(int interval) {
    consume(TokenKind::On, "'on'");

    ast::YearRepeat expr;
    expr.interval = interval;

    if (check(TokenKind::The)) {
        advance();
        expr.target = parseYearTargetAfterThe();
    } else if (check(TokenKind::MonthName)) {
        const ast::MonthName month = advance().monthName;
        const Span daySpan = currentSpan();
        const int day = parseDayNumber("day number after month name");
        validateNamedDate(month, day, daySpan);
        expr.target = ast::YearDateTarget{month, day};
    } else {
        throw expected("month name or 'the' after 'every year on'");
    }

    consume(TokenKind::At, "'at'");
    expr.times = parseTimeList();
    return expr;
}

ast::YearTarget Parser::parseYearTargetAfterThe() {
    if (check(TokenKind::Last)) {
        advance();
        if (check(TokenKind::Weekday)) {
            advance();
            consume(TokenKind::Of, "'of'");
            return ast::YearLastWeekdayTarget{parseMonthNameToken()};
        }
        if (check(TokenKind::DayName)) {
            const ast::Weekday wd = advance().dayName;
            consume(TokenKind::Of, "'of'");
            return ast::YearOrdinalWeekdayTarget{ast::OrdinalPosition::Last, wd, parseMonthNameToken()};
        }
        throw expected("'weekday' or day name after 'last' in yearly expression");
    }

    if (check(TokenKind::Ordinal)) {
        const ast::OrdinalPosition ord = parseOrdinalPosition();
        if (!check(TokenKind::DayName)) {
            throw expected("day name after ordinal in yearly expression");
        }
        const ast::Weekday wd = advance().dayName;
        consume(TokenKind::Of, "'of'");
        return ast::YearOrdinalWeekdayTarget{ord, wd, parseMonthNameToken()};
    }

    if (check(TokenKind::OrdinalNumber)) {
        const Token& dayTok = advance();
        const int day = dayTok.number;
        const Span daySpan = dayTok.span;
        consume(TokenKind::Of, "'of'");
        const ast::MonthName month = parseMonthNameToken();
        validateNamedDate(month, day, daySpan);
        return ast::YearDayOfMonthTarget{day, month};
    }

    throw expected("ordinal, day number, or 'last' after 'the' in yearly expression");
}

// ---------------- on <date> ----------------

ast::ScheduleExpr Parser::parseOn() {
    ast::SingleDate expr;
    expr.date = parseDateSpec("date (ISO date or month name)");
    consume(TokenKind::At, "'at'");
    expr.times = parseTimeList();
    return expr;
}

// ---------------- 共享子规则 ----------------

ast::DateSpec Parser::parseDateSpec(const std::string& what) {
    if (check(TokenKind::IsoDate)) {
        const Token& tok = advance();
        validateIsoDate(tok.text, tok.span, "invalid date");
        return ast::IsoDate{tok.text};
    }
    if (check(TokenKind::MonthName)) {
        const ast::MonthName month = advance().monthName;
        const Span daySpan = currentSpan();
        const int day = parseDayNumber("day number after month name");
        validateNamedDate(month, day, daySpan);
        return ast::NamedDate{month, day};
    }
    throw expected(what);
}

ast::DayFilter Parser::parseDayTarget() {
    if (check(TokenKind::Day)) {
        advance();
        return ast::DayFilter::every();
    }
    if (check(TokenKind::Weekday)) {
        advance();
        return ast::DayFilter::weekday();
    }
    if (check(TokenKind::Weekend)) {
        advance();
        return ast::DayFilter::weekend();
    }
    if (check(TokenKind::DayName)) {
        return ast::DayFilter::list(parseDayList());
    }
    throw expected("'day', 'weekday', 'weekend', or day name");
}

std::vector<ast::Weekday> Parser::parseDayList() {
    std::vector<ast::Weekday> days;
    days.push_back(consume(TokenKind::DayName, "day name").dayName);
    while (check(TokenKind::Comma)) {
        advance();
        days.push_back(consume(TokenKind::DayName, "day name after ','").dayName);
    }
    return days;
}

std::vector<ast::DayOfMonthSpec> Parser::parseOrdinalDayList() {
    std::vector<ast::DayOfMonthSpec> specs;
    specs.push_back(parseOrdinalDaySpec());
    while (check(TokenKind::Comma)) {
        advance();
        specs.push_back(parseOrdinalDaySpec());
    }
    return specs;
}

ast::DayOfMonthSpec Parser::parseOrdinalDaySpec() {
    const Token& startTok = consume(TokenKind::OrdinalNumber, "ordinal day number");
    validateDayOfMonth(startTok.number, startTok.span);
    const int start = startTok.number;
    const Span startSpan = startTok.span;

    if (!check(TokenKind::To)) {
        return ast::DayOfMonthSpec::single(start);
    }
    advance();
    const Token& endTok = consume(TokenKind::OrdinalNumber, "ordinal day number after 'to'");
    validateDayOfMonth(endTok.number, endTok.span);
    if (start > endTok.number) {
        throw error("invalid day range: " + std::to_string(start) + " to " + std::to_string(endTok.number),
                    {startSpan.start, endTok.span.end});
    }
    return ast::DayOfMonthSpec::between(start, endTok.number);
}

std::vector<ast::MonthName> Parser::parseMonthList() {
    std::vector<ast::MonthName> months;
    months.push_back(parseMonthNameToken());
    while (check(TokenKind::Comma)) {
        advance();
        months.push_back(parseMonthNameToken());
    }
    return months;
}

ast::MonthName Parser::parseMonthNameToken() {
    return consume(TokenKind::MonthName, "month name").monthName;
}

ast::OrdinalPosition Parser::parseOrdinalPosition() {
    if (check(TokenKind::Ordinal)) {
        return advance().ordinal;
    }
    if (check(TokenKind::Last)) {
        advance();
        return ast::OrdinalPosition::Last;
    }
    throw expected("ordinal (first, second, third, fourth, fifth, last)");
}

int Parser::parseDayNumber(const std::string& what) {
    if (check(TokenKind::Number) || check(TokenKind::OrdinalNumber)) {
        return advance().number;
    }
    throw expected(what);
}

int Parser::parseInterval() {
    const Token& tok = consume(TokenKind::Number, "interval number");
    if (tok.number < 1) {
        throw error("interval must be at least 1", tok.span);
    }
    return tok.number;
}

std::vector<ast::TimeOfDay> Parser::parseTimeList() {
    std::vector<ast::TimeOfDay> times;
    times.push_back(parseTime());
    while (check(TokenKind::Comma)) {
        advance();
        times.push_back(parseTime());
    }
    return times;
}

ast::TimeOfDay Parser::parseTime() {
    if (check(TokenKind::Time)) {
        const Token& tok = advance();
        return ast::TimeOfDay{tok.hour, tok.minute};
    }
    // "at 9" 这种常见写法给出修正建议
    std::string suggestion;
    if (check(TokenKind::Number) && peek()->number <= 23) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:00", peek()->number);
        suggestion = buf;
    }
    throw expected("time (HH:MM)", suggestion);
}

// ---------------- 语义校验 ----------------

void Parser::validateIsoDate(const std::string& date, Span span, const std::string& prefix) const {
    if (!ast::calendar::parseIsoDate(date)) {
        throw error(prefix + ": " + date, span);
    }
}

void Parser::validateNamedDate(ast::MonthName month, int day, Span span) const {
    if (day < 1 || day > ast::maxDaysInMonth(month)) {
        throw error(std::string("invalid date: ") + ast::monthName(month) + " " + std::to_string(day), span);
    }
}

void Parser::validateDayOfMonth(int day, Span span) const {
    if (day < 1 || day > 31) {
        throw error("invalid day of month: " + std::to_string(day), span);
    }
}

// ---------------- 入口 ----------------

ast::ScheduleData parse(const std::string& input) {
    std::vector<Token> tokens = lexer::tokenize(input);
    if (tokens.empty()) {
        Logger::debug("empty expression", "parser");
        throw parseError("empty expression", {0, 0}, input);
    }
    Parser p(std::move(tokens), input);
    return p.parse();
}

bool validate(const std::string& input) {
    try {
        parse(input);
        return true;
    } catch (const HronError&) {
        return false;
    }
}

} // namespace hron::parser
