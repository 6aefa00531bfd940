#pragma once
#include <string>
#include <vector>
#include "ast/schedule_ast.h"
#include "lexer/token.h"

namespace hron::parser {

// 递归下降，一个 token 前瞻，不回溯
class Parser {
public:
    Parser(std::vector<lexer::Token> tokens, std::string input);

    ast::ScheduleData parse();

private:
    // token 游标
    const lexer::Token* peek() const;
    bool check(lexer::TokenKind kind) const;
    const lexer::Token& advance();
    Span currentSpan() const;
    Span endSpan() const;
    std::string tokenText(const lexer::Token& tok) const;

    HronError error(const std::string& message, Span span, const std::string& suggestion = {}) const;
    // 有 token 时报 "expected X, got 'y'"，到结尾时报 "expected X"
    HronError expected(const std::string& what, const std::string& suggestion = {}) const;
    const lexer::Token& consume(lexer::TokenKind kind, const std::string& what);

    // 产生式
    ast::ScheduleData parseExpression();
    void parseTrailingClauses(ast::ScheduleData& schedule);

    ast::ScheduleExpr parseEvery();
    ast::ScheduleExpr parseNumberRepeat();
    ast::ScheduleExpr parseDayRepeat(int interval, ast::DayFilter days);
    ast::ScheduleExpr parseIntervalRepeat(int interval);
    ast::ScheduleExpr parseWeekRepeat(int interval);
    ast::ScheduleExpr parseMonthRepeat(int interval);
    ast::MonthTarget parseNearestWeekdayTarget();
    ast::ScheduleExpr parseOrdinalRepeat();
    ast::ScheduleExpr parseYearRepeat(int interval);
    ast::YearTarget parseYearTargetAfterThe();
    ast::ScheduleExpr parseOn();

    ast::DateSpec parseDateSpec(const std::string& context);
    ast::DayFilter parseDayTarget();
    std::vector<ast::Weekday> parseDayList();
    std::vector<ast::DayOfMonthSpec> parseOrdinalDayList();
    ast::DayOfMonthSpec parseOrdinalDaySpec();
    std::vector<ast::MonthName> parseMonthList();
    ast::MonthName parseMonthNameToken();
    ast::OrdinalPosition parseOrdinalPosition();
    int parseDayNumber(const std::string& what);
    int parseInterval();
    std::vector<ast::TimeOfDay> parseTimeList();
    ast::TimeOfDay parseTime();

    // 语义校验
    void validateIsoDate(const std::string& date, Span span, const std::string& prefix) const;
    void validateNamedDate(ast::MonthName month, int day, Span span) const;
    void validateDayOfMonth(int day, Span span) const;

private:
    std::vector<lexer::Token> m_tokens;
    std::string m_input;
    std::size_t m_pos{0};
};

// 入口：源文本 -> ScheduleData；失败抛 HronError（lex / parse）
ast::ScheduleData parse(const std::string& input);

// 能否成功解析
bool validate(const std::string& input);

} // namespace hron::parser
