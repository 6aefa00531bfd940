#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "core/hron_error.h"
#include "lexer/lexer.h"

using hron::HronError;
using hron::ErrorKind;
using hron::lexer::Token;
using hron::lexer::TokenKind;

static std::vector<TokenKind> kinds(const std::vector<Token>& tokens) {
    std::vector<TokenKind> out;
    for (const auto& t : tokens) out.push_back(t.kind);
    return out;
}

// 期望抛 LexError，返回错误对象
static HronError expectLexError(const std::string& input) {
    try {
        hron::lexer::tokenize(input);
    } catch (const HronError& e) {
        assert(e.kind() == ErrorKind::Lex);
        return e;
    }
    std::cerr << "expected lex error for: " << input << "\n";
    assert(false);
    return hron::lexError("unreachable", {0, 0}, input);
}

static void test_basic_tokens() {
    auto tokens = hron::lexer::tokenize("every weekday at 9:00, 17:30");
    const std::vector<TokenKind> expected{TokenKind::Every, TokenKind::Weekday, TokenKind::At,
                                          TokenKind::Time, TokenKind::Comma, TokenKind::Time};
    assert(kinds(tokens) == expected);

    assert(tokens[3].hour == 9 && tokens[3].minute == 0);
    assert(tokens[5].hour == 17 && tokens[5].minute == 30);

    // span 是字节偏移
    assert(tokens[0].span == (hron::Span{0, 5}));
    assert(tokens[3].span == (hron::Span{17, 21}));
    std::cout << "[OK] basic tokens\n";
}

static void test_keyword_aliases_and_case() {
    auto tokens = hron::lexer::tokenize("EVERY Mon, tuesday, WED at 08:00");
    assert(tokens[1].kind == TokenKind::DayName && tokens[1].dayName == hron::ast::Weekday::Monday);
    assert(tokens[3].dayName == hron::ast::Weekday::Tuesday);
    assert(tokens[5].dayName == hron::ast::Weekday::Wednesday);

    auto units = hron::lexer::tokenize("min mins minute minutes hour hours hr hrs");
    for (std::size_t i = 0; i < units.size(); ++i) {
        assert(units[i].kind == TokenKind::IntervalUnit);
        assert(units[i].unit == (i < 4 ? hron::ast::IntervalUnit::Minutes : hron::ast::IntervalUnit::Hours));
    }

    auto months = hron::lexer::tokenize("january jan sep september");
    assert(months[0].monthName == hron::ast::MonthName::Jan);
    assert(months[1].monthName == hron::ast::MonthName::Jan);
    assert(months[2].monthName == hron::ast::MonthName::Sep);
    assert(months[3].monthName == hron::ast::MonthName::Sep);
    std::cout << "[OK] keyword aliases\n";
}

static void test_numbers_ordinals_dates() {
    auto tokens = hron::lexer::tokenize("every 3 days 1st 2nd 23rd 15TH 2026-03-08");
    assert(tokens[1].kind == TokenKind::Number && tokens[1].number == 3);
    assert(tokens[3].kind == TokenKind::OrdinalNumber && tokens[3].number == 1);
    assert(tokens[4].kind == TokenKind::OrdinalNumber && tokens[4].number == 2);
    assert(tokens[5].kind == TokenKind::OrdinalNumber && tokens[5].number == 23);
    assert(tokens[6].kind == TokenKind::OrdinalNumber && tokens[6].number == 15);
    assert(tokens[7].kind == TokenKind::IsoDate && tokens[7].text == "2026-03-08");
    std::cout << "[OK] numbers / ordinals / dates\n";
}

static void test_timezone_mode() {
    // in 之后整段非空白都是时区
    auto tokens = hron::lexer::tokenize("every day at 09:00 in America/New_York");
    assert(tokens.back().kind == TokenKind::Timezone);
    assert(tokens.back().text == "America/New_York");

    auto utc = hron::lexer::tokenize("every day at 09:00 in UTC");
    assert(utc.back().text == "UTC");

    // 时区里的标点不再按普通 token 处理
    auto offset = hron::lexer::tokenize("every day at 09:00 in Etc/GMT+5");
    assert(offset.back().kind == TokenKind::Timezone);
    assert(offset.back().text == "Etc/GMT+5");
    std::cout << "[OK] timezone mode\n";
}

static void test_lex_errors() {
    auto e1 = expectLexError("every day at 25:00");
    assert(e1.message() == "invalid time");

    auto e2 = expectLexError("every blursday at 09:00");
    assert(e2.message() == "unknown keyword 'blursday'");
    assert(e2.span() && e2.span()->start == 6 && e2.span()->end == 14);

    auto e3 = expectLexError("every day at 09:00 @");
    assert(e3.message() == "unexpected character '@'");

    // 富文本渲染：源文本 + 插入符
    const std::string rich = e2.displayRich();
    assert(rich.find("error: unknown keyword 'blursday'") == 0);
    assert(rich.find("every blursday at 09:00") != std::string::npos);
    assert(rich.find("^^^^^^^^") != std::string::npos);
    std::cout << "[OK] lex errors\n";
}

int main() {
    test_basic_tokens();
    test_keyword_aliases_and_case();
    test_numbers_ordinals_dates();
    test_timezone_mode();
    test_lex_errors();
    std::cout << "\nALL lexer tests passed\n";
    return 0;
}
