#pragma once
#include <string>
#include "core/hron_error.h"
#include "ast/schedule_types.h"

namespace hron::lexer {

enum class TokenKind {
    // 固定关键字
    Every,
    On,
    At,
    From,
    To,
    In,
    Of,
    The,
    Last,
    Except,
    Until,
    Starting,
    During,
    Year,
    Day,
    Weekday,
    Weekend,
    Weeks,
    Month,
    Nearest,
    Next,
    Previous,
    // 带值的 token
    DayName,
    MonthName,
    Ordinal,
    IntervalUnit,
    Number,
    OrdinalNumber,
    Time,
    IsoDate,
    Timezone,
    Comma,
};

const char* tokenKindName(TokenKind kind);

struct Token {
    TokenKind kind{TokenKind::Comma};
    Span span;

    // 只有与 kind 对应的字段有意义
    ast::Weekday dayName{ast::Weekday::Monday};
    ast::MonthName monthName{ast::MonthName::Jan};
    ast::OrdinalPosition ordinal{ast::OrdinalPosition::First};
    ast::IntervalUnit unit{ast::IntervalUnit::Minutes};
    int number{0};          // Number / OrdinalNumber
    int hour{0};            // Time
    int minute{0};          // Time
    std::string text;       // IsoDate / Timezone
};

} // namespace hron::lexer
