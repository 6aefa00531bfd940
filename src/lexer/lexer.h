#pragma once
#include <string>
#include <vector>
#include "token.h"

namespace hron::lexer {

// 源文本 -> token 流。词表是封闭的，遇到未知单词直接报 LexError
class Lexer {
public:
    explicit Lexer(std::string input);

    std::vector<Token> tokenize();

private:
    bool is_eof() const;
    char peek() const;
    void skip_whitespace();

    Token lexTimezone();
    Token lexNumberOrTimeOrDate();
    Token lexWord();

    HronError fail(const std::string& message, Span span) const;

private:
    std::string m_input;
    std::size_t m_pos{0};
    bool m_afterIn{false};   // 刚读到 in，下一个 token 整段当作时区
};

std::vector<Token> tokenize(const std::string& input);

} // namespace hron::lexer
