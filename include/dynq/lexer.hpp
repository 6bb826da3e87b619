// Tokenizer for the query language.
#pragma once
#include <string>
#include <string_view>

namespace dynq {

enum class token_kind {
    End,
    Identifier,
    StringLiteral,   // "..." or '...'; the parser decides string vs char
    IntegerLiteral,
    RealLiteral,
    Exclamation,
    Percent,
    Ampersand,
    OpenParen,
    CloseParen,
    Asterisk,
    Plus,
    Comma,
    Minus,
    Dot,
    Slash,
    Colon,
    LessThan,
    Equal,
    GreaterThan,
    Question,
    OpenBracket,
    CloseBracket,
    Bar,
    OpenBrace,
    CloseBrace,
    ExclamationEqual,
    DoubleAmpersand,
    LessThanEqual,
    LessGreater,
    DoubleEqual,
    GreaterThanEqual,
    DoubleBar
};

const char* token_kind_name(token_kind k);

struct token {
    token_kind kind{token_kind::End};
    std::string text;
    int pos{0};
};

// Produces one token per next() call over a borrowed source text. Whitespace
// is skipped; lexical faults raise lex_error at the offending offset.
class lexer {
public:
    explicit lexer(std::string_view text);

    const token& current() const { return tok_; }
    void next();
    std::string_view text() const { return text_; }

private:
    std::string_view text_;
    size_t pos_{0};
    token tok_;
};

} // namespace dynq
