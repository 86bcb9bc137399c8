#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace turtlescript {

enum class TokenKind : uint8_t {
    Number,
    String,
    Identifier,
    Keyword,
    Operator,
    Delimiter,   // ( ) { } , ; and newline
    Eof
};

const char* tokenKindName(TokenKind kind);

struct Token {
    TokenKind kind{TokenKind::Eof};
    std::string lexeme;     // source text; keywords lower-cased, newline is "\n"
    int line{1};
    int column{1};
    double number{0.0};     // decoded value of a Number token
    std::string text;       // decoded contents of a String token

    Token() = default;
    Token(TokenKind k, std::string lex, int l, int c)
        : kind(k), lexeme(std::move(lex)), line(l), column(c) {}

    bool is(TokenKind k) const { return kind == k; }
    bool is(TokenKind k, std::string_view lex) const { return kind == k && lexeme == lex; }

    bool operator==(const Token& o) const {
        return kind == o.kind && lexeme == o.lexeme && line == o.line && column == o.column &&
               number == o.number && text == o.text;
    }
    bool operator!=(const Token& o) const { return !(*this == o); }
};

// Human-readable description for diagnostics, e.g. "identifier 'foo'", "newline".
std::string describeToken(const Token& token);

} // namespace turtlescript
