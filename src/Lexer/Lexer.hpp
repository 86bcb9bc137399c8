#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "Token.hpp"
#include "../Runtime/ScriptError.hpp"

namespace turtlescript {

/**
 * TurtleScript Lexer
 *
 * Single pass over the source text producing positioned tokens terminated by
 * exactly one Eof token. Newlines are significant and come out as Delimiter
 * tokens; a backslash at the end of a line joins it with the next one.
 * Failures throw LexError carrying the line and column of the offending text.
 */
class Lexer {
public:
    Lexer();

    std::vector<Token> tokenize(const std::string& source);

    bool isKeyword(const std::string& word) const;

private:
    std::string currentSource;
    size_t currentPosition{0};
    int currentLine{1};
    int currentColumn{1};

    std::unordered_set<std::string> keywords;

    void advance();
    void skipWhitespace();
    bool skipLineContinuation();
    void skipComment();
    char currentChar() const;
    char peekChar(size_t offset = 1) const;
    bool isAtEnd() const;

    static bool isAlpha(char c);
    static bool isDigit(char c);
    static bool isAlphaNumeric(char c);

    Token scanToken();
    Token scanNumber();
    Token scanString();
    Token scanIdentifier();
    Token scanOperator();

    [[noreturn]] void error(ErrorKind kind, const std::string& message, int line, int column);
};

} // namespace turtlescript
