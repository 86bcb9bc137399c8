#include "Lexer.hpp"

#include <cctype>
#include <cstdlib>

namespace turtlescript {

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Number: return "NUMBER";
        case TokenKind::String: return "STRING";
        case TokenKind::Identifier: return "IDENTIFIER";
        case TokenKind::Keyword: return "KEYWORD";
        case TokenKind::Operator: return "OPERATOR";
        case TokenKind::Delimiter: return "DELIMITER";
        case TokenKind::Eof: return "EOF";
    }
    return "UNKNOWN";
}

std::string describeToken(const Token& token) {
    switch (token.kind) {
        case TokenKind::Eof: return "end of input";
        case TokenKind::Number: return "number '" + token.lexeme + "'";
        case TokenKind::String: return "string " + token.lexeme;
        case TokenKind::Identifier: return "identifier '" + token.lexeme + "'";
        case TokenKind::Keyword: return "keyword '" + token.lexeme + "'";
        case TokenKind::Operator:
        case TokenKind::Delimiter:
            if (token.lexeme == "\n") return "newline";
            return "'" + token.lexeme + "'";
    }
    return token.lexeme;
}

Lexer::Lexer()
    : keywords{"var", "let", "if", "else", "while", "for", "to", "step",
               "function", "return", "and", "or", "not", "true", "false"} {}

bool Lexer::isKeyword(const std::string& word) const {
    std::string lower;
    lower.reserve(word.size());
    for (char c : word) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return keywords.count(lower) > 0;
}

std::vector<Token> Lexer::tokenize(const std::string& source) {
    currentSource = source;
    currentPosition = 0;
    currentLine = 1;
    currentColumn = 1;

    std::vector<Token> tokens;
    while (true) {
        skipWhitespace();
        if (isAtEnd()) break;
        tokens.push_back(scanToken());
    }
    tokens.emplace_back(TokenKind::Eof, "", currentLine, currentColumn);
    return tokens;
}

char Lexer::currentChar() const {
    return isAtEnd() ? '\0' : currentSource[currentPosition];
}

char Lexer::peekChar(size_t offset) const {
    size_t pos = currentPosition + offset;
    return pos < currentSource.size() ? currentSource[pos] : '\0';
}

bool Lexer::isAtEnd() const {
    return currentPosition >= currentSource.size();
}

void Lexer::advance() {
    if (isAtEnd()) return;
    if (currentSource[currentPosition] == '\n') {
        ++currentLine;
        currentColumn = 1;
    } else {
        ++currentColumn;
    }
    ++currentPosition;
}

bool Lexer::isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool Lexer::isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool Lexer::isAlphaNumeric(char c) {
    return isAlpha(c) || isDigit(c);
}

void Lexer::skipWhitespace() {
    while (!isAtEnd()) {
        char c = currentChar();
        if (c == ' ' || c == '\t' || c == '\r') {
            advance();
        } else if (c == '#') {
            skipComment();
        } else if (c == '\\') {
            if (!skipLineContinuation()) return;
        } else {
            return;
        }
    }
}

// Backslash, optional blanks, then a line break (or end of input).
bool Lexer::skipLineContinuation() {
    size_t offset = 1;
    while (peekChar(offset) == ' ' || peekChar(offset) == '\t' || peekChar(offset) == '\r') ++offset;
    char after = peekChar(offset);
    if (after != '\n' && after != '\0') return false;
    for (size_t i = 0; i <= offset && !isAtEnd(); ++i) advance();
    return true;
}

void Lexer::skipComment() {
    while (!isAtEnd() && currentChar() != '\n') advance();
}

Token Lexer::scanToken() {
    char c = currentChar();

    if (c == '\n') {
        Token token(TokenKind::Delimiter, "\n", currentLine, currentColumn);
        advance();
        return token;
    }

    if (isDigit(c) || (c == '.' && isDigit(peekChar()))) {
        return scanNumber();
    }

    if (c == '"') {
        return scanString();
    }

    if (isAlpha(c)) {
        return scanIdentifier();
    }

    switch (c) {
        case '(': case ')': case '{': case '}': case ',': case ';': {
            Token token(TokenKind::Delimiter, std::string(1, c), currentLine, currentColumn);
            advance();
            return token;
        }
        default:
            break;
    }

    return scanOperator();
}

Token Lexer::scanNumber() {
    size_t start = currentPosition;
    int line = currentLine;
    int column = currentColumn;

    while (isDigit(currentChar())) advance();

    if (currentChar() == '.') {
        if (!isDigit(peekChar())) {
            error(ErrorKind::MalformedNumber,
                  "Malformed number '" + currentSource.substr(start, currentPosition - start + 1) + "'",
                  line, column);
        }
        advance();
        while (isDigit(currentChar())) advance();
    }

    if (currentChar() == 'e' || currentChar() == 'E') {
        advance();
        if (currentChar() == '+' || currentChar() == '-') advance();
        if (!isDigit(currentChar())) {
            error(ErrorKind::MalformedNumber,
                  "Malformed number '" + currentSource.substr(start, currentPosition - start) +
                  "': missing exponent digits", line, column);
        }
        while (isDigit(currentChar())) advance();
    }

    // 12abc, 1.2.3
    if (isAlpha(currentChar()) || currentChar() == '.') {
        size_t end = currentPosition;
        while (end < currentSource.size() &&
               (isAlphaNumeric(currentSource[end]) || currentSource[end] == '.')) ++end;
        error(ErrorKind::MalformedNumber,
              "Malformed number '" + currentSource.substr(start, end - start) + "'", line, column);
    }

    Token token(TokenKind::Number, currentSource.substr(start, currentPosition - start), line, column);
    token.number = std::strtod(token.lexeme.c_str(), nullptr);
    return token;
}

Token Lexer::scanString() {
    size_t start = currentPosition;
    int line = currentLine;
    int column = currentColumn;
    std::string value;

    advance(); // opening quote
    while (true) {
        if (isAtEnd() || currentChar() == '\n') {
            error(ErrorKind::UnterminatedString, "Unterminated string", line, column);
        }
        char c = currentChar();
        if (c == '"') break;
        if (c == '\\') {
            advance();
            if (isAtEnd() || currentChar() == '\n') {
                error(ErrorKind::UnterminatedString, "Unterminated string", line, column);
            }
            switch (currentChar()) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                default: value += currentChar(); break; // \\ \" and unknown escapes keep the char
            }
            advance();
            continue;
        }
        value += c;
        advance();
    }
    advance(); // closing quote

    Token token(TokenKind::String, currentSource.substr(start, currentPosition - start), line, column);
    token.text = std::move(value);
    return token;
}

Token Lexer::scanIdentifier() {
    size_t start = currentPosition;
    int line = currentLine;
    int column = currentColumn;

    while (isAlphaNumeric(currentChar())) advance();

    std::string word = currentSource.substr(start, currentPosition - start);
    std::string lower;
    lower.reserve(word.size());
    for (char c : word) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (keywords.count(lower)) {
        return Token(TokenKind::Keyword, lower, line, column);
    }
    return Token(TokenKind::Identifier, word, line, column);
}

Token Lexer::scanOperator() {
    int line = currentLine;
    int column = currentColumn;
    char c = currentChar();
    char next = peekChar();

    switch (c) {
        case '=': case '!': case '<': case '>':
            if (next == '=') {
                advance();
                advance();
                return Token(TokenKind::Operator, std::string{c, '='}, line, column);
            }
            if (c == '!') break;
            advance();
            return Token(TokenKind::Operator, std::string(1, c), line, column);
        case '+': case '-': case '*': case '/': case '%': case '^':
            advance();
            return Token(TokenKind::Operator, std::string(1, c), line, column);
        default:
            break;
    }

    if (static_cast<unsigned char>(c) < 0x20) {
        error(ErrorKind::InvalidCharacter,
              "Invalid character (code " + std::to_string(static_cast<int>(c)) + ")", line, column);
    }
    error(ErrorKind::InvalidCharacter, "Invalid character '" + std::string(1, c) + "'", line, column);
}

void Lexer::error(ErrorKind kind, const std::string& message, int line, int column) {
    throw LexError(kind, message, line, column);
}

} // namespace turtlescript
