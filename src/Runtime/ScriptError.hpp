#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <cstdint>

namespace turtlescript {

// Error kinds grouped by the phase that raises them.
enum class ErrorKind : uint8_t {
    // Lexer
    InvalidCharacter,
    UnterminatedString,
    MalformedNumber,
    // Parser
    UnexpectedToken,
    MissingToken,
    InvalidExpression,
    // Interpreter
    UndefinedVariable,
    UndefinedFunction,
    TypeError,
    DivisionByZero,
    ArgumentCountMismatch,
    InvalidArgumentType,
    DomainError,
    RecursionLimit,
    Cancelled,
    // Non-script exception escaping host code
    InternalError
};

enum class ErrorPhase : uint8_t { Lex, Parse, Runtime };

inline ErrorPhase phaseOf(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCharacter:
        case ErrorKind::UnterminatedString:
        case ErrorKind::MalformedNumber:
            return ErrorPhase::Lex;
        case ErrorKind::UnexpectedToken:
        case ErrorKind::MissingToken:
        case ErrorKind::InvalidExpression:
            return ErrorPhase::Parse;
        default:
            return ErrorPhase::Runtime;
    }
}

const char* errorKindName(ErrorKind kind);
const char* errorPhaseName(ErrorPhase phase);

/**
 * ScriptError - base of every language-level error
 *
 * Carries the error kind and the 1-based source position of the offending
 * token or node. Phases throw the derived types; the Session converts them
 * to ErrorInfo values at the API boundary.
 */
class ScriptError : public std::runtime_error {
public:
    ScriptError(ErrorKind kind, const std::string& message, int line = 0, int column = 0)
        : std::runtime_error(message), kind_(kind), line_(line), column_(column) {}

    ErrorKind getKind() const { return kind_; }
    ErrorPhase getPhase() const { return phaseOf(kind_); }
    int getLine() const { return line_; }
    int getColumn() const { return column_; }

    void setPosition(int line, int column) { line_ = line; column_ = column; }

private:
    ErrorKind kind_;
    int line_;
    int column_;
};

class LexError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

class ParseError : public ScriptError {
public:
    ParseError(ErrorKind kind, const std::string& message, int line, int column,
               std::string expected, std::string found)
        : ScriptError(kind, message, line, column),
          expected_(std::move(expected)), found_(std::move(found)) {}

    const std::string& getExpected() const { return expected_; }
    const std::string& getFound() const { return found_; }

private:
    std::string expected_;
    std::string found_;
};

class RuntimeError : public ScriptError {
public:
    using ScriptError::ScriptError;
};

} // namespace turtlescript
