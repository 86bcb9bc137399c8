#include "ScriptError.hpp"

namespace turtlescript {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidCharacter: return "InvalidCharacter";
        case ErrorKind::UnterminatedString: return "UnterminatedString";
        case ErrorKind::MalformedNumber: return "MalformedNumber";
        case ErrorKind::UnexpectedToken: return "UnexpectedToken";
        case ErrorKind::MissingToken: return "MissingToken";
        case ErrorKind::InvalidExpression: return "InvalidExpression";
        case ErrorKind::UndefinedVariable: return "UndefinedVariable";
        case ErrorKind::UndefinedFunction: return "UndefinedFunction";
        case ErrorKind::TypeError: return "TypeError";
        case ErrorKind::DivisionByZero: return "DivisionByZero";
        case ErrorKind::ArgumentCountMismatch: return "ArgumentCountMismatch";
        case ErrorKind::InvalidArgumentType: return "InvalidArgumentType";
        case ErrorKind::DomainError: return "DomainError";
        case ErrorKind::RecursionLimit: return "RecursionLimit";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::InternalError: return "InternalError";
    }
    return "Unknown";
}

const char* errorPhaseName(ErrorPhase phase) {
    switch (phase) {
        case ErrorPhase::Lex: return "Lexer";
        case ErrorPhase::Parse: return "Parser";
        case ErrorPhase::Runtime: return "Runtime";
    }
    return "Unknown";
}

} // namespace turtlescript
