#include "Session.hpp"

#include <iostream>
#include <sstream>
#include <utility>

#include "../Lexer/Lexer.hpp"
#include "../Parser/Parser.hpp"

namespace turtlescript {

ErrorInfo toErrorInfo(const ScriptError& e) {
    ErrorInfo info;
    info.kind = e.getKind();
    info.phase = e.getPhase();
    info.line = e.getLine();
    info.column = e.getColumn();
    info.message = e.what();
    if (const auto* pe = dynamic_cast<const ParseError*>(&e)) {
        info.expected = pe->getExpected();
        info.found = pe->getFound();
    }
    return info;
}

std::string formatError(const ErrorInfo& error) {
    std::ostringstream out;
    out << errorPhaseName(error.phase) << " error";
    if (error.line > 0) {
        out << " at line " << error.line << ", column " << error.column;
    }
    out << ": " << error.message;
    return out.str();
}

TokenizeResult tokenize(const std::string& source) {
    TokenizeResult result;
    try {
        Lexer lexer;
        result.tokens = lexer.tokenize(source);
    } catch (const LexError& e) {
        result.tokens.clear();
        result.error = toErrorInfo(e);
    }
    return result;
}

ParseResult parse(const std::vector<Token>& tokens) {
    ParseResult result;
    try {
        Parser parser(tokens);
        result.program = parser.parseProgram();
    } catch (const ParseError& e) {
        result.program.reset();
        result.error = toErrorInfo(e);
    }
    return result;
}

RunResult execute(const ast::Block& program, DrawingSurface& surface, const SessionOptions& options) {
    RunResult result;
    InterpreterState state;
    if (options.randomSeed) state.rng.seed(*options.randomSeed);

    Interpreter interp(state, surface);
    interp.setMaxCallDepth(options.maxCallDepth);
    try {
        result.value = interp.execute(program);
    } catch (const RuntimeError& e) {
        result.error = toErrorInfo(e);
    } catch (const std::exception& e) {
        std::cerr << "[Session] Internal error: " << e.what() << std::endl;
        ErrorInfo info;
        info.kind = ErrorKind::InternalError;
        info.phase = ErrorPhase::Runtime;
        info.message = std::string("Internal error: ") + e.what();
        result.error = info;
    }
    if (options.autoPresent) surface.present();
    return result;
}

Session::Session(DrawingSurface& surface, SessionOptions options)
    : surface_(surface), options_(std::move(options)), interp_(state_, surface_) {
    if (options_.randomSeed) state_.rng.seed(*options_.randomSeed);
    interp_.setMaxCallDepth(options_.maxCallDepth);
    interp_.setStopFlag(&stopRequested_);
    interp_.setTraceCallback([this](const ast::Stmt& stmt) { traceStatement(stmt); });
}

void Session::setTrace(bool enabled) {
    interp_.setTrace(enabled);
}

void Session::traceStatement(const ast::Stmt& stmt) {
    if (trace_) {
        trace_(stmt.line, stmt.column, ast::nodeKindName(stmt.kind));
    } else {
        std::cerr << "[Session] TRACE " << stmt.line << ":" << stmt.column << " "
                  << ast::nodeKindName(stmt.kind) << std::endl;
    }
}

RunResult Session::evalStatement(const std::string& source) {
    TokenizeResult lexed = tokenize(source);
    if (!lexed.ok()) return {std::nullopt, lexed.error};

    ParseResult parsed = parse(lexed.tokens);
    if (!parsed.ok()) return {std::nullopt, parsed.error};

    return execute(std::move(parsed.program));
}

RunResult Session::execute(ast::BlockPtr program) {
    RunResult result;
    if (!program) return result;

    stopRequested_.store(false, std::memory_order_relaxed);

    try {
        result.value = interp_.execute(ProgramPtr(std::move(program)));
    } catch (const RuntimeError& e) {
        result.error = toErrorInfo(e);
    } catch (const std::exception& e) {
        std::cerr << "[Session] Internal error: " << e.what() << std::endl;
        ErrorInfo info;
        info.kind = ErrorKind::InternalError;
        info.phase = ErrorPhase::Runtime;
        info.message = std::string("Internal error: ") + e.what();
        result.error = info;
    }

    if (options_.autoPresent) surface_.present();
    return result;
}

void Session::reset() {
    state_.reset();
    surface_.resetState();
    surface_.moveTo(0.0, 0.0);
    stopRequested_.store(false, std::memory_order_relaxed);
}

} // namespace turtlescript
