#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../Graphics/DrawingSurface.hpp"
#include "../Interpreter/Interpreter.hpp"
#include "../Lexer/Token.hpp"
#include "../Parser/Ast.hpp"
#include "../Runtime/ScriptError.hpp"
#include "../Runtime/Value.hpp"

namespace turtlescript {

struct SessionOptions {
    size_t maxCallDepth{CallStack::kDefaultMaxDepth};
    std::optional<uint32_t> randomSeed;  // fixed seed for reproducible random()
    bool autoPresent{true};              // call surface.present() after every run
};

// Error as seen by hosts: a value copy of the ScriptError that ended a phase.
struct ErrorInfo {
    ErrorKind kind{ErrorKind::InternalError};
    ErrorPhase phase{ErrorPhase::Runtime};
    int line{0};
    int column{0};
    std::string message;
    std::string expected; // parse errors only
    std::string found;    // parse errors only
};

ErrorInfo toErrorInfo(const ScriptError& e);

// "<Phase> error at line L, column C: message"
std::string formatError(const ErrorInfo& error);

struct TokenizeResult {
    std::vector<Token> tokens;
    std::optional<ErrorInfo> error;
    bool ok() const { return !error.has_value(); }
};

struct ParseResult {
    ast::BlockPtr program;
    std::optional<ErrorInfo> error;
    bool ok() const { return !error.has_value(); }
};

struct RunResult {
    std::optional<Value> value; // completion value; never Unit
    std::optional<ErrorInfo> error;
    bool ok() const { return !error.has_value(); }
};

TokenizeResult tokenize(const std::string& source);
ParseResult parse(const std::vector<Token>& tokens);

// One-shot run against a fresh state. The program must outlive the call only.
RunResult execute(const ast::Block& program, DrawingSurface& surface, const SessionOptions& options = {});

/**
 * Session - host-facing interpreter with persistent state
 *
 * Owns the global scope, function table and turtle for one REPL or script
 * run, and every parsed program that defined a function (the table points
 * into them). Errors from each phase come back as ErrorInfo values; a runtime
 * error aborts the current input only and keeps the state built so far.
 */
class Session {
public:
    using TraceCallback = std::function<void(int line, int column, const std::string& kind)>;
    using PrintCallback = Interpreter::PrintCallback;
    using CancelCheck = Interpreter::CancelCheck;

    explicit Session(DrawingSurface& surface, SessionOptions options = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Tokenize, parse and run one chunk of source (a REPL entry or a whole script).
    RunResult evalStatement(const std::string& source);

    // Run an already parsed program on the persistent state.
    RunResult execute(ast::BlockPtr program);

    // Drop variables, functions and turtle state; the surface is reset too.
    void reset();

    // Asynchronous stop; safe to call from a signal handler.
    void stop() { stopRequested_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const { return stopRequested_.load(std::memory_order_relaxed); }

    // Configuration
    void setTrace(bool enabled);
    bool getTrace() const { return interp_.getTrace(); }
    void setTraceCallback(TraceCallback cb) { trace_ = std::move(cb); }
    void setPrintCallback(PrintCallback cb) { interp_.setPrintCallback(std::move(cb)); }
    void setCancelCheck(CancelCheck cb) { interp_.setCancelCheck(std::move(cb)); }
    void setMaxCallDepth(size_t depth) { interp_.setMaxCallDepth(depth); }

    const SessionOptions& options() const { return options_; }
    InterpreterState& state() { return state_; }
    const Environment& globals() const { return state_.globals; }
    const FunctionTable& functions() const { return state_.functions; }
    const BuiltinLibrary& builtins() const { return interp_.builtins(); }
    DrawingSurface& surface() { return surface_; }

private:
    DrawingSurface& surface_;
    SessionOptions options_;
    InterpreterState state_;
    Interpreter interp_;
    std::atomic<bool> stopRequested_{false};
    TraceCallback trace_;

    void traceStatement(const ast::Stmt& stmt);
};

} // namespace turtlescript
