#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "Builtins.hpp"
#include "Turtle.hpp"
#include "../Graphics/DrawingSurface.hpp"
#include "../Parser/Ast.hpp"
#include "../Runtime/CallStack.hpp"
#include "../Runtime/Environment.hpp"
#include "../Runtime/FunctionTable.hpp"
#include "../Runtime/ScriptError.hpp"
#include "../Runtime/Value.hpp"

namespace turtlescript {

// Everything that survives between REPL statements.
struct InterpreterState {
    Environment globals;
    FunctionTable functions;
    TurtleState turtle;
    std::mt19937 rng{std::random_device{}()};

    void reset() {
        globals.clear();
        functions.clear();
        turtle.reset();
    }
};

enum class Flow : uint8_t { Normal, Returned };

struct ExecResult {
    Flow flow{Flow::Normal};
    Value value{Unit{}}; // return value, or the value of an expression statement
};

/**
 * Interpreter - tree-walking evaluator
 *
 * Executes AST nodes against an InterpreterState and a DrawingSurface. Faults
 * are thrown as RuntimeError positioned at the offending node; `return`
 * travels back up as an explicit Flow signal.
 */
class Interpreter {
public:
    using PrintCallback = std::function<void(const std::string&)>;
    using TraceCallback = std::function<void(const ast::Stmt&)>;
    using CancelCheck = std::function<bool()>;

    Interpreter(InterpreterState& state, DrawingSurface& surface);

    // Run a whole program in the global scope. Returns the completion value.
    // Functions it defines borrow their bodies; the caller keeps the program alive.
    std::optional<Value> execute(const ast::Block& program);
    // Functions it defines share ownership of the program, which is freed once
    // none of them remains in the table.
    std::optional<Value> execute(ProgramPtr program);

    // Run one top-level statement; returns its printable result, if any.
    std::optional<Value> evalStatement(const ast::Stmt& stmt);

    Value evaluate(const ast::Expr& expr, Environment& scope);

    // Hooks
    void setPrintCallback(PrintCallback cb) { printCallback_ = std::move(cb); }
    void setTrace(bool enabled) { trace_ = enabled; }
    bool getTrace() const { return trace_; }
    void setTraceCallback(TraceCallback cb) { traceCallback_ = std::move(cb); }
    void setCancelCheck(CancelCheck cb) { cancelCheck_ = std::move(cb); }
    void setStopFlag(const std::atomic<bool>* flag) { stopFlag_ = flag; }
    void setMaxCallDepth(size_t depth) { callStack_.setMaxDepth(depth); }

    InterpreterState& state() { return state_; }
    DrawingSurface& surface() { return surface_; }
    TurtleState& turtle() { return state_.turtle; }
    const CallStack& callStack() const { return callStack_; }
    const BuiltinLibrary& builtins() const { return builtins_; }

    // Output of print(); stdout when no callback is installed.
    void print(const std::string& text);

    // Throws Cancelled when a stop was requested or the cancel check fires.
    void checkCancelled(const ast::Node& at);

private:
    InterpreterState& state_;
    DrawingSurface& surface_;
    BuiltinLibrary builtins_;
    CallStack callStack_;

    PrintCallback printCallback_;
    bool trace_{false};
    TraceCallback traceCallback_;
    CancelCheck cancelCheck_;
    const std::atomic<bool>* stopFlag_{nullptr};
    ProgramPtr program_; // owner of the statements running now, if shared

    // Statements
    ExecResult execStatement(const ast::Stmt& stmt, Environment& scope);
    ExecResult execStatements(const std::vector<ast::StmtPtr>& statements, Environment& scope);
    ExecResult execBlock(const ast::Block& block, Environment& scope);
    ExecResult execIf(const ast::If& node, Environment& scope);
    ExecResult execWhile(const ast::While& node, Environment& scope);
    ExecResult execFor(const ast::ForRange& node, Environment& scope);

    // Expressions
    Value evalBinary(const ast::BinaryOp& node, Environment& scope);
    Value evalUnary(const ast::UnaryOp& node, Environment& scope);
    Value evalCall(const ast::Call& node, Environment& scope);
    Value callUserFunction(const UserFunction& fn, const ast::Call& node, Environment& scope);

    bool toCondition(const Value& v, const ast::Node& at, const char* context);
    double requireNumber(const Value& v, const ast::Node& at, const char* context);
};

} // namespace turtlescript
