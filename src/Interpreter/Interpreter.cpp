#include "Interpreter.hpp"

#include <cmath>
#include <iostream>

namespace turtlescript {

using namespace ast;

namespace {

// Pops the frame pushed for a user call on every exit path.
class FrameGuard {
public:
    explicit FrameGuard(CallStack& stack) : stack_(stack) {}
    ~FrameGuard() { stack_.pop(); }
    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

private:
    CallStack& stack_;
};

// Installs the program that owns the statements about to run; restores the previous one on exit.
class ProgramGuard {
public:
    ProgramGuard(ProgramPtr& slot, ProgramPtr next) : slot_(slot), saved_(std::move(slot)) {
        slot_ = std::move(next);
    }
    ~ProgramGuard() { slot_ = std::move(saved_); }
    ProgramGuard(const ProgramGuard&) = delete;
    ProgramGuard& operator=(const ProgramGuard&) = delete;

private:
    ProgramPtr& slot_;
    ProgramPtr saved_;
};

std::string argumentCountMessage(const std::string& name, const std::string& expected, size_t got) {
    return name + "() expects " + expected + ", got " + std::to_string(got);
}

} // namespace

Interpreter::Interpreter(InterpreterState& state, DrawingSurface& surface)
    : state_(state), surface_(surface) {}

void Interpreter::print(const std::string& text) {
    if (printCallback_) {
        printCallback_(text);
    } else {
        std::cout << text << std::endl;
    }
}

void Interpreter::checkCancelled(const Node& at) {
    bool stop = stopFlag_ && stopFlag_->load(std::memory_order_relaxed);
    if (stop || (cancelCheck_ && cancelCheck_())) {
        throw RuntimeError(ErrorKind::Cancelled, "Execution cancelled", at.line, at.column);
    }
}

// ---- Top level ----

std::optional<Value> Interpreter::execute(const Block& program) {
    callStack_.clear();
    std::optional<Value> completion;

    for (const auto& stmt : program.statements) {
        ExecResult r = execStatement(*stmt, state_.globals);
        if (r.flow == Flow::Returned) {
            if (isUnit(r.value)) return std::nullopt;
            return r.value;
        }
        if (stmt->kind == NodeKind::ExprStatement) {
            completion.reset();
            if (!isUnit(r.value)) completion = r.value;
        }
    }
    return completion;
}

std::optional<Value> Interpreter::execute(ProgramPtr program) {
    if (!program) return std::nullopt;
    ProgramGuard owner(program_, program);
    return execute(*program);
}

std::optional<Value> Interpreter::evalStatement(const Stmt& stmt) {
    callStack_.clear();
    ExecResult r = execStatement(stmt, state_.globals);
    if (isUnit(r.value)) return std::nullopt;
    if (r.flow == Flow::Returned || stmt.kind == NodeKind::ExprStatement) return r.value;
    return std::nullopt;
}

// ---- Statements ----

ExecResult Interpreter::execStatements(const std::vector<StmtPtr>& statements, Environment& scope) {
    for (const auto& stmt : statements) {
        ExecResult r = execStatement(*stmt, scope);
        if (r.flow == Flow::Returned) return r;
    }
    return {};
}

ExecResult Interpreter::execBlock(const Block& block, Environment& scope) {
    Environment local(&scope);
    return execStatements(block.statements, local);
}

ExecResult Interpreter::execStatement(const Stmt& stmt, Environment& scope) {
    if (trace_ && traceCallback_) traceCallback_(stmt);

    switch (stmt.kind) {
        case NodeKind::VarDecl: {
            const auto& n = static_cast<const VarDecl&>(stmt);
            Value v = n.init ? evaluate(*n.init, scope) : Value{Unit{}};
            scope.define(n.name, std::move(v));
            return {};
        }
        case NodeKind::Assign: {
            const auto& n = static_cast<const Assign&>(stmt);
            Value v = evaluate(*n.value, scope);
            if (!scope.assign(n.name, std::move(v))) {
                throw RuntimeError(ErrorKind::UndefinedVariable,
                                   "Undefined variable '" + n.name + "' (declare it with var or let)",
                                   n.line, n.column);
            }
            return {};
        }
        case NodeKind::If:
            return execIf(static_cast<const If&>(stmt), scope);
        case NodeKind::While:
            return execWhile(static_cast<const While&>(stmt), scope);
        case NodeKind::ForRange:
            return execFor(static_cast<const ForRange&>(stmt), scope);
        case NodeKind::FunctionDecl:
            state_.functions.defineFunction(static_cast<const FunctionDecl&>(stmt), program_);
            return {};
        case NodeKind::Return: {
            const auto& n = static_cast<const Return&>(stmt);
            Value v = n.value ? evaluate(*n.value, scope) : Value{Unit{}};
            return {Flow::Returned, std::move(v)};
        }
        case NodeKind::ExprStatement: {
            const auto& n = static_cast<const ExprStatement&>(stmt);
            return {Flow::Normal, evaluate(*n.expr, scope)};
        }
        case NodeKind::Block:
            return execBlock(static_cast<const Block&>(stmt), scope);
        default:
            break;
    }
    throw RuntimeError(ErrorKind::TypeError,
                       std::string("Cannot execute ") + nodeKindName(stmt.kind) + " as a statement",
                       stmt.line, stmt.column);
}

ExecResult Interpreter::execIf(const If& node, Environment& scope) {
    Value cond = evaluate(*node.condition, scope);
    if (toCondition(cond, *node.condition, "if condition")) {
        return execBlock(*node.thenBlock, scope);
    }
    if (node.elseBlock) {
        return execBlock(*node.elseBlock, scope);
    }
    return {};
}

ExecResult Interpreter::execWhile(const While& node, Environment& scope) {
    while (true) {
        checkCancelled(node);
        Value cond = evaluate(*node.condition, scope);
        if (!toCondition(cond, *node.condition, "while condition")) break;
        ExecResult r = execBlock(*node.body, scope);
        if (r.flow == Flow::Returned) return r;
    }
    return {};
}

ExecResult Interpreter::execFor(const ForRange& node, Environment& scope) {
    double from = requireNumber(evaluate(*node.from, scope), *node.from, "for start");
    double to = requireNumber(evaluate(*node.to, scope), *node.to, "for end");
    double step = 1.0;
    if (node.step) {
        step = requireNumber(evaluate(*node.step, scope), *node.step, "for step");
    }
    if (step == 0.0) return {};

    for (long long k = 0;; ++k) {
        double i = from + static_cast<double>(k) * step;
        if (!((step > 0 && i <= to) || (step < 0 && i >= to))) break;
        checkCancelled(node);

        Environment iteration(&scope);
        iteration.define(node.var, Number{i});
        ExecResult r = execStatements(node.body->statements, iteration);
        if (r.flow == Flow::Returned) return r;
    }
    return {};
}

// ---- Expressions ----

Value Interpreter::evaluate(const Expr& expr, Environment& scope) {
    switch (expr.kind) {
        case NodeKind::NumberLiteral:
            return Number{static_cast<const NumberLiteral&>(expr).value};
        case NodeKind::StringLiteral:
            return Str{static_cast<const StringLiteral&>(expr).value};
        case NodeKind::BooleanLiteral:
            return Bool{static_cast<const BooleanLiteral&>(expr).value};
        case NodeKind::Identifier: {
            const auto& n = static_cast<const ast::Identifier&>(expr);
            if (const Value* v = scope.lookup(n.name)) return *v;
            throw RuntimeError(ErrorKind::UndefinedVariable, "Undefined variable '" + n.name + "'",
                               n.line, n.column);
        }
        case NodeKind::BinaryOp:
            return evalBinary(static_cast<const BinaryOp&>(expr), scope);
        case NodeKind::UnaryOp:
            return evalUnary(static_cast<const UnaryOp&>(expr), scope);
        case NodeKind::Call:
            return evalCall(static_cast<const Call&>(expr), scope);
        default:
            break;
    }
    throw RuntimeError(ErrorKind::TypeError,
                       std::string("Cannot evaluate ") + nodeKindName(expr.kind) + " as an expression",
                       expr.line, expr.column);
}

bool Interpreter::toCondition(const Value& v, const Node& at, const char* context) {
    if (const auto* b = std::get_if<Bool>(&v)) return b->v;
    if (const auto* n = std::get_if<Number>(&v)) return n->v != 0.0;
    throw RuntimeError(ErrorKind::TypeError,
                       std::string(context) + " must be a boolean or number, got " + typeName(v),
                       at.line, at.column);
}

double Interpreter::requireNumber(const Value& v, const Node& at, const char* context) {
    if (const auto* n = std::get_if<Number>(&v)) return n->v;
    throw RuntimeError(ErrorKind::TypeError,
                       std::string(context) + " must be a number, got " + typeName(v),
                       at.line, at.column);
}

Value Interpreter::evalBinary(const BinaryOp& node, Environment& scope) {
    const char* sym = binaryOperatorSymbol(node.op);

    // Short-circuit operators evaluate the right side only when needed.
    if (node.op == BinaryOperator::And || node.op == BinaryOperator::Or) {
        bool left = toCondition(evaluate(*node.left, scope), *node.left, "operand of logical operator");
        if (node.op == BinaryOperator::And && !left) return Bool{false};
        if (node.op == BinaryOperator::Or && left) return Bool{true};
        bool right = toCondition(evaluate(*node.right, scope), *node.right, "operand of logical operator");
        return Bool{right};
    }

    Value lhs = evaluate(*node.left, scope);
    Value rhs = evaluate(*node.right, scope);

    if (node.op == BinaryOperator::Eq || node.op == BinaryOperator::Ne) {
        if (lhs.index() != rhs.index()) {
            throw RuntimeError(ErrorKind::TypeError,
                               std::string("Cannot compare ") + typeName(lhs) + " and " + typeName(rhs) +
                               " with '" + sym + "'",
                               node.line, node.column);
        }
        bool eq = sameTypeEquals(lhs, rhs);
        return Bool{node.op == BinaryOperator::Eq ? eq : !eq};
    }

    const auto* a = std::get_if<Number>(&lhs);
    const auto* b = std::get_if<Number>(&rhs);
    if (!a || !b) {
        throw RuntimeError(ErrorKind::TypeError,
                           std::string("Operator '") + sym + "' requires numbers, got " + typeName(lhs) +
                           " and " + typeName(rhs),
                           node.line, node.column);
    }
    double x = a->v;
    double y = b->v;

    switch (node.op) {
        case BinaryOperator::Add: return Number{x + y};
        case BinaryOperator::Sub: return Number{x - y};
        case BinaryOperator::Mul: return Number{x * y};
        case BinaryOperator::Div:
            if (y == 0.0) throw RuntimeError(ErrorKind::DivisionByZero, "Division by zero", node.line, node.column);
            return Number{x / y};
        case BinaryOperator::Mod: {
            if (y == 0.0) throw RuntimeError(ErrorKind::DivisionByZero, "Modulo by zero", node.line, node.column);
            double r = std::fmod(x, y);
            if (r != 0.0 && ((r < 0) != (y < 0))) r += y; // floored: sign follows the divisor
            return Number{r};
        }
        case BinaryOperator::Pow: return Number{std::pow(x, y)};
        case BinaryOperator::Lt: return Bool{x < y};
        case BinaryOperator::Gt: return Bool{x > y};
        case BinaryOperator::Le: return Bool{x <= y};
        case BinaryOperator::Ge: return Bool{x >= y};
        default:
            break;
    }
    throw RuntimeError(ErrorKind::TypeError, std::string("Unsupported operator '") + sym + "'",
                       node.line, node.column);
}

Value Interpreter::evalUnary(const UnaryOp& node, Environment& scope) {
    Value v = evaluate(*node.operand, scope);
    if (node.op == UnaryOperator::Not) {
        return Bool{!toCondition(v, *node.operand, "operand of 'not'")};
    }
    if (const auto* n = std::get_if<Number>(&v)) return Number{-n->v};
    throw RuntimeError(ErrorKind::TypeError,
                       std::string("Unary '-' requires a number, got ") + typeName(v),
                       node.line, node.column);
}

Value Interpreter::evalCall(const Call& node, Environment& scope) {
    if (const Builtin* builtin = builtins_.find(node.name)) {
        if (!builtin->arity.accepts(node.args.size())) {
            throw RuntimeError(ErrorKind::ArgumentCountMismatch,
                               argumentCountMessage(node.name, builtin->arity.describe(), node.args.size()),
                               node.line, node.column);
        }
        std::vector<Value> values;
        values.reserve(node.args.size());
        for (const auto& arg : node.args) values.push_back(evaluate(*arg, scope));
        BuiltinArgs args(*this, node, values);
        return builtin->fn(args);
    }

    if (const UserFunction* fn = state_.functions.getFunction(node.name)) {
        return callUserFunction(*fn, node, scope);
    }

    throw RuntimeError(ErrorKind::UndefinedFunction, "Undefined function '" + node.name + "'",
                       node.line, node.column);
}

Value Interpreter::callUserFunction(const UserFunction& fn, const Call& node, Environment& scope) {
    if (node.args.size() != fn.parameters.size()) {
        size_t n = fn.parameters.size();
        throw RuntimeError(ErrorKind::ArgumentCountMismatch,
                           argumentCountMessage(fn.name, std::to_string(n) + (n == 1 ? " argument" : " arguments"),
                                                node.args.size()),
                           node.line, node.column);
    }

    std::vector<Value> values;
    values.reserve(node.args.size());
    for (const auto& arg : node.args) values.push_back(evaluate(*arg, scope));

    checkCancelled(node);

    // Functions see their parameters and the globals, never the caller's locals.
    Environment locals(&state_.globals);
    for (size_t i = 0; i < values.size(); ++i) {
        locals.define(fn.parameters[i], std::move(values[i]));
    }

    if (!callStack_.push({fn.name, &locals, node.line, node.column})) {
        throw RuntimeError(ErrorKind::RecursionLimit,
                           "Maximum recursion depth (" + std::to_string(callStack_.getMaxDepth()) +
                           ") exceeded in '" + fn.name + "'",
                           node.line, node.column);
    }
    FrameGuard guard(callStack_);

    // Hold the defining program: redefining the function inside its own body replaces the table entry.
    ProgramGuard owner(program_, fn.program);
    const Block* body = fn.body;
    ExecResult r = execStatements(body->statements, locals);
    if (r.flow == Flow::Returned) return r.value;
    return Unit{};
}

} // namespace turtlescript
