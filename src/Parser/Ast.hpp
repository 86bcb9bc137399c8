// Abstract syntax tree for TurtleScript programs.
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace turtlescript {
namespace ast {

enum class NodeKind : uint8_t {
    // Expressions
    NumberLiteral,
    StringLiteral,
    BooleanLiteral,
    Identifier,
    BinaryOp,
    UnaryOp,
    Call,
    // Statements
    VarDecl,
    Assign,
    If,
    While,
    ForRange,
    FunctionDecl,
    Return,
    ExprStatement,
    Block
};

enum class BinaryOperator : uint8_t {
    Add, Sub, Mul, Div, Mod, Pow,
    Eq, Ne, Lt, Gt, Le, Ge,
    And, Or
};

enum class UnaryOperator : uint8_t { Negate, Not };

const char* nodeKindName(NodeKind kind);
const char* binaryOperatorSymbol(BinaryOperator op);
const char* unaryOperatorSymbol(UnaryOperator op);

struct Node {
    NodeKind kind;
    int line;
    int column;

    virtual ~Node() = default;

    bool isExpression() const { return kind <= NodeKind::Call; }

protected:
    Node(NodeKind k, int l, int c) : kind(k), line(l), column(c) {}
};

struct Expr : Node {
protected:
    using Node::Node;
};

struct Stmt : Node {
protected:
    using Node::Node;
};

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

// ---- Expressions ----

struct NumberLiteral : Expr {
    double value;
    NumberLiteral(double v, int l, int c) : Expr(NodeKind::NumberLiteral, l, c), value(v) {}
};

struct StringLiteral : Expr {
    std::string value;
    StringLiteral(std::string v, int l, int c)
        : Expr(NodeKind::StringLiteral, l, c), value(std::move(v)) {}
};

struct BooleanLiteral : Expr {
    bool value;
    BooleanLiteral(bool v, int l, int c) : Expr(NodeKind::BooleanLiteral, l, c), value(v) {}
};

struct Identifier : Expr {
    std::string name;
    Identifier(std::string n, int l, int c)
        : Expr(NodeKind::Identifier, l, c), name(std::move(n)) {}
};

// Position is the operator token.
struct BinaryOp : Expr {
    ExprPtr left;
    BinaryOperator op;
    ExprPtr right;
    BinaryOp(ExprPtr lhs, BinaryOperator o, ExprPtr rhs, int l, int c)
        : Expr(NodeKind::BinaryOp, l, c), left(std::move(lhs)), op(o), right(std::move(rhs)) {}
};

struct UnaryOp : Expr {
    UnaryOperator op;
    ExprPtr operand;
    UnaryOp(UnaryOperator o, ExprPtr e, int l, int c)
        : Expr(NodeKind::UnaryOp, l, c), op(o), operand(std::move(e)) {}
};

// Position is the callee name.
struct Call : Expr {
    std::string name;
    std::vector<ExprPtr> args;
    Call(std::string n, std::vector<ExprPtr> a, int l, int c)
        : Expr(NodeKind::Call, l, c), name(std::move(n)), args(std::move(a)) {}
};

// ---- Statements ----

struct Block : Stmt {
    std::vector<StmtPtr> statements;
    Block(int l, int c) : Stmt(NodeKind::Block, l, c) {}
};

using BlockPtr = std::unique_ptr<Block>;

struct VarDecl : Stmt {
    std::string name;
    ExprPtr init; // may be null
    VarDecl(std::string n, ExprPtr e, int l, int c)
        : Stmt(NodeKind::VarDecl, l, c), name(std::move(n)), init(std::move(e)) {}
};

struct Assign : Stmt {
    std::string name;
    ExprPtr value;
    Assign(std::string n, ExprPtr e, int l, int c)
        : Stmt(NodeKind::Assign, l, c), name(std::move(n)), value(std::move(e)) {}
};

// An `else if` chain is an else block holding a single If.
struct If : Stmt {
    ExprPtr condition;
    BlockPtr thenBlock;
    BlockPtr elseBlock; // may be null
    If(ExprPtr cond, BlockPtr thenB, BlockPtr elseB, int l, int c)
        : Stmt(NodeKind::If, l, c), condition(std::move(cond)),
          thenBlock(std::move(thenB)), elseBlock(std::move(elseB)) {}
};

struct While : Stmt {
    ExprPtr condition;
    BlockPtr body;
    While(ExprPtr cond, BlockPtr b, int l, int c)
        : Stmt(NodeKind::While, l, c), condition(std::move(cond)), body(std::move(b)) {}
};

struct ForRange : Stmt {
    std::string var;
    ExprPtr from;
    ExprPtr to;
    ExprPtr step; // may be null
    BlockPtr body;
    ForRange(std::string v, ExprPtr f, ExprPtr t, ExprPtr s, BlockPtr b, int l, int c)
        : Stmt(NodeKind::ForRange, l, c), var(std::move(v)), from(std::move(f)),
          to(std::move(t)), step(std::move(s)), body(std::move(b)) {}
};

struct FunctionDecl : Stmt {
    std::string name;
    std::vector<std::string> params;
    BlockPtr body;
    FunctionDecl(std::string n, std::vector<std::string> p, BlockPtr b, int l, int c)
        : Stmt(NodeKind::FunctionDecl, l, c), name(std::move(n)),
          params(std::move(p)), body(std::move(b)) {}
};

struct Return : Stmt {
    ExprPtr value; // may be null
    Return(ExprPtr e, int l, int c) : Stmt(NodeKind::Return, l, c), value(std::move(e)) {}
};

struct ExprStatement : Stmt {
    ExprPtr expr;
    ExprStatement(ExprPtr e, int l, int c)
        : Stmt(NodeKind::ExprStatement, l, c), expr(std::move(e)) {}
};

// Deep comparison of kind, payload, children and source positions.
bool structurallyEqual(const Node& a, const Node& b);

// Deterministic S-expression rendering, e.g. "(block (var x (+ 1 (* 2 3))))".
std::string dump(const Node& node);

} // namespace ast
} // namespace turtlescript
