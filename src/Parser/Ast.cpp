#include "Ast.hpp"

#include <sstream>
#include "../Runtime/Value.hpp"

namespace turtlescript {
namespace ast {

const char* nodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::NumberLiteral: return "NumberLiteral";
        case NodeKind::StringLiteral: return "StringLiteral";
        case NodeKind::BooleanLiteral: return "BooleanLiteral";
        case NodeKind::Identifier: return "Identifier";
        case NodeKind::BinaryOp: return "BinaryOp";
        case NodeKind::UnaryOp: return "UnaryOp";
        case NodeKind::Call: return "Call";
        case NodeKind::VarDecl: return "VarDecl";
        case NodeKind::Assign: return "Assign";
        case NodeKind::If: return "If";
        case NodeKind::While: return "While";
        case NodeKind::ForRange: return "ForRange";
        case NodeKind::FunctionDecl: return "FunctionDecl";
        case NodeKind::Return: return "Return";
        case NodeKind::ExprStatement: return "ExprStatement";
        case NodeKind::Block: return "Block";
    }
    return "Unknown";
}

const char* binaryOperatorSymbol(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::Add: return "+";
        case BinaryOperator::Sub: return "-";
        case BinaryOperator::Mul: return "*";
        case BinaryOperator::Div: return "/";
        case BinaryOperator::Mod: return "%";
        case BinaryOperator::Pow: return "^";
        case BinaryOperator::Eq: return "==";
        case BinaryOperator::Ne: return "!=";
        case BinaryOperator::Lt: return "<";
        case BinaryOperator::Gt: return ">";
        case BinaryOperator::Le: return "<=";
        case BinaryOperator::Ge: return ">=";
        case BinaryOperator::And: return "and";
        case BinaryOperator::Or: return "or";
    }
    return "?";
}

const char* unaryOperatorSymbol(UnaryOperator op) {
    return op == UnaryOperator::Negate ? "neg" : "not";
}

namespace {

bool equalPtr(const Node* a, const Node* b) {
    if (!a || !b) return a == b;
    return structurallyEqual(*a, *b);
}

template <typename T>
bool equalList(const std::vector<std::unique_ptr<T>>& a, const std::vector<std::unique_ptr<T>>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!equalPtr(a[i].get(), b[i].get())) return false;
    }
    return true;
}

void dumpInto(std::ostringstream& out, const Node& node);

void dumpOptional(std::ostringstream& out, const Node* node) {
    if (node) {
        out << ' ';
        dumpInto(out, *node);
    }
}

void dumpInto(std::ostringstream& out, const Node& node) {
    switch (node.kind) {
        case NodeKind::NumberLiteral:
            out << formatValue(Number{static_cast<const NumberLiteral&>(node).value});
            break;
        case NodeKind::StringLiteral:
            out << reprValue(Str{static_cast<const StringLiteral&>(node).value});
            break;
        case NodeKind::BooleanLiteral:
            out << (static_cast<const BooleanLiteral&>(node).value ? "true" : "false");
            break;
        case NodeKind::Identifier:
            out << static_cast<const Identifier&>(node).name;
            break;
        case NodeKind::BinaryOp: {
            const auto& n = static_cast<const BinaryOp&>(node);
            out << '(' << binaryOperatorSymbol(n.op) << ' ';
            dumpInto(out, *n.left);
            out << ' ';
            dumpInto(out, *n.right);
            out << ')';
            break;
        }
        case NodeKind::UnaryOp: {
            const auto& n = static_cast<const UnaryOp&>(node);
            out << '(' << unaryOperatorSymbol(n.op) << ' ';
            dumpInto(out, *n.operand);
            out << ')';
            break;
        }
        case NodeKind::Call: {
            const auto& n = static_cast<const Call&>(node);
            out << "(call " << n.name;
            for (const auto& a : n.args) dumpOptional(out, a.get());
            out << ')';
            break;
        }
        case NodeKind::VarDecl: {
            const auto& n = static_cast<const VarDecl&>(node);
            out << "(var " << n.name;
            dumpOptional(out, n.init.get());
            out << ')';
            break;
        }
        case NodeKind::Assign: {
            const auto& n = static_cast<const Assign&>(node);
            out << "(set " << n.name << ' ';
            dumpInto(out, *n.value);
            out << ')';
            break;
        }
        case NodeKind::If: {
            const auto& n = static_cast<const If&>(node);
            out << "(if ";
            dumpInto(out, *n.condition);
            dumpOptional(out, n.thenBlock.get());
            dumpOptional(out, n.elseBlock.get());
            out << ')';
            break;
        }
        case NodeKind::While: {
            const auto& n = static_cast<const While&>(node);
            out << "(while ";
            dumpInto(out, *n.condition);
            dumpOptional(out, n.body.get());
            out << ')';
            break;
        }
        case NodeKind::ForRange: {
            const auto& n = static_cast<const ForRange&>(node);
            out << "(for " << n.var;
            dumpOptional(out, n.from.get());
            dumpOptional(out, n.to.get());
            if (n.step) {
                out << " (step ";
                dumpInto(out, *n.step);
                out << ')';
            }
            dumpOptional(out, n.body.get());
            out << ')';
            break;
        }
        case NodeKind::FunctionDecl: {
            const auto& n = static_cast<const FunctionDecl&>(node);
            out << "(function " << n.name << " (";
            for (size_t i = 0; i < n.params.size(); ++i) {
                if (i) out << ' ';
                out << n.params[i];
            }
            out << ')';
            dumpOptional(out, n.body.get());
            out << ')';
            break;
        }
        case NodeKind::Return: {
            const auto& n = static_cast<const Return&>(node);
            out << "(return";
            dumpOptional(out, n.value.get());
            out << ')';
            break;
        }
        case NodeKind::ExprStatement: {
            const auto& n = static_cast<const ExprStatement&>(node);
            out << "(expr ";
            dumpInto(out, *n.expr);
            out << ')';
            break;
        }
        case NodeKind::Block: {
            const auto& n = static_cast<const Block&>(node);
            out << "(block";
            for (const auto& s : n.statements) dumpOptional(out, s.get());
            out << ')';
            break;
        }
    }
}

} // namespace

bool structurallyEqual(const Node& a, const Node& b) {
    if (a.kind != b.kind || a.line != b.line || a.column != b.column) return false;

    switch (a.kind) {
        case NodeKind::NumberLiteral:
            return static_cast<const NumberLiteral&>(a).value == static_cast<const NumberLiteral&>(b).value;
        case NodeKind::StringLiteral:
            return static_cast<const StringLiteral&>(a).value == static_cast<const StringLiteral&>(b).value;
        case NodeKind::BooleanLiteral:
            return static_cast<const BooleanLiteral&>(a).value == static_cast<const BooleanLiteral&>(b).value;
        case NodeKind::Identifier:
            return static_cast<const Identifier&>(a).name == static_cast<const Identifier&>(b).name;
        case NodeKind::BinaryOp: {
            const auto& x = static_cast<const BinaryOp&>(a);
            const auto& y = static_cast<const BinaryOp&>(b);
            return x.op == y.op && equalPtr(x.left.get(), y.left.get()) && equalPtr(x.right.get(), y.right.get());
        }
        case NodeKind::UnaryOp: {
            const auto& x = static_cast<const UnaryOp&>(a);
            const auto& y = static_cast<const UnaryOp&>(b);
            return x.op == y.op && equalPtr(x.operand.get(), y.operand.get());
        }
        case NodeKind::Call: {
            const auto& x = static_cast<const Call&>(a);
            const auto& y = static_cast<const Call&>(b);
            return x.name == y.name && equalList(x.args, y.args);
        }
        case NodeKind::VarDecl: {
            const auto& x = static_cast<const VarDecl&>(a);
            const auto& y = static_cast<const VarDecl&>(b);
            return x.name == y.name && equalPtr(x.init.get(), y.init.get());
        }
        case NodeKind::Assign: {
            const auto& x = static_cast<const Assign&>(a);
            const auto& y = static_cast<const Assign&>(b);
            return x.name == y.name && equalPtr(x.value.get(), y.value.get());
        }
        case NodeKind::If: {
            const auto& x = static_cast<const If&>(a);
            const auto& y = static_cast<const If&>(b);
            return equalPtr(x.condition.get(), y.condition.get()) &&
                   equalPtr(x.thenBlock.get(), y.thenBlock.get()) &&
                   equalPtr(x.elseBlock.get(), y.elseBlock.get());
        }
        case NodeKind::While: {
            const auto& x = static_cast<const While&>(a);
            const auto& y = static_cast<const While&>(b);
            return equalPtr(x.condition.get(), y.condition.get()) && equalPtr(x.body.get(), y.body.get());
        }
        case NodeKind::ForRange: {
            const auto& x = static_cast<const ForRange&>(a);
            const auto& y = static_cast<const ForRange&>(b);
            return x.var == y.var && equalPtr(x.from.get(), y.from.get()) &&
                   equalPtr(x.to.get(), y.to.get()) && equalPtr(x.step.get(), y.step.get()) &&
                   equalPtr(x.body.get(), y.body.get());
        }
        case NodeKind::FunctionDecl: {
            const auto& x = static_cast<const FunctionDecl&>(a);
            const auto& y = static_cast<const FunctionDecl&>(b);
            return x.name == y.name && x.params == y.params && equalPtr(x.body.get(), y.body.get());
        }
        case NodeKind::Return:
            return equalPtr(static_cast<const Return&>(a).value.get(), static_cast<const Return&>(b).value.get());
        case NodeKind::ExprStatement:
            return equalPtr(static_cast<const ExprStatement&>(a).expr.get(),
                            static_cast<const ExprStatement&>(b).expr.get());
        case NodeKind::Block:
            return equalList(static_cast<const Block&>(a).statements, static_cast<const Block&>(b).statements);
    }
    return false;
}

std::string dump(const Node& node) {
    std::ostringstream out;
    dumpInto(out, node);
    return out.str();
}

} // namespace ast
} // namespace turtlescript
