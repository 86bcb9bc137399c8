#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../Parser/Ast.hpp"
#include "../Runtime/Value.hpp"

namespace turtlescript {

class Interpreter;

enum class BuiltinCategory : uint8_t { Drawing, Math };

// Accepted argument counts of a built-in.
struct Arity {
    std::vector<int> exact;  // accepted counts; empty means variadic
    int atLeast{0};          // variadic minimum
    bool even{false};        // variadic count must be even

    bool accepts(size_t n) const;
    std::string describe() const;
};

// Evaluated arguments plus the call node, for typed access with positioned errors.
class BuiltinArgs {
public:
    BuiltinArgs(Interpreter& interp, const ast::Call& call, const std::vector<Value>& values)
        : interp_(interp), call_(call), values_(values) {}

    Interpreter& interpreter() const { return interp_; }
    const ast::Call& call() const { return call_; }
    size_t size() const { return values_.size(); }
    const Value& at(size_t i) const { return values_[i]; }

    // Throws InvalidArgumentType positioned at the argument expression.
    double number(size_t i) const;

private:
    Interpreter& interp_;
    const ast::Call& call_;
    const std::vector<Value>& values_;
};

struct Builtin {
    std::string name;        // canonical lower-case name
    BuiltinCategory category;
    Arity arity;
    std::function<Value(BuiltinArgs&)> fn;
};

/**
 * BuiltinLibrary - fixed table of drawing commands and math/utility functions
 *
 * Names (and aliases) are matched case-insensitively. Drawing commands act on
 * the interpreter's turtle and its DrawingSurface; the rest are pure apart
 * from random() and print().
 */
class BuiltinLibrary {
public:
    BuiltinLibrary();

    const Builtin* find(const std::string& name) const;
    bool isBuiltin(const std::string& name) const { return find(name) != nullptr; }

    // Canonical names (aliases excluded), sorted.
    std::vector<std::string> names(BuiltinCategory category) const;

private:
    std::vector<Builtin> builtins_;
    std::unordered_map<std::string, size_t> index_; // lower-case name or alias -> builtins_

    void add(const std::string& name, std::vector<std::string> aliases, BuiltinCategory category,
             Arity arity, std::function<Value(BuiltinArgs&)> fn);
    void addDrawingCommands();
    void addMathFunctions();
};

} // namespace turtlescript
