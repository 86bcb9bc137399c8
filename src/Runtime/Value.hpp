// Dynamically typed script values.
#pragma once

#include <string>
#include <type_traits>
#include <variant>

namespace turtlescript {

struct Number { double v{}; };
struct Str { std::string v; };
struct Bool { bool v{}; };
struct Unit {};

using Value = std::variant<Number, Str, Bool, Unit>;

inline bool isNumber(const Value& v) { return std::holds_alternative<Number>(v); }
inline bool isString(const Value& v) { return std::holds_alternative<Str>(v); }
inline bool isBool(const Value& v) { return std::holds_alternative<Bool>(v); }
inline bool isUnit(const Value& v) { return std::holds_alternative<Unit>(v); }

inline const char* typeName(const Value& v) {
    return std::visit([](auto&& x) -> const char* {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Number>) return "number";
        else if constexpr (std::is_same_v<T, Str>) return "string";
        else if constexpr (std::is_same_v<T, Bool>) return "boolean";
        else return "none";
    }, v);
}

// Equality for two values of the same alternative; callers check the types first.
inline bool sameTypeEquals(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;
    return std::visit([&b](auto&& x) -> bool {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Unit>) return true;
        else return x.v == std::get<T>(b).v;
    }, a);
}

// Text used by print() and the REPL: integral numbers print without a fraction.
std::string formatValue(const Value& v);

// Like formatValue, but strings are quoted.
std::string reprValue(const Value& v);

} // namespace turtlescript
