#include "Builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

#include "Interpreter.hpp"

namespace turtlescript {

namespace {

std::string toLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

const char* plural(int n) { return n == 1 ? "" : "s"; }

// Move the turtle to (x, y), drawing when the pen is down.
void moveTurtle(Interpreter& interp, double x, double y) {
    TurtleState& t = interp.turtle();
    if (t.penDown) {
        interp.surface().lineTo(x, y);
    } else {
        interp.surface().moveTo(x, y);
    }
    t.x = x;
    t.y = y;
}

void forward(Interpreter& interp, double distance) {
    const TurtleState& t = interp.turtle();
    moveTurtle(interp, t.x + distance * cosDegrees(t.heading), t.y + distance * sinDegrees(t.heading));
}

[[noreturn]] void domainError(const BuiltinArgs& a, const std::string& message) {
    throw RuntimeError(ErrorKind::DomainError, a.call().name + "(): " + message, a.call().line, a.call().column);
}

constexpr double kRadToDeg = 180.0 / kPi;

} // namespace

// ---- Arity ----

bool Arity::accepts(size_t n) const {
    if (!exact.empty()) {
        return std::find(exact.begin(), exact.end(), static_cast<int>(n)) != exact.end();
    }
    if (static_cast<int>(n) < atLeast) return false;
    return !even || n % 2 == 0;
}

std::string Arity::describe() const {
    std::ostringstream out;
    if (!exact.empty()) {
        for (size_t i = 0; i < exact.size(); ++i) {
            if (i) out << (i + 1 == exact.size() ? " or " : ", ");
            out << exact[i];
        }
        out << " argument" << plural(exact.back());
        return out.str();
    }
    out << "at least " << atLeast << " argument" << plural(atLeast);
    if (even) out << " (an even number)";
    return out.str();
}

// ---- BuiltinArgs ----

double BuiltinArgs::number(size_t i) const {
    const Value& v = values_[i];
    if (const auto* n = std::get_if<Number>(&v)) return n->v;
    const ast::Expr& arg = *call_.args[i];
    throw RuntimeError(ErrorKind::InvalidArgumentType,
                       call_.name + "() argument " + std::to_string(i + 1) + " must be a number, got " +
                       typeName(v),
                       arg.line, arg.column);
}

// ---- BuiltinLibrary ----

BuiltinLibrary::BuiltinLibrary() {
    addDrawingCommands();
    addMathFunctions();
}

void BuiltinLibrary::add(const std::string& name, std::vector<std::string> aliases, BuiltinCategory category,
                         Arity arity, std::function<Value(BuiltinArgs&)> fn) {
    size_t slot = builtins_.size();
    builtins_.push_back({name, category, std::move(arity), std::move(fn)});
    index_[name] = slot;
    for (const auto& alias : aliases) index_[alias] = slot;
}

const Builtin* BuiltinLibrary::find(const std::string& name) const {
    auto it = index_.find(toLower(name));
    if (it == index_.end()) return nullptr;
    return &builtins_[it->second];
}

std::vector<std::string> BuiltinLibrary::names(BuiltinCategory category) const {
    std::vector<std::string> out;
    for (const auto& b : builtins_) {
        if (b.category == category) out.push_back(b.name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void BuiltinLibrary::addDrawingCommands() {
    const auto D = BuiltinCategory::Drawing;

    add("forward", {"fd"}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        forward(a.interpreter(), a.number(0));
        return Unit{};
    });

    add("backward", {"bk", "back"}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        forward(a.interpreter(), -a.number(0));
        return Unit{};
    });

    add("left", {"lt"}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().heading += a.number(0);
        return Unit{};
    });

    add("right", {"rt"}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().heading -= a.number(0);
        return Unit{};
    });

    add("penup", {"pu"}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().penDown = false;
        a.interpreter().surface().setPenDown(false);
        return Unit{};
    });

    add("pendown", {"pd"}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().penDown = true;
        a.interpreter().surface().setPenDown(true);
        return Unit{};
    });

    add("goto", {"setpos"}, D, {{2}}, [](BuiltinArgs& a) -> Value {
        moveTurtle(a.interpreter(), a.number(0), a.number(1));
        return Unit{};
    });

    add("setheading", {"seth"}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().heading = a.number(0);
        return Unit{};
    });

    add("home", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        moveTurtle(a.interpreter(), 0.0, 0.0);
        a.interpreter().turtle().heading = TurtleState::kHomeHeading;
        return Unit{};
    });

    add("circle", {}, D, {{1, 3}}, [](BuiltinArgs& a) -> Value {
        double r = a.number(0);
        if (a.size() == 3) {
            a.interpreter().surface().drawCircle(r, a.number(1), a.number(2));
        } else {
            a.interpreter().surface().drawCircle(r, std::nullopt, std::nullopt);
        }
        return Unit{};
    });

    add("rectangle", {"rect"}, D, {{2, 4}}, [](BuiltinArgs& a) -> Value {
        double w = a.number(0);
        double h = a.number(1);
        if (a.size() == 4) {
            a.interpreter().surface().drawRectangle(w, h, a.number(2), a.number(3));
        } else {
            a.interpreter().surface().drawRectangle(w, h, std::nullopt, std::nullopt);
        }
        return Unit{};
    });

    add("line", {}, D, {{4}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().drawLine(a.number(0), a.number(1), a.number(2), a.number(3));
        return Unit{};
    });

    add("polygon", {}, D, {{}, 6, true}, [](BuiltinArgs& a) -> Value {
        std::vector<Point> points;
        points.reserve(a.size() / 2);
        for (size_t i = 0; i + 1 < a.size(); i += 2) {
            points.push_back({a.number(i), a.number(i + 1)});
        }
        a.interpreter().surface().drawPolygon(points);
        return Unit{};
    });

    add("arc", {}, D, {{2, 3, 5}}, [](BuiltinArgs& a) -> Value {
        double w = a.number(0);
        double h = a.number(1);
        double angle = a.size() >= 3 ? a.number(2) : 0.0;
        if (a.size() == 5) {
            a.interpreter().surface().drawArc(w, h, angle, a.number(3), a.number(4));
        } else {
            a.interpreter().surface().drawArc(w, h, angle, std::nullopt, std::nullopt);
        }
        return Unit{};
    });

    add("color", {}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        const Value& v = a.at(0);
        if (const auto* s = std::get_if<Str>(&v)) {
            a.interpreter().surface().setColor(s->v);
        } else if (isNumber(v)) {
            a.interpreter().surface().setColor(formatValue(v));
        } else {
            const ast::Expr& arg = *a.call().args[0];
            throw RuntimeError(ErrorKind::InvalidArgumentType,
                               a.call().name + "() argument 1 must be a colour name or number, got " +
                               typeName(v),
                               arg.line, arg.column);
        }
        return Unit{};
    });

    add("fill", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().setFill(true);
        return Unit{};
    });

    add("nofill", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().setFill(false);
        return Unit{};
    });

    add("width", {}, D, {{1}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().setWidth(a.number(0));
        return Unit{};
    });

    add("clear", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().clear();
        return Unit{};
    });

    add("reset", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().turtle().reset();
        a.interpreter().surface().resetState();
        a.interpreter().surface().moveTo(0.0, 0.0);
        return Unit{};
    });

    add("show", {}, D, {{0}}, [](BuiltinArgs& a) -> Value {
        a.interpreter().surface().present();
        return Unit{};
    });

    // Accepted for scripts written against windowed front ends; surfaces have nothing to hide.
    add("hide", {}, D, {{0}}, [](BuiltinArgs&) -> Value { return Unit{}; });
}

void BuiltinLibrary::addMathFunctions() {
    const auto M = BuiltinCategory::Math;

    add("sin", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{sinDegrees(a.number(0))}; });
    add("cos", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{cosDegrees(a.number(0))}; });
    add("tan", {}, M, {{1}}, [](BuiltinArgs& a) -> Value {
        double deg = a.number(0);
        return Number{sinDegrees(deg) / cosDegrees(deg)};
    });

    add("asin", {}, M, {{1}}, [](BuiltinArgs& a) -> Value {
        double v = a.number(0);
        if (v < -1.0 || v > 1.0) domainError(a, "argument must be between -1 and 1");
        return Number{std::asin(v) * kRadToDeg};
    });
    add("acos", {}, M, {{1}}, [](BuiltinArgs& a) -> Value {
        double v = a.number(0);
        if (v < -1.0 || v > 1.0) domainError(a, "argument must be between -1 and 1");
        return Number{std::acos(v) * kRadToDeg};
    });
    add("atan", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{std::atan(a.number(0)) * kRadToDeg}; });

    add("sqrt", {}, M, {{1}}, [](BuiltinArgs& a) -> Value {
        double v = a.number(0);
        if (v < 0) domainError(a, "square root of a negative number");
        return Number{std::sqrt(v)};
    });

    add("abs", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{std::fabs(a.number(0))}; });
    add("floor", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{std::floor(a.number(0))}; });
    add("ceil", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{std::ceil(a.number(0))}; });
    // Ties go to the even neighbour.
    add("round", {}, M, {{1}}, [](BuiltinArgs& a) -> Value { return Number{std::nearbyint(a.number(0))}; });

    add("min", {}, M, {{2}}, [](BuiltinArgs& a) -> Value { return Number{std::min(a.number(0), a.number(1))}; });
    add("max", {}, M, {{2}}, [](BuiltinArgs& a) -> Value { return Number{std::max(a.number(0), a.number(1))}; });

    add("random", {}, M, {{0}}, [](BuiltinArgs& a) -> Value {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return Number{dist(a.interpreter().state().rng)};
    });

    add("pi", {}, M, {{0}}, [](BuiltinArgs&) -> Value { return Number{kPi}; });
    add("e", {}, M, {{0}}, [](BuiltinArgs&) -> Value { return Number{std::exp(1.0)}; });

    add("xcor", {}, M, {{0}}, [](BuiltinArgs& a) -> Value { return Number{a.interpreter().turtle().x}; });
    add("ycor", {}, M, {{0}}, [](BuiltinArgs& a) -> Value { return Number{a.interpreter().turtle().y}; });
    add("heading", {}, M, {{0}}, [](BuiltinArgs& a) -> Value { return Number{a.interpreter().turtle().heading}; });

    add("print", {}, M, {{}, 0, false}, [](BuiltinArgs& a) -> Value {
        std::string line;
        for (size_t i = 0; i < a.size(); ++i) {
            if (i) line += ' ';
            line += formatValue(a.at(i));
        }
        a.interpreter().print(line);
        return Unit{};
    });
}

} // namespace turtlescript
