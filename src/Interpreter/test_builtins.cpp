#include <catch2/catch_all.hpp>
#include <algorithm>
#include "Builtins.hpp"
#include "Interpreter.hpp"
#include "../Graphics/RecordingSurface.hpp"
#include "../Lexer/Lexer.hpp"
#include "../Parser/Parser.hpp"

using namespace turtlescript;

namespace {

struct Fixture {
    InterpreterState state;
    RecordingSurface surface;
    Interpreter interp{state, surface};
    std::vector<ast::BlockPtr> programs;

    std::optional<Value> run(const std::string& source) {
        Lexer lexer;
        Parser parser(lexer.tokenize(source));
        programs.push_back(parser.parseProgram());
        return interp.execute(*programs.back());
    }

    double number(const std::string& source) {
        auto v = run(source);
        REQUIRE(v.has_value());
        REQUIRE(isNumber(*v));
        return std::get<Number>(*v).v;
    }

    ErrorKind errorKind(const std::string& source) {
        try {
            run(source);
        } catch (const RuntimeError& e) {
            return e.getKind();
        }
        FAIL("expected a RuntimeError for: " << source);
        return ErrorKind::InternalError;
    }

    std::vector<std::string> trace() const {
        std::vector<std::string> out;
        for (const auto& c : surface.calls()) out.push_back(formatDrawCall(c));
        return out;
    }
};

} // namespace

TEST_CASE("BuiltinLibrary Lookup", "[builtins]") {
    BuiltinLibrary lib;

    SECTION("Aliases resolve to the canonical entry") {
        REQUIRE(lib.find("fd") == lib.find("forward"));
        REQUIRE(lib.find("bk") == lib.find("backward"));
        REQUIRE(lib.find("back") == lib.find("backward"));
        REQUIRE(lib.find("lt") == lib.find("left"));
        REQUIRE(lib.find("rt") == lib.find("right"));
        REQUIRE(lib.find("pu") == lib.find("penup"));
        REQUIRE(lib.find("pd") == lib.find("pendown"));
        REQUIRE(lib.find("rect") == lib.find("rectangle"));
        REQUIRE(lib.find("forward")->name == "forward");
    }

    SECTION("Names are case-insensitive") {
        REQUIRE(lib.find("FORWARD") != nullptr);
        REQUIRE(lib.find("Sqrt") == lib.find("sqrt"));
        REQUIRE(lib.isBuiltin("PenUp"));
        REQUIRE_FALSE(lib.isBuiltin("square"));
    }

    SECTION("Categories") {
        auto drawing = lib.names(BuiltinCategory::Drawing);
        auto math = lib.names(BuiltinCategory::Math);
        REQUIRE(std::find(drawing.begin(), drawing.end(), "circle") != drawing.end());
        REQUIRE(std::find(math.begin(), math.end(), "sqrt") != math.end());
        REQUIRE(std::find(math.begin(), math.end(), "circle") == math.end());
        REQUIRE(std::is_sorted(drawing.begin(), drawing.end()));
    }

    SECTION("Arity descriptions") {
        REQUIRE(lib.find("forward")->arity.describe() == "1 argument");
        REQUIRE(lib.find("circle")->arity.describe() == "1 or 3 arguments");
        REQUIRE(lib.find("rectangle")->arity.describe() == "2 or 4 arguments");
        REQUIRE(lib.find("polygon")->arity.describe() == "at least 6 arguments (an even number)");
        REQUIRE(lib.find("penup")->arity.describe() == "0 arguments");
    }

    SECTION("Arity acceptance") {
        const Arity& polygon = lib.find("polygon")->arity;
        REQUIRE_FALSE(polygon.accepts(4));
        REQUIRE(polygon.accepts(6));
        REQUIRE_FALSE(polygon.accepts(7));
        REQUIRE(polygon.accepts(8));
        REQUIRE(lib.find("print")->arity.accepts(0));
        REQUIRE(lib.find("print")->arity.accepts(5));
    }
}

TEST_CASE("Turtle Movement", "[builtins][turtle]") {
    Fixture f;

    SECTION("Turtle starts at the origin facing up") {
        f.run("forward(100)");
        REQUIRE(f.trace() == std::vector<std::string>{"lineTo(0, 100)"});
    }

    SECTION("Square returns to the start") {
        f.run("for i = 1 to 4 { forward(100)\n right(90) }");
        REQUIRE(f.trace() == std::vector<std::string>{"lineTo(0, 100)", "lineTo(100, 100)",
                                                      "lineTo(100, 0)", "lineTo(0, 0)"});
        REQUIRE(f.state.turtle.x == 0.0);
        REQUIRE(f.state.turtle.y == 0.0);
        REQUIRE(f.state.turtle.heading == Catch::Approx(-270.0));
    }

    SECTION("Left turns counter-clockwise") {
        f.run("left(90)\nfd(10)");
        REQUIRE(f.trace() == std::vector<std::string>{"lineTo(-10, 0)"});
    }

    SECTION("Backward moves against the heading") {
        f.run("bk(25)");
        REQUIRE(f.trace() == std::vector<std::string>{"lineTo(0, -25)"});
    }

    SECTION("Pen up moves without drawing") {
        f.run("penup()\nfd(50)\npendown()\nfd(10)");
        REQUIRE(f.trace() == std::vector<std::string>{"setPenDown(false)", "moveTo(0, 50)",
                                                      "setPenDown(true)", "lineTo(0, 60)"});
    }

    SECTION("Goto and setheading") {
        f.run("pu()\ngoto(30, -40)\nsetheading(0)\npd()\nfd(5)");
        REQUIRE(f.surface.last(DrawOp::LineTo)->args == std::vector<double>{35.0, -40.0});
        REQUIRE(f.number("xcor()") == 35.0);
        REQUIRE(f.number("ycor()") == -40.0);
        REQUIRE(f.number("heading()") == 0.0);
    }

    SECTION("Diagonal movement") {
        f.run("rt(45)\nfd(10)");
        const DrawCall* c = f.surface.last(DrawOp::LineTo);
        REQUIRE(c != nullptr);
        REQUIRE(c->args[0] == Catch::Approx(7.0710678));
        REQUIRE(c->args[1] == Catch::Approx(7.0710678));
    }

    SECTION("Home returns to the origin facing up") {
        f.run("rt(30)\nfd(10)\nhome()");
        REQUIRE(f.state.turtle.x == 0.0);
        REQUIRE(f.state.turtle.y == 0.0);
        REQUIRE(f.state.turtle.heading == 90.0);
        REQUIRE(f.surface.last(DrawOp::LineTo)->args == std::vector<double>{0.0, 0.0});
    }

    SECTION("Reset restores the turtle and the surface") {
        f.run("pu()\nrt(10)\nfd(20)\nreset()");
        REQUIRE(f.state.turtle.penDown);
        REQUIRE(f.state.turtle.heading == 90.0);
        REQUIRE(f.state.turtle.x == 0.0);
        auto t = f.trace();
        REQUIRE(t[t.size() - 2] == "resetState()");
        REQUIRE(t.back() == "moveTo(0, 0)");
    }
}

TEST_CASE("Shape Commands", "[builtins]") {
    Fixture f;

    SECTION("Circle at the current point and at an explicit centre") {
        f.run("circle(50)\ncircle(10, 5, 6)");
        REQUIRE(f.trace() == std::vector<std::string>{"drawCircle(50)", "drawCircle(10, 5, 6)"});
    }

    SECTION("Circle does not move the turtle") {
        f.run("circle(10, 100, 100)");
        REQUIRE(f.state.turtle.x == 0.0);
        REQUIRE(f.state.turtle.y == 0.0);
    }

    SECTION("Rectangle, line, polygon and arc") {
        f.run("rect(20, 10)\nrectangle(1, 2, 3, 4)\nline(0, 0, 10, 10)\npolygon(0, 0, 10, 0, 5, 5)\narc(40, 20)\narc(4, 2, 45)");
        REQUIRE(f.trace() == std::vector<std::string>{
            "drawRectangle(20, 10)", "drawRectangle(1, 2, 3, 4)", "drawLine(0, 0, 10, 10)",
            "drawPolygon(0, 0, 10, 0, 5, 5)", "drawArc(40, 20, 0)", "drawArc(4, 2, 45)"});
    }

    SECTION("Arc at an explicit centre") {
        f.run("arc(40, 20, 30, 5, -6)");
        REQUIRE(f.trace() == std::vector<std::string>{"drawArc(40, 20, 30, 5, -6)"});
        REQUIRE(f.state.turtle.x == 0.0);
        REQUIRE(f.state.turtle.y == 0.0);
    }

    SECTION("Hide draws nothing") {
        f.run("hide()\nHIDE()");
        REQUIRE(f.surface.calls().empty());
    }

    SECTION("Pen attributes") {
        f.run("color(\"red\")\ncolor(4)\nwidth(3)\nfill()\nnofill()\nclear()\nshow()");
        REQUIRE(f.trace() == std::vector<std::string>{"setColor(red)", "setColor(4)", "setWidth(3)",
                                                      "setFill(true)", "setFill(false)", "clear()",
                                                      "present()"});
    }
}

TEST_CASE("Builtin Argument Checking", "[builtins]") {
    Fixture f;

    SECTION("Wrong count") {
        REQUIRE(f.errorKind("forward()") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.errorKind("circle(1, 2)") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.errorKind("polygon(0, 0, 1, 1)") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.errorKind("polygon(0, 0, 1, 1, 2, 2, 3)") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.errorKind("arc(1, 2, 3, 4)") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.errorKind("hide(1)") == ErrorKind::ArgumentCountMismatch);
        REQUIRE(f.surface.calls().empty());
    }

    SECTION("Message text") {
        try {
            f.run("circle(1, 2)");
            FAIL("expected RuntimeError");
        } catch (const RuntimeError& e) {
            REQUIRE(std::string(e.what()) == "circle() expects 1 or 3 arguments, got 2");
        }
        try {
            f.run("arc(1, 2, 3, 4)");
            FAIL("expected RuntimeError");
        } catch (const RuntimeError& e) {
            REQUIRE(std::string(e.what()) == "arc() expects 2, 3 or 5 arguments, got 4");
        }
    }

    SECTION("Wrong type is reported at the argument") {
        try {
            f.run("forward(\"far\")");
            FAIL("expected RuntimeError");
        } catch (const RuntimeError& e) {
            REQUIRE(e.getKind() == ErrorKind::InvalidArgumentType);
            REQUIRE(e.getColumn() == 9);
            REQUIRE(std::string(e.what()) == "forward() argument 1 must be a number, got string");
        }
        REQUIRE(f.errorKind("color(true)") == ErrorKind::InvalidArgumentType);
    }
}

TEST_CASE("Math Functions", "[builtins][math]") {
    Fixture f;

    SECTION("Degree trigonometry") {
        REQUIRE(f.number("sin(90)") == 1.0);
        REQUIRE(f.number("cos(180)") == -1.0);
        REQUIRE(f.number("sin(180)") == 0.0);
        REQUIRE(f.number("cos(-90)") == 0.0);
        REQUIRE(f.number("sin(30)") == Catch::Approx(0.5));
        REQUIRE(f.number("tan(45)") == Catch::Approx(1.0));
        REQUIRE(f.number("asin(1)") == Catch::Approx(90.0));
        REQUIRE(f.number("acos(0)") == Catch::Approx(90.0));
        REQUIRE(f.number("atan(1)") == Catch::Approx(45.0));
    }

    SECTION("Rounding family") {
        REQUIRE(f.number("floor(-2.5)") == -3.0);
        REQUIRE(f.number("ceil(2.1)") == 3.0);
        REQUIRE(f.number("round(2.5)") == 2.0);
        REQUIRE(f.number("round(3.5)") == 4.0);
        REQUIRE(f.number("round(-1.4)") == -1.0);
        REQUIRE(f.number("abs(-3)") == 3.0);
    }

    SECTION("Min, max, sqrt and constants") {
        REQUIRE(f.number("min(3, -2)") == -2.0);
        REQUIRE(f.number("max(3, -2)") == 3.0);
        REQUIRE(f.number("sqrt(16)") == 4.0);
        REQUIRE(f.number("pi()") == Catch::Approx(3.14159265));
        REQUIRE(f.number("e()") == Catch::Approx(2.71828183));
    }

    SECTION("Domain errors") {
        REQUIRE(f.errorKind("sqrt(-1)") == ErrorKind::DomainError);
        REQUIRE(f.errorKind("asin(2)") == ErrorKind::DomainError);
        REQUIRE(f.errorKind("acos(-1.5)") == ErrorKind::DomainError);
    }

    SECTION("Random stays in [0, 1) and follows the seed") {
        f.state.rng.seed(7);
        std::vector<double> first;
        for (int i = 0; i < 20; ++i) {
            double r = f.number("random()");
            REQUIRE(r >= 0.0);
            REQUIRE(r < 1.0);
            first.push_back(r);
        }
        f.state.rng.seed(7);
        for (int i = 0; i < 20; ++i) {
            REQUIRE(f.number("random()") == first[i]);
        }
    }
}

TEST_CASE("Builtins Shadow User Functions", "[builtins]") {
    Fixture f;
    f.run("function forward(n) { return 99 }");
    REQUIRE_FALSE(f.run("forward(10)").has_value());
    REQUIRE(f.surface.count(DrawOp::LineTo) == 1);
}
