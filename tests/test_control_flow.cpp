#include <catch2/catch_all.hpp>
#include "../src/Session/Session.hpp"
#include "../src/Graphics/RecordingSurface.hpp"

using namespace turtlescript;

namespace {

struct Run {
    RecordingSurface surface;
    Session session{surface};
    std::vector<std::string> output;

    Run() {
        session.setPrintCallback([this](const std::string& s) { output.push_back(s); });
    }

    void ok(const std::string& source) {
        RunResult r = session.evalStatement(source);
        INFO(source);
        if (!r.ok()) FAIL(formatError(*r.error));
    }
};

} // namespace

TEST_CASE("Control Flow - If", "[control]") {
    Run run;

    run.ok("var x = 5\n"
           "if x > 3 { print(\"big\") } else { print(\"small\") }\n"
           "if x > 10 { print(\"huge\") } else if x == 5 { print(\"five\") } else { print(\"other\") }\n"
           "if 0 { print(\"zero is true\") }\n"
           "if 1 { print(\"one is true\") }");

    REQUIRE(run.output == std::vector<std::string>{"big", "five", "one is true"});
}

TEST_CASE("Control Flow - While", "[control]") {
    Run run;

    SECTION("Counts up") {
        run.ok("var i = 0\nwhile i < 4 { print(i)\n i = i + 1 }");
        REQUIRE(run.output == std::vector<std::string>{"0", "1", "2", "3"});
    }

    SECTION("False condition skips the body") {
        run.ok("while false { print(\"never\") }");
        REQUIRE(run.output.empty());
    }
}

TEST_CASE("Control Flow - For", "[control]") {
    Run run;

    SECTION("Inclusive upper bound") {
        run.ok("for i = 1 to 4 { print(i) }");
        REQUIRE(run.output == std::vector<std::string>{"1", "2", "3", "4"});
    }

    SECTION("Explicit step") {
        run.ok("for i = 0 to 10 step 5 { print(i) }");
        REQUIRE(run.output == std::vector<std::string>{"0", "5", "10"});
    }

    SECTION("Negative step counts down") {
        run.ok("for i = 10 to 1 step -3 { print(i) }");
        REQUIRE(run.output == std::vector<std::string>{"10", "7", "4", "1"});
    }

    SECTION("Empty ranges run zero times") {
        run.ok("for i = 5 to 1 { print(i) }\nfor i = 1 to 5 step -1 { print(i) }");
        REQUIRE(run.output.empty());
    }

    SECTION("Zero step runs zero times") {
        run.ok("for i = 1 to 5 step 0 { print(i) }");
        REQUIRE(run.output.empty());
    }

    SECTION("Single iteration when bounds are equal") {
        run.ok("for i = 3 to 3 { print(i) }");
        REQUIRE(run.output == std::vector<std::string>{"3"});
    }

    SECTION("Fractional step does not accumulate error") {
        run.ok("var n = 0\nfor i = 0 to 1 step 0.1 { n = n + 1 }\nprint(n)");
        REQUIRE(run.output == std::vector<std::string>{"11"});
    }

    SECTION("Bounds are evaluated once") {
        run.ok("var limit = 3\nvar n = 0\nfor i = 1 to limit { limit = 100\n n = n + 1 }\nprint(n)");
        REQUIRE(run.output == std::vector<std::string>{"3"});
    }

    SECTION("Nested loops") {
        run.ok("var n = 0\nfor i = 1 to 3 { for j = 1 to i { n = n + 1 } }\nprint(n)");
        REQUIRE(run.output == std::vector<std::string>{"6"});
    }
}

TEST_CASE("Control Flow - Return", "[control]") {
    Run run;

    SECTION("Return from inside nested loops") {
        run.ok("function find(target) {\n"
               "  for i = 1 to 10 {\n"
               "    var j = 0\n"
               "    while j < 10 {\n"
               "      if i * j == target { return i * 100 + j }\n"
               "      j = j + 1\n"
               "    }\n"
               "  }\n"
               "  return -1\n"
               "}\n"
               "print(find(12))\nprint(find(1000))");
        REQUIRE(run.output == std::vector<std::string>{"206", "-1"});
    }

    SECTION("Bare return yields none") {
        run.ok("function early(x) { if x { return }\n print(\"late\") }\nearly(true)\nearly(false)");
        REQUIRE(run.output == std::vector<std::string>{"late"});
    }

    SECTION("Return without value at top level has no completion") {
        RunResult r = run.session.evalStatement("return");
        REQUIRE(r.ok());
        REQUIRE_FALSE(r.value.has_value());
    }
}
