#include <catch2/catch_all.hpp>
#include "../src/Runtime/CallStack.hpp"
#include "../src/Runtime/FunctionTable.hpp"
#include "../src/Lexer/Lexer.hpp"
#include "../src/Parser/Parser.hpp"

using namespace turtlescript;

TEST_CASE("CallStack - Push and Pop", "[runtime][callstack]") {
    CallStack stack;
    REQUIRE(stack.empty());
    REQUIRE(stack.getMaxDepth() == CallStack::kDefaultMaxDepth);
    REQUIRE(stack.top() == nullptr);

    REQUIRE(stack.push({"outer", nullptr, 1, 1}));
    REQUIRE(stack.push({"inner", nullptr, 3, 5}));
    REQUIRE(stack.depth() == 2);
    REQUIRE(stack.top()->functionName == "inner");
    REQUIRE(stack.frames()[0].functionName == "outer");

    CallFrame popped;
    REQUIRE(stack.pop(popped));
    REQUIRE(popped.functionName == "inner");
    REQUIRE(popped.line == 3);
    REQUIRE(popped.column == 5);

    stack.pop();
    REQUIRE(stack.empty());
    REQUIRE_FALSE(stack.pop(popped));
    stack.pop(); // popping an empty stack is harmless
    REQUIRE(stack.depth() == 0);
}

TEST_CASE("CallStack - Depth Limit", "[runtime][callstack]") {
    CallStack stack(3);

    REQUIRE(stack.push({"f", nullptr, 1, 1}));
    REQUIRE(stack.push({"f", nullptr, 1, 1}));
    REQUIRE(stack.push({"f", nullptr, 1, 1}));
    REQUIRE_FALSE(stack.push({"f", nullptr, 1, 1}));
    REQUIRE(stack.depth() == 3);

    SECTION("Raising the limit allows deeper calls") {
        stack.setMaxDepth(4);
        REQUIRE(stack.push({"f", nullptr, 1, 1}));
    }

    SECTION("Clear empties the stack") {
        stack.clear();
        REQUIRE(stack.empty());
        REQUIRE(stack.push({"g", nullptr, 2, 2}));
    }
}

TEST_CASE("FunctionTable - Definitions", "[runtime][functions]") {
    Lexer lexer;
    Parser parser(lexer.tokenize("function sq(n) { return n * n }\nfunction sq(a, b) { }\nfunction go() { }"));
    auto program = parser.parseProgram();
    const auto& first = static_cast<const ast::FunctionDecl&>(*program->statements[0]);
    const auto& second = static_cast<const ast::FunctionDecl&>(*program->statements[1]);
    const auto& third = static_cast<const ast::FunctionDecl&>(*program->statements[2]);

    FunctionTable table;
    REQUIRE(table.getRevision() == 0);

    REQUIRE_FALSE(table.defineFunction(first));
    REQUIRE(table.isUserFunction("sq"));
    REQUIRE_FALSE(table.isUserFunction("SQ"));

    const UserFunction* fn = table.getFunction("sq");
    REQUIRE(fn != nullptr);
    REQUIRE(fn->parameters == std::vector<std::string>{"n"});
    REQUIRE(fn->body == first.body.get());
    REQUIRE(fn->line == 1);

    SECTION("Redefinition replaces the entry") {
        REQUIRE(table.defineFunction(second));
        REQUIRE(table.getFunctionCount() == 1);
        REQUIRE(table.getFunction("sq")->parameters.size() == 2);
        REQUIRE(table.getFunction("sq")->line == 2);
    }

    SECTION("Revision tracks every change") {
        uint64_t before = table.getRevision();
        table.defineFunction(third);
        REQUIRE(table.getRevision() == before + 1);
        REQUIRE(table.names() == std::vector<std::string>{"go", "sq"});
        table.clear();
        REQUIRE(table.getRevision() == before + 2);
        REQUIRE(table.getFunctionCount() == 0);
        REQUIRE(table.getFunction("sq") == nullptr);
    }
}
