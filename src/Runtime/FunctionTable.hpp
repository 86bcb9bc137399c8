#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace turtlescript {

namespace ast { struct FunctionDecl; struct Block; }

using ProgramPtr = std::shared_ptr<const ast::Block>;

struct UserFunction {
    std::string name;                    // case-sensitive
    std::vector<std::string> parameters;
    const ast::Block* body{nullptr};     // points into program
    ProgramPtr program;                  // null when the caller owns the AST
    int line{0};
    int column{0};
};

/**
 * FunctionTable - global registry of user-defined functions
 *
 * Entries point into AST nodes and share ownership of the program that
 * declared them, so a program lives exactly as long as one of its functions
 * is still registered.
 */
class FunctionTable {
public:
    // Register or overwrite. Returns true when an existing entry was replaced.
    bool defineFunction(const ast::FunctionDecl& decl, ProgramPtr program = nullptr);

    bool isUserFunction(const std::string& name) const;
    const UserFunction* getFunction(const std::string& name) const;

    void clear();
    size_t getFunctionCount() const { return functions.size(); }

    // Bumped on every definition; lets hosts tell whether a run defined anything.
    uint64_t getRevision() const { return revision; }

    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, UserFunction> functions;
    uint64_t revision{0};
};

} // namespace turtlescript
