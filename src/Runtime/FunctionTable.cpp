#include "FunctionTable.hpp"

#include <algorithm>
#include "../Parser/Ast.hpp"

namespace turtlescript {

bool FunctionTable::defineFunction(const ast::FunctionDecl& decl, ProgramPtr program) {
    UserFunction fn;
    fn.name = decl.name;
    fn.parameters = decl.params;
    fn.body = decl.body.get();
    fn.program = std::move(program);
    fn.line = decl.line;
    fn.column = decl.column;

    ++revision;
    auto it = functions.find(decl.name);
    if (it != functions.end()) {
        it->second = std::move(fn);
        return true;
    }
    functions.emplace(decl.name, std::move(fn));
    return false;
}

bool FunctionTable::isUserFunction(const std::string& name) const {
    return functions.find(name) != functions.end();
}

const UserFunction* FunctionTable::getFunction(const std::string& name) const {
    auto it = functions.find(name);
    return it != functions.end() ? &it->second : nullptr;
}

void FunctionTable::clear() {
    functions.clear();
    ++revision;
}

std::vector<std::string> FunctionTable::names() const {
    std::vector<std::string> out;
    out.reserve(functions.size());
    for (const auto& kv : functions) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace turtlescript
