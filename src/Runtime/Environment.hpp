// Lexical scope: name -> Value map chained to an enclosing scope.
#pragma once

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "Value.hpp"

namespace turtlescript {

class Environment {
public:
    Environment() = default;
    explicit Environment(Environment* parent) : parent_(parent) {}

    Environment(const Environment&) = delete;
    Environment& operator=(const Environment&) = delete;

    // Create or overwrite in this scope only.
    void define(const std::string& name, Value value) {
        vars_[name] = std::move(value);
    }

    // Walk outward; nullptr when no scope defines the name.
    Value* lookup(const std::string& name) {
        for (Environment* env = this; env; env = env->parent_) {
            auto it = env->vars_.find(name);
            if (it != env->vars_.end()) return &it->second;
        }
        return nullptr;
    }

    const Value* lookup(const std::string& name) const {
        return const_cast<Environment*>(this)->lookup(name);
    }

    // Mutate the nearest scope defining the name. Returns false if none does.
    bool assign(const std::string& name, Value value) {
        Value* slot = lookup(name);
        if (!slot) return false;
        *slot = std::move(value);
        return true;
    }

    bool hasLocal(const std::string& name) const {
        return vars_.find(name) != vars_.end();
    }

    Environment* parent() const { return parent_; }
    size_t size() const { return vars_.size(); }
    void clear() { vars_.clear(); }

    // Sorted local names, for listings.
    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(vars_.size());
        for (const auto& kv : vars_) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::unordered_map<std::string, Value> vars_;
    Environment* parent_{nullptr};
};

} // namespace turtlescript
