// Call frames for user-function invocations and recursion-depth tracking.
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace turtlescript {

class Environment;

struct CallFrame {
    std::string functionName;
    Environment* locals{nullptr}; // non-owning; lives on the interpreter's C++ stack
    int line{0};                  // call site
    int column{0};
};

class CallStack {
public:
    static constexpr size_t kDefaultMaxDepth = 1000;

    explicit CallStack(size_t maxDepth = kDefaultMaxDepth) : maxDepth_(maxDepth) {}

    void clear() { frames_.clear(); }

    // Returns false (and leaves the stack unchanged) when the depth limit is reached.
    bool push(const CallFrame& f) {
        if (frames_.size() >= maxDepth_) return false;
        frames_.push_back(f);
        return true;
    }

    bool pop(CallFrame& out) {
        if (frames_.empty()) return false;
        out = frames_.back(); frames_.pop_back(); return true;
    }

    void pop() { if (!frames_.empty()) frames_.pop_back(); }

    CallFrame* top() { return frames_.empty() ? nullptr : &frames_.back(); }
    const CallFrame* top() const { return frames_.empty() ? nullptr : &frames_.back(); }

    size_t depth() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

    size_t getMaxDepth() const { return maxDepth_; }
    void setMaxDepth(size_t depth) { maxDepth_ = depth; }

    const std::vector<CallFrame>& frames() const { return frames_; }

private:
    std::vector<CallFrame> frames_;
    size_t maxDepth_;
};

} // namespace turtlescript
