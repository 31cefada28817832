#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/script_errors.hpp"
#include "runtime/value.hpp"

namespace agentic::runtime {

// Chain of variable frames. Frame 0 is the global scope; blocks push nested
// frames which shadow outer bindings. Owned by the interpreter thread only.
class Environment {
public:
    Environment();

    // Binds in the innermost frame, replacing a binding of the same frame.
    void declare(const std::string& name, Value value);

    // Plain `x = v`. At global scope creates or rebinds; inside a block the
    // name must already be visible somewhere in the chain.
    core::errors::Status assign(const std::string& name, Value value);

    core::errors::Result<Value> lookup(const std::string& name) const;
    bool contains(const std::string& name) const;

    void push_scope();
    void pop_scope();
    std::size_t depth() const { return frames_.size(); }

    // Pushes a frame for its lifetime.
    class ScopeGuard {
    public:
        explicit ScopeGuard(Environment& env) : env_(env) { env_.push_scope(); }
        ~ScopeGuard() { env_.pop_scope(); }
        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        Environment& env_;
    };

private:
    Value* find(const std::string& name);

    std::vector<std::unordered_map<std::string, Value>> frames_;
};

}  // namespace agentic::runtime
