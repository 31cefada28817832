#include "runtime/environment.hpp"

#include <utility>

namespace agentic::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptError;

Environment::Environment() : frames_(1) {}

void Environment::declare(const std::string& name, Value value) {
    frames_.back()[name] = std::move(value);
}

core::errors::Status Environment::assign(const std::string& name, Value value) {
    if (Value* existing = find(name)) {
        *existing = std::move(value);
        return core::errors::ok();
    }
    if (frames_.size() == 1) {
        frames_.front().emplace(name, std::move(value));
        return core::errors::ok();
    }
    return ScriptError{ErrorCategory::Semantic,
                       "Cannot assign to undeclared variable '" + name + "' inside a block",
                       "undeclared_assignment", "Declare it first with 'let " + name + " = ...'."};
}

core::errors::Result<Value> Environment::lookup(const std::string& name) const {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto it = frame->find(name);
        if (it != frame->end()) {
            return it->second;
        }
    }
    return ScriptError{ErrorCategory::Semantic, "Undefined variable '" + name + "'",
                       "undefined_variable"};
}

bool Environment::contains(const std::string& name) const {
    for (const auto& frame : frames_) {
        if (frame.count(name) != 0) {
            return true;
        }
    }
    return false;
}

void Environment::push_scope() { frames_.emplace_back(); }

void Environment::pop_scope() {
    if (frames_.size() > 1) {
        frames_.pop_back();
    }
}

Value* Environment::find(const std::string& name) {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
        auto it = frame->find(name);
        if (it != frame->end()) {
            return &it->second;
        }
    }
    return nullptr;
}

}  // namespace agentic::runtime
