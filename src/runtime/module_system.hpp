#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "core/errors/script_errors.hpp"

namespace agentic::runtime {

// Resolves `import a.b.c { X, Y }` against the fixed standard-library
// catalogue and remembers what the session imported.
class ModuleSystem {
public:
    ModuleSystem();

    // Validates every name before recording any of them; returns the names.
    core::errors::Result<std::vector<std::string>> import_module(
        const std::vector<std::string>& module_path, const std::vector<std::string>& names);

    // "Agent" always; otherwise an imported agent type such as SupervisorAgent.
    bool is_agent_type(const std::string& kind) const;
    bool is_tool_imported(const std::string& name) const;

    std::vector<std::string> imported_modules() const;
    std::vector<std::string> catalogue_modules() const;

private:
    struct ModuleInfo {
        std::set<std::string> tools;
        std::set<std::string> agent_types;
    };

    std::map<std::string, ModuleInfo> catalogue_;
    std::vector<std::string> imported_modules_;
    std::set<std::string> imported_tools_;
    std::set<std::string> imported_agent_types_;
};

}  // namespace agentic::runtime
