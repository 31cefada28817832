#include "runtime/module_system.hpp"

#include <algorithm>
#include "core/logging/logger.hpp"

namespace agentic::runtime {

using core::errors::ErrorCategory;
using core::errors::ScriptError;

namespace {

std::string join_path(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& part : parts) {
        out += out.empty() ? part : "." + part;
    }
    return out;
}

}  // namespace

ModuleSystem::ModuleSystem() {
    catalogue_["agentic.stdlib.tools"].tools = {"WebSearch", "AgentRouting", "FileManager",
                                                "Calculator"};
    catalogue_["agentic.stdlib.agents"].agent_types = {"SupervisorAgent"};
}

core::errors::Result<std::vector<std::string>> ModuleSystem::import_module(
    const std::vector<std::string>& module_path, const std::vector<std::string>& names) {
    const std::string module = join_path(module_path);
    auto it = catalogue_.find(module);
    if (it == catalogue_.end()) {
        return ScriptError{ErrorCategory::Semantic, "Unknown module '" + module + "'",
                           "import_error", "Available modules: agentic.stdlib.tools, "
                                           "agentic.stdlib.agents"};
    }

    const ModuleInfo& info = it->second;
    for (const auto& name : names) {
        if (info.tools.count(name) == 0 && info.agent_types.count(name) == 0) {
            return ScriptError{ErrorCategory::Semantic,
                               "Cannot import '" + name + "' from " + module, "import_error"};
        }
    }

    for (const auto& name : names) {
        if (info.tools.count(name) != 0) {
            imported_tools_.insert(name);
        } else {
            imported_agent_types_.insert(name);
        }
    }
    if (std::find(imported_modules_.begin(), imported_modules_.end(), module) ==
        imported_modules_.end()) {
        imported_modules_.push_back(module);
    }
    LOG_DEBUG("ModuleSystem: imported " + std::to_string(names.size()) + " name(s) from " +
              module);
    return names;
}

bool ModuleSystem::is_agent_type(const std::string& kind) const {
    return kind == "Agent" || imported_agent_types_.count(kind) != 0;
}

bool ModuleSystem::is_tool_imported(const std::string& name) const {
    return imported_tools_.count(name) != 0;
}

std::vector<std::string> ModuleSystem::imported_modules() const { return imported_modules_; }

std::vector<std::string> ModuleSystem::catalogue_modules() const {
    std::vector<std::string> out;
    for (const auto& entry : catalogue_) {
        out.push_back(entry.first);
    }
    return out;
}

}  // namespace agentic::runtime
