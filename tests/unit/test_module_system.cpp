#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/script_errors.hpp"
#include "runtime/module_system.hpp"

namespace {

using agentic::core::errors::get_error;
using agentic::core::errors::is_error;
using agentic::runtime::ModuleSystem;

TEST(ModuleSystemTest, ImportsToolsFromStandardLibrary) {
    ModuleSystem modules;
    auto imported =
        modules.import_module({"agentic", "stdlib", "tools"}, {"WebSearch", "AgentRouting"});

    ASSERT_FALSE(is_error(imported));
    EXPECT_TRUE(modules.is_tool_imported("WebSearch"));
    EXPECT_FALSE(modules.is_tool_imported("Calculator"));
    const std::vector<std::string> expected = {"agentic.stdlib.tools"};
    EXPECT_EQ(modules.imported_modules(), expected);
}

TEST(ModuleSystemTest, ImportedAgentTypeBecomesSpawnable) {
    ModuleSystem modules;
    EXPECT_TRUE(modules.is_agent_type("Agent"));
    EXPECT_FALSE(modules.is_agent_type("SupervisorAgent"));

    ASSERT_FALSE(is_error(modules.import_module({"agentic", "stdlib", "agents"}, {"SupervisorAgent"})));
    EXPECT_TRUE(modules.is_agent_type("SupervisorAgent"));
}

TEST(ModuleSystemTest, UnknownModuleFails) {
    ModuleSystem modules;
    auto imported = modules.import_module({"agentic", "contrib"}, {"Anything"});
    ASSERT_TRUE(is_error(imported));
    EXPECT_EQ(get_error(imported).code, "import_error");
}

TEST(ModuleSystemTest, UnknownMemberFailsWithoutPartialImport) {
    ModuleSystem modules;
    auto imported = modules.import_module({"agentic", "stdlib", "tools"}, {"WebSearch", "Teleport"});

    ASSERT_TRUE(is_error(imported));
    EXPECT_EQ(get_error(imported).code, "import_error");
    EXPECT_FALSE(modules.is_tool_imported("WebSearch"));
    EXPECT_TRUE(modules.imported_modules().empty());
}

TEST(ModuleSystemTest, RepeatedImportListsModuleOnce) {
    ModuleSystem modules;
    ASSERT_FALSE(is_error(modules.import_module({"agentic", "stdlib", "tools"}, {"WebSearch"})));
    ASSERT_FALSE(is_error(modules.import_module({"agentic", "stdlib", "tools"}, {"Calculator"})));
    EXPECT_EQ(modules.imported_modules().size(), 1u);
    EXPECT_EQ(modules.catalogue_modules().size(), 2u);
}

}  // namespace
