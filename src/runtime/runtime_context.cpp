#include "runtime/runtime_context.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/builtin_tools.hpp"

namespace agentic::runtime {

RuntimeContext::RuntimeContext(ConstructionKey, const protocol::RunOptions& options)
    : default_ask_timeout_(options.ask_timeout_ms),
      bus_(options.mailbox_capacity, options.history_limit),
      agents_(bus_, std::chrono::milliseconds(options.processing_delay_ms)) {}

core::errors::Result<std::unique_ptr<RuntimeContext>> RuntimeContext::create(
    const protocol::RunOptions& options) {
    auto context = std::make_unique<RuntimeContext>(ConstructionKey{}, options);
    auto registered = tools::register_builtin_tools(context->tools_, context->bus_);
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }
    LOG_DEBUG("RuntimeContext: ready with " + std::to_string(context->tools_.list_tools().size()) +
              " tools");
    return std::move(context);
}

void RuntimeContext::shutdown() {
    agents_.shutdown();
    bus_.shutdown();
}

}  // namespace agentic::runtime
