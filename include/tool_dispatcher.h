#pragma once

#include "tool_registry.h"
#include <string>

namespace helios {

/**
 * @brief Resolves model function calls against a ToolRegistry
 *
 * Every call produces a result string, including calls that fail: unknown
 * names yield a fixed invalid-call text, and handler errors are returned
 * as the result so the model can see them.
 */
class ToolDispatcher {
public:
    explicit ToolDispatcher(const ToolRegistry& registry);

    /**
     * @brief Run the named tool
     * @return Result text (never empty for a registered tool)
     */
    std::string dispatch(const std::string& name, const nlohmann::json& args) const;

    /**
     * @brief Dispatch a call and pair the result with its id and name
     */
    FunctionResponse handle(const ToolCall& call) const;

    nlohmann::json function_declarations() const { return registry_.function_declarations(); }

private:
    const ToolRegistry& registry_;
};

} // namespace helios
