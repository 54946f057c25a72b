#pragma once

#include "tool.h"
#include <string>
#include <vector>
#include <memory>
#include <map>

namespace helios {

/**
 * @brief Central registry for all available tools
 *
 * Manages tool registration and lookup, and renders the function
 * declarations advertised to the model during session setup.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @param tool Shared pointer to tool instance
     * @return true if registration successful, false if tool with same name already exists
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return Shared pointer to tool, or nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    /**
     * @brief Gemini functionDeclarations array for every registered tool
     * @return [{"name":..., "description":..., "parameters":{...}}, ...]
     */
    nlohmann::json function_declarations() const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace helios
