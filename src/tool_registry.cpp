#include "tool_registry.h"
#include "logger.h"

using json = nlohmann::json;

namespace helios {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    tools_[name] = tool;
    LOG_TOOL("Registered tool: " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    if (it != tools_.end()) {
        return it->second;
    }
    return nullptr;
}

json ToolRegistry::function_declarations() const {
    json declarations = json::array();

    for (const auto& [name, tool] : tools_) {
        json decl;
        decl["name"] = name;
        decl["description"] = tool->description();

        json schema = tool->parameter_schema();
        if (!schema.is_object()) {
            Logger::error("Tool '" + name + "' has a non-object parameter schema");
            schema = json{{"type", "OBJECT"}, {"properties", json::object()}};
        }
        decl["parameters"] = schema;

        declarations.push_back(decl);
    }

    return declarations;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

} // namespace helios
