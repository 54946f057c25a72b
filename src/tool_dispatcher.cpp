#include "tool_dispatcher.h"
#include "core/constants.h"
#include "errors.h"
#include "logger.h"

namespace helios {

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry)
    : registry_(registry) {}

std::string ToolDispatcher::dispatch(const std::string& name, const nlohmann::json& args) const {
    auto tool = registry_.get_tool(name);
    if (!tool) {
        Logger::warn(Error(ErrorType::DispatchError, "no handler for '" + name + "'").to_string());
        return constants::tools::INVALID_CALL_RESULT;
    }

    LOG_TOOL("Executing " + name + " " + args.dump());
    try {
        ToolResult result = tool->execute(args);
        if (!result.success) {
            Logger::warn("Tool '" + name + "' failed: " + result.error);
            return result.error;
        }
        return result.content;
    } catch (const std::exception& e) {
        Logger::error("Tool '" + name + "' threw: " + std::string(e.what()));
        return std::string("Error: ") + e.what();
    }
}

FunctionResponse ToolDispatcher::handle(const ToolCall& call) const {
    FunctionResponse response;
    response.id = call.id;
    response.name = call.name;
    response.result = dispatch(call.name, call.args);
    return response;
}

} // namespace helios
