#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace helios {

/**
 * @brief Result structure for tool execution
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Result text returned to the model
    std::string error;    // Error message if failed

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }
};

/**
 * @brief A function invocation requested by the model
 */
struct ToolCall {
    std::string id;        ///< Correlation id echoed in the response
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

/**
 * @brief The answer to one ToolCall, sent back as a toolResponse
 */
struct FunctionResponse {
    std::string id;
    std::string name;
    std::string result;
};

/**
 * @brief Abstract base class for all tools
 *
 * Tools are functions the model may invoke mid-conversation. Each tool must
 * provide:
 * - A unique name
 * - A description the model uses to decide when to call it
 * - A parameter schema (Gemini OpenAPI subset, upper-case type names)
 * - An execute method producing the result text
 */
class Tool {
public:
    virtual ~Tool() = default;

    /**
     * @brief Get the tool's unique name
     * @return Tool name (e.g., "get_repair_manual")
     */
    virtual std::string name() const = 0;

    virtual std::string description() const = 0;

    /**
     * @brief Get the schema for tool parameters
     * @return Schema object, e.g. {"type":"OBJECT","properties":{...},"required":[...]}
     */
    virtual nlohmann::json parameter_schema() const = 0;

    /**
     * @brief Execute the tool with the model-supplied arguments
     * @param args JSON object of arguments
     * @return ToolResult with result content or error
     */
    virtual ToolResult execute(const nlohmann::json& args) = 0;
};

} // namespace helios
