#include "tools/repair_manual_tool.h"
#include "tools/tool_args.h"
#include "logger.h"

using json = nlohmann::json;

namespace helios {

json RepairManualTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["model_number"] = json::object({
        {"type", "STRING"},
        {"description", "Manufacturer model number."}
    });
    schema["properties"]["component_name"] = json::object({
        {"type", "STRING"},
        {"description", "Name of the sub-system or part."}
    });
    schema["required"] = json::array({"model_number", "component_name"});
    return schema;
}

ToolResult RepairManualTool::execute(const json& args) {
    std::string model;
    std::string component;
    if (!read_argument(args, "model_number", model)) {
        return ToolResult::error_result(missing_argument("model_number"));
    }
    if (!read_argument(args, "component_name", component)) {
        return ToolResult::error_result(missing_argument("component_name"));
    }

    LOG_TOOL("Manual lookup: " + model + " / " + component);
    return ToolResult::success_result(
        "RETRIEVING MANUAL [" + model + "]: Component " + component +
        " specs: 15.5Nm torque required. Yellow/Blue striped wire is sensor signal. "
        "Safety check: ensure all capacitors are discharged.");
}

} // namespace helios
