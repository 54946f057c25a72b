#include "tools/parts_inventory_tool.h"
#include "tools/tool_args.h"
#include "logger.h"

using json = nlohmann::json;

namespace helios {

json PartsInventoryTool::parameter_schema() const {
    json schema;
    schema["type"] = "OBJECT";
    schema["properties"]["part_id"] = json::object({
        {"type", "STRING"},
        {"description", "Part SKU or identifier."}
    });
    schema["required"] = json::array({"part_id"});
    return schema;
}

ToolResult PartsInventoryTool::execute(const json& args) {
    std::string part_id;
    if (!read_argument(args, "part_id", part_id)) {
        return ToolResult::error_result(missing_argument("part_id"));
    }

    LOG_TOOL("Inventory lookup: " + part_id);
    return ToolResult::success_result(
        "INVENTORY_MGMT: SKU " + part_id +
        " located in Bay 4. Stock: 14 units. Replacement estimated at 45 minutes labor.");
}

} // namespace helios
