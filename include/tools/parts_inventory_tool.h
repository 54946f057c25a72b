#pragma once

#include "tool.h"

namespace helios {

/**
 * @brief Reports stock level and bay location for a replacement part
 */
class PartsInventoryTool : public Tool {
public:
    std::string name() const override { return "check_parts_inventory"; }

    std::string description() const override {
        return "Checks if a replacement part is in stock at local warehouse.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;
};

} // namespace helios
