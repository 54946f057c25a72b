#pragma once

#include "tool.h"

namespace helios {

/**
 * @brief Looks up service-manual specs for a component of a device model
 */
class RepairManualTool : public Tool {
public:
    std::string name() const override { return "get_repair_manual"; }

    std::string description() const override {
        return "Retrieves specific torque specs or wiring diagrams for a given model and component.";
    }

    nlohmann::json parameter_schema() const override;

    ToolResult execute(const nlohmann::json& args) override;
};

} // namespace helios
