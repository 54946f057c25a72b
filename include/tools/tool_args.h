#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace helios {

/**
 * @brief Fetch a named argument as text
 *
 * Strings are returned as-is; any other JSON value is rendered with dump().
 * @return false if the argument is absent or null
 */
inline bool read_argument(const nlohmann::json& args, const std::string& name, std::string& out) {
    if (!args.is_object()) return false;
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) return false;
    out = it->is_string() ? it->get<std::string>() : it->dump();
    return true;
}

inline std::string missing_argument(const std::string& name) {
    return "Error: missing argument '" + name + "'";
}

} // namespace helios
