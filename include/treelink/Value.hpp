/**
 * @file Value.hpp
 * @brief JSON value type used for documents on disk and for plans
 *
 * Uses nlohmann::json as the underlying value model. TOML plans are
 * converted to it on load.
 */

#ifndef TREELINK_VALUE_HPP
#define TREELINK_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace treelink {

using Value = nlohmann::json;

/**
 * @brief Human-readable type name for error messages
 * @return "null", "boolean", "integer", "float", "string", "array" or "object"
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace treelink

#endif // TREELINK_VALUE_HPP
