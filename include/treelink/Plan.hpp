/**
 * @file Plan.hpp
 * @brief Merge plan: configuration of one merge run
 *
 * A plan is read from JSON or TOML and layered as
 *   defaults -> file -> overrides
 * where overrides are dot-path assignments such as "merge.mode=strict"
 * (typically from the command line). The layered value is then checked for
 * mandatory keys and converted into a MergePlan.
 *
 * Example (TOML):
 * ```toml
 * [merge]
 * mode = "graceful"
 * tolerate_missing = ["DataType"]
 *
 * [[packages]]
 * name = "Communication"
 * graceful = ["ISignal"]
 *
 * [[layouts]]
 * parent = "ETHERNET-PHYSICAL-CHANNEL"
 * order = ["SHORT-NAME", "COMM-CONNECTORS", "PDU-TRIGGERINGS"]
 * synthesize = ["PDU-TRIGGERINGS"]
 *
 * [log]
 * level = "info"
 * ```
 */

#ifndef TREELINK_PLAN_HPP
#define TREELINK_PLAN_HPP

#include "treelink/Log.hpp"
#include "treelink/Package.hpp"
#include "treelink/Structure.hpp"
#include "treelink/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace treelink {

struct MergePlan {
    std::vector<PackageRule> packages;
    MergeMode default_mode = MergeMode::Graceful;
    std::vector<std::string> tolerate_missing;
    bool unique_identities = true;
    std::vector<LayoutRule> layouts;
    log::Level log_level = log::Level::Warning;
};

/**
 * @brief Built-in lowest layer of every plan
 */
Value plan_defaults();

struct PlanOptions {
    std::optional<std::string> file_path;
    std::map<std::string, Value> overrides; // dot-path -> value, final precedence
    Value defaults = plan_defaults();
    std::vector<std::string> mandatory = {"packages"};
};

/**
 * @brief Read a plan file, choosing the parser by extension (.json, .toml)
 * @throws FileNotFoundError if the file does not exist
 * @throws ParseError on syntax errors or an unsupported extension
 */
Value load_plan_file(const std::string& path);

/**
 * @brief Recursively merge override into base (objects merge, the rest replaces)
 */
void deep_merge(Value& base, const Value& override_val);

/**
 * @brief Set a value at a dot-path, creating intermediate objects
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Whether a dot-path resolves through nested objects
 */
bool contains_dot(const Value& data, const std::string& path);

/**
 * @brief Type a string from the command line
 *
 * First match wins: true/false, null, integer, float, JSON object/array,
 * quoted string, raw string.
 *
 * Examples:
 * - "true" → true
 * - "42" → 42
 * - "[\"A\",\"B\"]" → ["A", "B"]
 * - "strict" → "strict"
 */
Value parse_value(const std::string& str);

/**
 * @brief Split "key=value" and type the value
 * @throws std::invalid_argument if there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_override(const std::string& assignment);

/**
 * @brief Convert a layered plan value into a MergePlan
 * @throws TypeError for values of the wrong type or unknown enumerators
 */
MergePlan parse_plan(const Value& data);

/**
 * @brief Layer defaults, file and overrides, check mandatory keys, parse
 * @throws MissingMandatoryConfig if mandatory keys are absent
 */
MergePlan load_plan(const PlanOptions& opts);

} // namespace treelink

#endif // TREELINK_PLAN_HPP
