/**
 * @file Plan.cpp
 * @brief Loading and validating merge plans
 */

#include "treelink/Plan.hpp"
#include "treelink/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace treelink {

// ============================================================================
// Layering
// ============================================================================

Value plan_defaults() {
    return Value{
        {"merge", {
            {"mode", "graceful"},
            {"tolerate_missing", Value::array()},
            {"unique_identities", true}
        }},
        {"layouts", Value::array()},
        {"log", {{"level", "warning"}}}
    };
}

void deep_merge(Value& base, const Value& override_val) {
    if (!base.is_object() || !override_val.is_object()) {
        base = override_val;
        return;
    }
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        const auto& key = it.key();
        if (base.contains(key) && base[key].is_object() && it.value().is_object()) {
            deep_merge(base[key], it.value());
        } else {
            base[key] = it.value();
        }
    }
}

namespace {

    std::vector<std::string> split_dots(const std::string& path) {
        std::vector<std::string> parts;
        std::string token;
        std::istringstream iss(path);
        while (std::getline(iss, token, '.')) {
            if (!token.empty()) parts.push_back(token);
        }
        return parts;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

} // anonymous namespace

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto parts = split_dots(path);
    if (parts.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current->is_object()) *current = Value::object();
        if (!current->contains(parts[i]) || !(*current)[parts[i]].is_object()) {
            (*current)[parts[i]] = Value::object();
        }
        current = &(*current)[parts[i]];
    }
    if (!current->is_object()) *current = Value::object();
    (*current)[parts.back()] = value;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& part : split_dots(path)) {
        if (!current->is_object()) return false;
        auto it = current->find(part);
        if (it == current->end()) return false;
        current = &*it;
    }
    return true;
}

// ============================================================================
// File loading
// ============================================================================

namespace {

    Value toml_to_json(const toml::node& node) {
        switch (node.type()) {
            case toml::node_type::string:
                return Value(node.as_string()->get());
            case toml::node_type::integer:
                return Value(node.as_integer()->get());
            case toml::node_type::floating_point:
                return Value(node.as_floating_point()->get());
            case toml::node_type::boolean:
                return Value(node.as_boolean()->get());
            case toml::node_type::array: {
                Value arr = Value::array();
                for (const auto& elem : *node.as_array()) {
                    arr.push_back(toml_to_json(elem));
                }
                return arr;
            }
            case toml::node_type::table: {
                Value obj = Value::object();
                for (const auto& [key, val] : *node.as_table()) {
                    obj[std::string(key.str())] = toml_to_json(val);
                }
                return obj;
            }
            default: {
                // Dates and times are kept as their TOML text
                std::ostringstream ss;
                if (auto d = node.as_date()) ss << d->get();
                else if (auto t = node.as_time()) ss << t->get();
                else if (auto dt = node.as_date_time()) ss << dt->get();
                return Value(ss.str());
            }
        }
    }

} // anonymous namespace

Value load_plan_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = to_lower(fs::path(path).extension().string());

    if (ext == ".toml") {
        try {
            return toml_to_json(toml::parse_file(path));
        } catch (const toml::parse_error& e) {
            std::ostringstream where;
            where << "line " << e.source().begin.line << ", column "
                  << e.source().begin.column << ": " << e.description();
            throw ParseError(path, where.str());
        }
    }

    if (ext == ".json") {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw FileNotFoundError(path);
        }
        try {
            return Value::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(path, e.what());
        }
    }

    throw ParseError(path, "unsupported plan type '" + ext + "' (expected .json or .toml)");
}

// ============================================================================
// Override parsing
// ============================================================================

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    static const std::regex integer("^-?[0-9]+$");
    if (std::regex_match(str, integer)) {
        try {
            size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) return static_cast<int64_t>(val);
        } catch (const std::out_of_range&) {
            // Too large for int64: keep trying as float/string
        }
    }

    static const std::regex floating("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    if (std::regex_match(str, floating)) {
        try {
            size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) return val;
        } catch (const std::out_of_range&) {
        }
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

std::pair<std::string, Value> parse_override(const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument("Override must look like key=value: " + assignment);
    }
    return {assignment.substr(0, eq), parse_value(assignment.substr(eq + 1))};
}

// ============================================================================
// Plan conversion
// ============================================================================

namespace {

    const Value& member(const Value& obj, const std::string& key, const std::string& path) {
        auto it = obj.find(key);
        if (it == obj.end()) {
            throw KeyError(path, key);
        }
        return *it;
    }

    std::string as_string(const Value& v, const std::string& path) {
        if (!v.is_string()) throw TypeError(path, "string", type_name(v));
        return v.get<std::string>();
    }

    std::vector<std::string> as_string_list(const Value& v, const std::string& path) {
        if (!v.is_array()) throw TypeError(path, "array of strings", type_name(v));
        std::vector<std::string> out;
        for (size_t i = 0; i < v.size(); ++i) {
            out.push_back(as_string(v[i], path + "." + std::to_string(i)));
        }
        return out;
    }

    std::vector<std::string> optional_list(const Value& obj, const std::string& key,
                                           const std::string& path) {
        auto it = obj.find(key);
        if (it == obj.end()) return {};
        return as_string_list(*it, path + "." + key);
    }

    MergeMode parse_mode(const Value& v, const std::string& path) {
        const std::string text = to_lower(as_string(v, path));
        if (text == "strict") return MergeMode::Strict;
        if (text == "graceful") return MergeMode::Graceful;
        throw TypeError(path, "strict|graceful", "'" + text + "'");
    }

    PackageRule parse_package(const Value& v, const std::string& path) {
        PackageRule rule;
        if (v.is_string()) {
            rule.name = v.get<std::string>();
            return rule;
        }
        if (!v.is_object()) throw TypeError(path, "string or object", type_name(v));
        rule.name = as_string(member(v, "name", path), path + ".name");
        rule.graceful = optional_list(v, "graceful", path);
        return rule;
    }

    LayoutRule parse_layout(const Value& v, const std::string& path) {
        if (!v.is_object()) throw TypeError(path, "object", type_name(v));

        LayoutRule rule;
        rule.parent = as_string(member(v, "parent", path), path + ".parent");
        const auto order = as_string_list(member(v, "order", path), path + ".order");
        rule.ensure = optional_list(v, "synthesize", path);

        std::map<std::string, std::vector<std::string>> templates;
        if (auto it = v.find("templates"); it != v.end()) {
            if (!it->is_object()) {
                throw TypeError(path + ".templates", "object", type_name(*it));
            }
            for (auto t = it->begin(); t != it->end(); ++t) {
                templates[t.key()] = as_string_list(t.value(), path + ".templates." + t.key());
            }
        }

        for (const auto& tag : rule.ensure) {
            if (std::find(order.begin(), order.end(), tag) == order.end()) {
                throw TypeError(path + ".synthesize", "tags listed in order", "'" + tag + "'");
            }
        }

        for (const auto& tag : order) {
            const bool synthesizable =
                std::find(rule.ensure.begin(), rule.ensure.end(), tag) != rule.ensure.end();
            if (synthesizable) {
                auto t = templates.find(tag);
                rule.layout.push_back({tag, container_factory(
                    tag, t == templates.end() ? std::vector<std::string>{} : t->second)});
            } else {
                rule.layout.push_back({tag, nullptr});
            }
        }
        return rule;
    }

} // anonymous namespace

MergePlan parse_plan(const Value& data) {
    if (!data.is_object()) throw TypeError("", "object", type_name(data));

    MergePlan plan;

    const Value& packages = member(data, "packages", "packages");
    if (!packages.is_array()) throw TypeError("packages", "array", type_name(packages));
    for (size_t i = 0; i < packages.size(); ++i) {
        plan.packages.push_back(parse_package(packages[i], "packages." + std::to_string(i)));
    }

    if (auto merge = data.find("merge"); merge != data.end()) {
        if (!merge->is_object()) throw TypeError("merge", "object", type_name(*merge));
        if (auto mode = merge->find("mode"); mode != merge->end()) {
            plan.default_mode = parse_mode(*mode, "merge.mode");
        }
        plan.tolerate_missing = optional_list(*merge, "tolerate_missing", "merge");
        if (auto unique = merge->find("unique_identities"); unique != merge->end()) {
            if (!unique->is_boolean()) {
                throw TypeError("merge.unique_identities", "boolean", type_name(*unique));
            }
            plan.unique_identities = unique->get<bool>();
        }
    }

    if (auto layouts = data.find("layouts"); layouts != data.end()) {
        if (!layouts->is_array()) throw TypeError("layouts", "array", type_name(*layouts));
        for (size_t i = 0; i < layouts->size(); ++i) {
            plan.layouts.push_back(parse_layout((*layouts)[i], "layouts." + std::to_string(i)));
        }
    }

    if (contains_dot(data, "log.level")) {
        const std::string level = as_string(data["log"]["level"], "log.level");
        try {
            plan.log_level = log::parse_level(level);
        } catch (const std::invalid_argument&) {
            throw TypeError("log.level", "debug|info|warning|error|off", "'" + level + "'");
        }
    }

    return plan;
}

MergePlan load_plan(const PlanOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_plan_file(*opts.file_path));
    }

    // 3) overrides
    for (const auto& [key, value] : opts.overrides) {
        set_by_dot(merged, key, value);
    }

    // 4) mandatory
    std::vector<std::string> missing;
    for (const auto& key : opts.mandatory) {
        if (!contains_dot(merged, key)) missing.push_back(key);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);

    return parse_plan(merged);
}

} // namespace treelink
