/**
 * @file Path.cpp
 * @brief Implementation of path resolution
 */

#include "treelink/Path.hpp"
#include "treelink/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace treelink {

std::string absolute_path(const Node& node, const Document& doc) {
    std::vector<std::string> names;
    const Node* current = &node;

    while (true) {
        if (auto name = current->local_name()) {
            names.push_back(*name);
        }
        if (doc.is_root(*current)) {
            break;
        }
        const Node* parent = doc.parent_of(*current);
        if (parent == nullptr) {
            throw PathResolutionError(doc.name(), current->describe());
        }
        current = parent;
    }

    std::reverse(names.begin(), names.end());
    return join_path(names);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "/";
    }

    std::ostringstream oss;
    for (const auto& s : segments) {
        oss << '/' << s;
    }
    return oss.str();
}

std::string parent_path(const std::string& path) {
    auto segments = split_path(path);
    if (!segments.empty()) segments.pop_back();
    return join_path(segments);
}

std::string last_segment(const std::string& path) {
    auto segments = split_path(path);
    return segments.empty() ? std::string{} : segments.back();
}

namespace {

    /**
     * @brief Pre-order search for a named node below `from`
     *
     * Descends only through anonymous nodes: a named node that does not
     * match closes its branch, since everything below it has a longer path.
     */
    Node* find_named(const Node& from, const std::string& name) {
        for (const auto& c : from.children()) {
            auto local = c->local_name();
            if (local) {
                if (*local == name) return c.get();
                continue;
            }
            if (Node* hit = find_named(*c, name)) return hit;
        }
        return nullptr;
    }

} // anonymous namespace

Node* resolve_path(Document& doc, const std::string& path) {
    const auto segments = split_path(path);
    Node* current = &doc.root();

    auto it = segments.begin();
    // A named root accounts for the first segment
    if (auto root_name = current->local_name()) {
        if (it == segments.end() || *it != *root_name) return nullptr;
        ++it;
    }

    for (; it != segments.end(); ++it) {
        current = find_named(*current, *it);
        if (current == nullptr) return nullptr;
    }
    return current;
}

} // namespace treelink
