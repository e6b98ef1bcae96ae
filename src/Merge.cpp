/**
 * @file Merge.cpp
 * @brief Implementation of extend()
 */

#include "treelink/Merge.hpp"
#include "treelink/Errors.hpp"
#include "treelink/Log.hpp"
#include "treelink/Path.hpp"
#include "treelink/Structure.hpp"
#include "treelink/Tags.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace treelink {

std::optional<std::string> name_key(const Node& node) {
    return node.local_name();
}

std::vector<Node*> members(const Node& container) {
    std::vector<Node*> out;
    for (const auto& c : container.children()) {
        if (c->tag() != tags::kName) out.push_back(c.get());
    }
    return out;
}

namespace {

    std::string join_keys(const std::vector<std::string>& keys) {
        std::string out = "[";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) out += ", ";
            out += keys[i];
        }
        return out + "]";
    }

} // anonymous namespace

PathMap extend(const std::vector<Node*>& src_nodes,
               Node& dst_container,
               Document& src_doc,
               Document& dst_doc,
               NameClashSet& clashes,
               const ExtendOptions& options) {
    PathMap path_map;
    if (src_nodes.empty()) {
        return path_map;
    }

    // The destination may not lie inside a node that is about to move
    if (&src_doc == &dst_doc) {
        const std::set<const Node*> moving(src_nodes.begin(), src_nodes.end());
        for (const Node* n = &dst_container; n; n = dst_doc.parent_of(*n)) {
            if (moving.count(n)) {
                throw std::invalid_argument("extend: destination container " +
                                            dst_container.describe() +
                                            " is inside source node " + n->describe());
            }
        }
    }

    const std::string dst_path = absolute_path(dst_container, dst_doc);
    const Node* src_parent = src_doc.parent_of(*src_nodes.front());
    const std::string src_container_path =
        src_parent ? absolute_path(*src_parent, src_doc) : std::string("/");

    // 1. Source keys (must exist and be unique within the batch) and paths
    std::vector<std::string> src_keys;
    std::set<std::string> src_key_set;
    src_keys.reserve(src_nodes.size());
    for (const Node* node : src_nodes) {
        auto key = options.src_key(*node);
        if (!key) {
            throw AnonymousNodeError(node->tag());
        }
        if (!src_key_set.insert(*key).second) {
            throw DuplicateSourceKeyError(src_container_path, *key);
        }
        src_keys.push_back(*key);
    }

    // Destination members with their keys
    std::vector<std::pair<Node*, std::string>> dst_keyed;
    std::set<std::string> dst_key_set;
    for (Node* member : members(dst_container)) {
        if (auto key = options.dst_key(*member)) {
            dst_keyed.emplace_back(member, *key);
            dst_key_set.insert(*key);
        }
    }

    // 2. Where each source path ends up
    for (size_t i = 0; i < src_nodes.size(); ++i) {
        const Node& node = *src_nodes[i];
        if (node.is_anonymous()) {
            // No usable path; matched by key only
            continue;
        }
        const std::string src_path = absolute_path(node, src_doc);

        auto duplicate = std::find_if(dst_keyed.begin(), dst_keyed.end(),
                                      [&](const auto& d) { return d.second == src_keys[i]; });
        if (duplicate != dst_keyed.end() && !duplicate->first->is_anonymous()) {
            path_map[src_path] = absolute_path(*duplicate->first, dst_doc);
        } else {
            path_map[src_path] =
                (dst_path == "/" ? std::string{} : dst_path) + "/" + last_segment(src_path);
        }
    }

    // 3. Admission gate: keys owned by both sides
    std::vector<std::string> intersection;
    std::set_intersection(src_key_set.begin(), src_key_set.end(),
                          dst_key_set.begin(), dst_key_set.end(),
                          std::back_inserter(intersection));

    std::vector<Node*> admitted;
    if (intersection.empty()) {
        admitted = src_nodes;
    } else {
        log::warning() << intersection.size() << " name clashes found in "
                       << src_container_path << " and " << dst_path;
        log::warning() << "Conflicting elements: " << join_keys(intersection);

        ClashEvent event;
        event.source_document = src_doc.name();
        event.source_container = src_container_path;
        event.destination_container = dst_path;
        event.mode = options.mode;
        event.keys = intersection;
        clashes.record(std::move(event));

        if (options.mode == MergeMode::Graceful) {
            const std::set<std::string> clashing(intersection.begin(), intersection.end());
            for (size_t i = 0; i < src_nodes.size(); ++i) {
                if (clashing.count(src_keys[i]) == 0) admitted.push_back(src_nodes[i]);
            }
        }
    }

    // 4./5. Move admitted nodes over
    for (Node* node : admitted) {
        attach(dst_doc, dst_container, src_doc.detach(*node));
    }

    log::debug() << "Merged " << admitted.size() << " of " << src_nodes.size()
                 << " node(s) from " << src_container_path << " into " << dst_path;
    return path_map;
}

void accumulate(PathMap& total, const PathMap& next) {
    for (auto& entry : total) {
        auto it = next.find(entry.second);
        if (it != next.end()) {
            entry.second = it->second;
        }
    }
    for (const auto& entry : next) {
        total[entry.first] = entry.second;
    }
}

} // namespace treelink
