/**
 * @file Relocate.cpp
 * @brief Implementation of reference relocation
 */

#include "treelink/Relocate.hpp"
#include "treelink/Errors.hpp"
#include "treelink/Log.hpp"
#include "treelink/Path.hpp"
#include "treelink/Tags.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace treelink {

std::string ReferenceField::text() const {
    if (!attribute_) return node_->text();
    return node_->attribute(*attribute_).value_or(std::string{});
}

void ReferenceField::set_text(std::string text) const {
    if (!attribute_) {
        node_->set_text(std::move(text));
    } else {
        node_->set_attribute(*attribute_, std::move(text));
    }
}

namespace {

    template <typename Pred>
    void collect_if(Node& node, Pred pred, std::vector<ReferenceField>& out) {
        for (const auto& c : node.children()) {
            if (pred(*c)) out.emplace_back(*c);
            collect_if(*c, pred, out);
        }
    }

} // anonymous namespace

std::vector<ReferenceField> collect_references(Node& root, const std::string& tag) {
    std::vector<ReferenceField> out;
    collect_if(root, [&](const Node& n) { return n.tag() == tag; }, out);
    return out;
}

std::vector<ReferenceField> collect_references(Node& root) {
    std::vector<ReferenceField> out;
    collect_if(root, [](const Node& n) { return tags::is_reference(n.tag()); }, out);
    return out;
}

std::size_t relocate(const std::vector<ReferenceField>& refs,
                     const PathMap& path_map,
                     UnmappedPolicy policy) {
    if (policy == UnmappedPolicy::Require) {
        for (const auto& ref : refs) {
            const std::string text = ref.text();
            if (path_map.count(text) == 0) {
                throw UnmappedReferenceError(text);
            }
        }
    }

    std::size_t rewritten = 0;
    for (const auto& ref : refs) {
        const std::string text = ref.text();
        auto it = path_map.find(text);
        if (it == path_map.end()) {
            log::debug() << "Reference " << text << " (" << ref.node().tag()
                         << ") not relocated";
            continue;
        }
        if (it->second != text) {
            ref.set_text(it->second);
            ++rewritten;
        }
    }
    return rewritten;
}

void relocate_prefix(const std::vector<ReferenceField>& refs,
                     const std::string& old_prefix,
                     const std::string& new_prefix) {
    if (old_prefix.empty()) {
        throw std::invalid_argument("relocate_prefix: empty prefix");
    }

    // Rewritten texts are computed from the original texts; a field listed
    // twice is written once.
    std::set<std::pair<const Node*, std::optional<std::string>>> seen;
    std::vector<std::pair<const ReferenceField*, std::string>> writes;
    for (const auto& ref : refs) {
        if (!seen.emplace(&ref.node(), ref.attribute()).second) continue;
        std::string text = ref.text();
        const auto pos = text.find(old_prefix);
        if (pos == std::string::npos) {
            throw PrefixNotFoundError(text, old_prefix);
        }
        text.replace(pos, old_prefix.size(), new_prefix);
        writes.emplace_back(&ref, std::move(text));
    }

    for (auto& [ref, text] : writes) {
        ref->set_text(std::move(text));
    }
}

std::size_t prefix_names(Node& root, const std::string& tag, const std::string& prefix,
                         const IdentityGenerator& generate) {
    std::size_t renamed = 0;
    for (Node* node : root.find_all(tag)) {
        auto name = node->local_name();
        if (!name) {
            log::warning() << "Cannot prefix anonymous " << tag;
            continue;
        }
        replace_identity(*node, generate);
        node->set_local_name(prefix + *name);
        ++renamed;
    }
    return renamed;
}

std::size_t prefix_reference_targets(const std::vector<ReferenceField>& refs,
                                     const std::string& prefix,
                                     std::optional<std::size_t> segment,
                                     const ReferenceFilter& filter) {
    std::size_t rewritten = 0;
    for (const auto& ref : refs) {
        if (filter && !filter(ref)) continue;

        auto segments = split_path(ref.text());
        if (segments.empty()) continue;

        const std::size_t index = segment.value_or(segments.size() - 1);
        if (index >= segments.size()) {
            log::warning() << "Reference " << ref.text() << " has no segment " << index;
            continue;
        }
        segments[index] = prefix + segments[index];
        ref.set_text(join_path(segments));
        ++rewritten;
    }
    return rewritten;
}

} // namespace treelink
