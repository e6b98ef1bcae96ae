/**
 * @file Structure.cpp
 * @brief Implementation of attach primitives and container synthesis
 */

#include "treelink/Structure.hpp"
#include "treelink/Errors.hpp"
#include "treelink/Log.hpp"
#include "treelink/Path.hpp"
#include "treelink/Tags.hpp"

#include <algorithm>
#include <stdexcept>

namespace treelink {

namespace {

    // Parent description for diagnostics; falls back to the tag when the
    // parent itself is not resolvable
    std::string describe_in(const Node& node, const Document& doc) {
        try {
            return absolute_path(node, doc) + " (" + node.tag() + ")";
        } catch (const PathResolutionError&) {
            return node.describe();
        }
    }

    std::ptrdiff_t layout_position(const ContainerLayout& layout, const std::string& tag) {
        auto it = std::find_if(layout.begin(), layout.end(),
                               [&](const LayoutEntry& e) { return e.tag == tag; });
        if (it == layout.end()) {
            throw std::invalid_argument("Tag '" + tag + "' is not part of the container layout");
        }
        return it - layout.begin();
    }

    Node& insert_indexed(Document& doc, Node& parent, NodePtr child, std::size_t index) {
        Node& added = parent.insert_child(index, std::move(child));
        doc.index_subtree(parent, added);
        return added;
    }

} // anonymous namespace

void attach(Document& doc, Node& parent, NodePtr child) {
    if (!child) return;

    if (tags::is_transparent(child->tag())) {
        for (auto& grandchild : child->release_children()) {
            Node& added = parent.append_child(std::move(grandchild));
            doc.index_subtree(parent, added);
        }
        return;
    }

    Node& added = parent.append_child(std::move(child));
    doc.index_subtree(parent, added);
}

void attach(Document& doc, Node& parent, std::vector<NodePtr> children) {
    for (auto& c : children) {
        attach(doc, parent, std::move(c));
    }
}

Node& attach_at(Document& doc, Node& parent, NodePtr child, std::size_t index) {
    if (!child) {
        throw std::invalid_argument("attach_at: child must not be null");
    }
    if (tags::is_transparent(child->tag())) {
        throw std::invalid_argument("attach_at: transparent container '" +
                                    child->tag() + "' cannot be inserted at an index");
    }
    return insert_indexed(doc, parent, std::move(child), index);
}

std::optional<std::size_t> insertion_index(const Node& parent,
                                           const std::string& tag,
                                           const ContainerLayout& layout) {
    const auto position = layout_position(layout, tag);
    if (position == 0) {
        return 0;
    }

    // Walk back through the layout to the nearest sibling that is present
    for (auto i = position - 1; i >= 0; --i) {
        const std::string& anchor = layout[static_cast<std::size_t>(i)].tag;
        const auto& children = parent.children();
        for (std::size_t c = children.size(); c > 0; --c) {
            if (children[c - 1]->tag() == anchor) {
                return c;
            }
        }
    }
    return std::nullopt;
}

Node& ensure_container(Document& doc, Node& parent, const std::string& tag,
                       const ContainerLayout& layout) {
    if (Node* existing = parent.find_child(tag)) {
        return *existing;
    }

    const auto& entry = layout[static_cast<std::size_t>(layout_position(layout, tag))];
    if (!entry.factory) {
        throw MissingRequiredContainer(describe_in(parent, doc), tag);
    }

    NodePtr container = entry.factory();
    auto index = insertion_index(parent, tag, layout);
    if (!index) {
        log::warning() << "No anchor for '" << tag << "' in "
                       << describe_in(parent, doc) << "; appending at the end";
        index = parent.child_count();
    } else {
        log::debug() << "Inserting '" << tag << "' at index " << *index
                     << " of " << describe_in(parent, doc);
    }
    // Synthesized containers are inserted as-is, even transparent ones
    return insert_indexed(doc, parent, std::move(container), *index);
}

Node& require_container(const Document& doc, Node& parent, const std::string& tag) {
    Node* existing = parent.find_child(tag);
    if (existing == nullptr) {
        throw MissingRequiredContainer(describe_in(parent, doc), tag);
    }
    return *existing;
}

std::size_t apply_layout(Document& doc, const LayoutRule& rule) {
    std::vector<Node*> parents = doc.root().find_all(rule.parent);
    if (doc.root().tag() == rule.parent) {
        parents.insert(parents.begin(), &doc.root());
    }

    std::size_t created = 0;
    for (Node* parent : parents) {
        for (const auto& tag : rule.ensure) {
            const bool present = parent->find_child(tag) != nullptr;
            ensure_container(doc, *parent, tag, rule.layout);
            if (!present) ++created;
        }
    }
    return created;
}

ContainerFactory container_factory(std::string tag, std::vector<std::string> children) {
    return [tag = std::move(tag), children = std::move(children)]() {
        NodePtr node = make_node(tag);
        for (const auto& c : children) {
            node->append_child(make_node(c));
        }
        return node;
    };
}

} // namespace treelink
