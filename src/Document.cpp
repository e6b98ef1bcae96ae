/**
 * @file Document.cpp
 * @brief Implementation of Document and its parent index
 */

#include "treelink/Document.hpp"
#include "treelink/Errors.hpp"

#include <stdexcept>

namespace treelink {

Document::Document(NodePtr root, std::string name)
    : root_(std::move(root)), name_(std::move(name)) {
    if (!root_) {
        throw std::invalid_argument("Document root must not be null");
    }
    for (const auto& c : root_->children()) {
        index_subtree(*root_, *c);
    }
}

Node* Document::parent_of(const Node& node) const noexcept {
    auto it = parents_.find(&node);
    return it == parents_.end() ? nullptr : it->second;
}

bool Document::contains(const Node& node) const noexcept {
    return is_root(node) || parents_.count(&node) > 0;
}

void Document::index_subtree(Node& parent, Node& child) {
    parents_[&child] = &parent;
    for (const auto& c : child.children()) {
        index_subtree(child, *c);
    }
}

void Document::unindex_subtree(const Node& child) noexcept {
    parents_.erase(&child);
    for (const auto& c : child.children()) {
        unindex_subtree(*c);
    }
}

NodePtr Document::detach(Node& node) {
    Node* parent = parent_of(node);
    if (parent == nullptr) {
        throw PathResolutionError(name_, node.describe());
    }
    NodePtr owned = parent->release_child(node);
    if (!owned) {
        // Index says parent, tree disagrees
        throw PathResolutionError(name_, node.describe());
    }
    unindex_subtree(*owned);
    return owned;
}

} // namespace treelink
