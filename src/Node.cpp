/**
 * @file Node.cpp
 * @brief Implementation of the tree node
 */

#include "treelink/Node.hpp"
#include "treelink/Tags.hpp"

#include <algorithm>

namespace treelink {

namespace {

void collect(const Node& node, const std::string& tag, std::vector<Node*>& out,
             bool first_only) {
    for (const auto& c : node.children()) {
        if (c->tag() == tag) {
            out.push_back(c.get());
            if (first_only) return;
        }
        collect(*c, tag, out, first_only);
        if (first_only && !out.empty()) return;
    }
}

} // anonymous namespace

std::optional<std::string> Node::attribute(const std::string& key) const {
    auto it = attributes_.find(key);
    if (it == attributes_.end()) return std::nullopt;
    return it->second;
}

void Node::set_attribute(const std::string& key, std::string value) {
    attributes_[key] = std::move(value);
}

bool Node::erase_attribute(const std::string& key) {
    return attributes_.erase(key) > 0;
}

Node& Node::append_child(NodePtr child) {
    children_.push_back(std::move(child));
    return *children_.back();
}

Node& Node::insert_child(std::size_t index, NodePtr child) {
    index = std::min(index, children_.size());
    auto it = children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index),
                               std::move(child));
    return **it;
}

NodePtr Node::release_child(const Node& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [&](const NodePtr& c) { return c.get() == &child; });
    if (it == children_.end()) return nullptr;
    NodePtr out = std::move(*it);
    children_.erase(it);
    return out;
}

std::vector<NodePtr> Node::release_children() {
    std::vector<NodePtr> out;
    out.swap(children_);
    return out;
}

std::optional<std::size_t> Node::index_of(const Node& child) const noexcept {
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == &child) return i;
    }
    return std::nullopt;
}

Node* Node::find_child(const std::string& tag) const noexcept {
    for (const auto& c : children_) {
        if (c->tag() == tag) return c.get();
    }
    return nullptr;
}

Node* Node::find(const std::string& tag) const noexcept {
    std::vector<Node*> out;
    collect(*this, tag, out, true);
    return out.empty() ? nullptr : out.front();
}

std::vector<Node*> Node::find_all(const std::string& tag) const {
    std::vector<Node*> out;
    collect(*this, tag, out, false);
    return out;
}

std::optional<std::string> Node::local_name() const {
    const Node* holder = find_child(tags::kName);
    if (holder == nullptr) return std::nullopt;
    return holder->text();
}

void Node::set_local_name(const std::string& name) {
    if (Node* holder = find_child(tags::kName)) {
        holder->set_text(name);
        return;
    }
    insert_child(0, make_node(tags::kName, name));
}

std::string Node::describe() const {
    auto name = local_name();
    return name ? tag_ + " '" + *name + "'" : tag_;
}

NodePtr Node::clone() const {
    auto copy = std::make_unique<Node>(tag_, text_);
    copy->attributes_ = attributes_;
    for (const auto& c : children_) {
        copy->children_.push_back(c->clone());
    }
    return copy;
}

NodePtr make_node(std::string tag, std::string text) {
    return std::make_unique<Node>(std::move(tag), std::move(text));
}

NodePtr make_named(std::string tag, const std::string& name) {
    auto node = make_node(std::move(tag));
    node->append_child(make_node(tags::kName, name));
    return node;
}

} // namespace treelink
