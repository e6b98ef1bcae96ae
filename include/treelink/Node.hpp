/**
 * @file Node.hpp
 * @brief Tagged tree node
 *
 * A node has a tag, an ordered attribute map, optional text and an ordered
 * list of children it owns. It carries no parent pointer: parents are
 * tracked by the Document that holds the tree.
 *
 * The child-mutating members are meant for building detached subtrees
 * (factories, codecs, tests). Once a node belongs to a Document, structural
 * changes must go through attach()/Document::detach() or the document's
 * parent index goes stale.
 */

#ifndef TREELINK_NODE_HPP
#define TREELINK_NODE_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace treelink {

class Node;
using NodePtr = std::unique_ptr<Node>;

class Node {
public:
    explicit Node(std::string tag, std::string text = {})
        : tag_(std::move(tag)), text_(std::move(text)) {}

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& tag() const noexcept { return tag_; }

    const std::string& text() const noexcept { return text_; }
    void set_text(std::string text) { text_ = std::move(text); }

    // Attributes
    const std::map<std::string, std::string>& attributes() const noexcept {
        return attributes_;
    }
    std::optional<std::string> attribute(const std::string& key) const;
    void set_attribute(const std::string& key, std::string value);
    bool erase_attribute(const std::string& key);

    // Children
    const std::vector<NodePtr>& children() const noexcept { return children_; }
    std::size_t child_count() const noexcept { return children_.size(); }
    Node& child(std::size_t index) { return *children_.at(index); }
    const Node& child(std::size_t index) const { return *children_.at(index); }

    /**
     * @brief Append a child to a detached subtree
     * @return Reference to the appended child
     */
    Node& append_child(NodePtr child);

    /**
     * @brief Insert a child at index (clamped to the child count)
     */
    Node& insert_child(std::size_t index, NodePtr child);

    /**
     * @brief Remove a direct child and hand back ownership
     * @return The released child, or nullptr if it is not a direct child
     */
    NodePtr release_child(const Node& child);

    /**
     * @brief Remove and return every child
     */
    std::vector<NodePtr> release_children();

    std::optional<std::size_t> index_of(const Node& child) const noexcept;

    // First direct child with the tag
    Node* find_child(const std::string& tag) const noexcept;

    // First descendant with the tag (pre-order, excluding this node)
    Node* find(const std::string& tag) const noexcept;

    // All descendants with the tag (pre-order, excluding this node)
    std::vector<Node*> find_all(const std::string& tag) const;

    /**
     * @brief Local name: text of the first SHORT-NAME child
     * @return The name, or nullopt for anonymous nodes
     */
    std::optional<std::string> local_name() const;

    // Set (or create) the SHORT-NAME child
    void set_local_name(const std::string& name);

    bool is_anonymous() const { return !local_name().has_value(); }

    // Tag, plus the local name when there is one
    std::string describe() const;

    // Deep copy
    NodePtr clone() const;

private:
    std::string tag_;
    std::string text_;
    std::map<std::string, std::string> attributes_;
    std::vector<NodePtr> children_;
};

/**
 * @brief Create a leaf node
 */
NodePtr make_node(std::string tag, std::string text = {});

/**
 * @brief Create a node with a SHORT-NAME child
 *
 * Example:
 * ```cpp
 * auto pdu = make_named("I-SIGNAL-I-PDU", "P1");
 * // <I-SIGNAL-I-PDU><SHORT-NAME>P1</SHORT-NAME></I-SIGNAL-I-PDU>
 * ```
 */
NodePtr make_named(std::string tag, const std::string& name);

} // namespace treelink

#endif // TREELINK_NODE_HPP
