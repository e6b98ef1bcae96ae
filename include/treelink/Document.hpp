/**
 * @file Document.hpp
 * @brief A tree of nodes plus its parent index
 *
 * Nodes have no parent pointers; the Document keeps an external index
 * from node to parent instead. Constructing a Document indexes the whole
 * tree it is given. After that the index only changes through the
 * attach primitives (Structure.hpp) and detach(), which index or unindex
 * complete subtrees.
 */

#ifndef TREELINK_DOCUMENT_HPP
#define TREELINK_DOCUMENT_HPP

#include "treelink/Node.hpp"

#include <string>
#include <unordered_map>

namespace treelink {

class Document {
public:
    /**
     * @param root Root node (must not be null)
     * @param name Label used in diagnostics, usually the source file
     * @throws std::invalid_argument if root is null
     */
    explicit Document(NodePtr root, std::string name = {});

    Document(Document&&) = default;
    Document& operator=(Document&&) = default;
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    Node& root() noexcept { return *root_; }
    const Node& root() const noexcept { return *root_; }

    const std::string& name() const noexcept { return name_; }

    /**
     * @brief Indexed parent of a node
     * @return The parent, or nullptr for the root and for unindexed nodes
     */
    Node* parent_of(const Node& node) const noexcept;

    bool is_root(const Node& node) const noexcept { return &node == root_.get(); }

    // True for the root and for every node with a parent entry
    bool contains(const Node& node) const noexcept;

    /**
     * @brief Record child (and its whole subtree) as belonging under parent
     *
     * Only the attach primitives should call this, right after the tree
     * mutation they perform.
     */
    void index_subtree(Node& parent, Node& child);

    // Drop the index entries of child and its subtree
    void unindex_subtree(const Node& child) noexcept;

    /**
     * @brief Remove an indexed node from its parent
     * @return Ownership of the removed subtree, no longer indexed here
     * @throws PathResolutionError if the node is the root or not indexed
     */
    NodePtr detach(Node& node);

    std::size_t indexed_count() const noexcept { return parents_.size(); }

private:
    NodePtr root_;
    std::string name_;
    std::unordered_map<const Node*, Node*> parents_;
};

} // namespace treelink

#endif // TREELINK_DOCUMENT_HPP
