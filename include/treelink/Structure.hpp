/**
 * @file Structure.hpp
 * @brief Attach primitives and schema-ordered container synthesis
 *
 * attach() is the one way to add nodes to a Document: it mutates the tree
 * and the parent index together. Transparent containers (tags::kTransparent)
 * are never nested; their children are spliced into the target parent.
 *
 * Some formats fix the order of a node's sub-containers. A ContainerLayout
 * lists that order together with a factory for every container that may be
 * created on demand; entries without a factory are required and must
 * already be present.
 */

#ifndef TREELINK_STRUCTURE_HPP
#define TREELINK_STRUCTURE_HPP

#include "treelink/Document.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace treelink {

/**
 * @brief Append a child under parent and index it
 *
 * If the child is a transparent container its children are appended one
 * by one (re-parented to parent) and the container itself is discarded.
 *
 * @param doc Document that holds parent
 * @param parent Target node
 * @param child Detached subtree
 */
void attach(Document& doc, Node& parent, NodePtr child);

/**
 * @brief Append several children in order (each one as by attach())
 */
void attach(Document& doc, Node& parent, std::vector<NodePtr> children);

/**
 * @brief Insert a child at index (clamped to the child count) and index it
 * @return Reference to the inserted child
 * @throws std::invalid_argument if child is a transparent container
 */
Node& attach_at(Document& doc, Node& parent, NodePtr child, std::size_t index);

using ContainerFactory = std::function<NodePtr()>;

/**
 * @brief One position in a container layout
 *
 * A null factory marks the container as required.
 */
struct LayoutEntry {
    std::string tag;
    ContainerFactory factory;
};

using ContainerLayout = std::vector<LayoutEntry>;

/**
 * @brief Where a container with tag should be inserted under parent
 *
 * @return 0 if tag is first in the layout; otherwise the index right after
 *         the last child carrying the nearest preceding layout tag that is
 *         present; nullopt if no preceding layout tag is present
 * @throws std::invalid_argument if tag is not in the layout
 */
std::optional<std::size_t> insertion_index(const Node& parent,
                                           const std::string& tag,
                                           const ContainerLayout& layout);

/**
 * @brief Get a sub-container, synthesizing it at its ordered position
 *
 * When the container is absent and the layout has a factory for it, the
 * new container is inserted at insertion_index(). Without an anchor it is
 * appended at the end and a warning is logged.
 *
 * @return The existing or the new container
 * @throws MissingRequiredContainer if absent and the entry has no factory
 * @throws std::invalid_argument if tag is not in the layout
 *
 * Example:
 * ```cpp
 * ContainerLayout channel = {
 *     {"SHORT-NAME", nullptr},
 *     {"COMM-CONNECTORS", nullptr},
 *     {"PDU-TRIGGERINGS", [] { return make_node("PDU-TRIGGERINGS"); }},
 * };
 * Node& trig = ensure_container(doc, eth_channel, "PDU-TRIGGERINGS", channel);
 * ```
 */
Node& ensure_container(Document& doc, Node& parent, const std::string& tag,
                       const ContainerLayout& layout);

/**
 * @brief Get a sub-container that must exist
 * @throws MissingRequiredContainer if parent has no child with tag
 */
Node& require_container(const Document& doc, Node& parent, const std::string& tag);

/**
 * @brief Containers to guarantee on every node with a given tag
 */
struct LayoutRule {
    std::string parent;
    ContainerLayout layout;
    // Tags to ensure_container() on each matching parent, in this order
    std::vector<std::string> ensure;
};

/**
 * @brief Apply a layout rule to every node of the document tagged rule.parent
 * @return Number of containers synthesized
 * @throws MissingRequiredContainer if an ensured tag has no factory and is absent
 */
std::size_t apply_layout(Document& doc, const LayoutRule& rule);

/**
 * @brief Factory for an empty container holding empty sub-containers
 */
ContainerFactory container_factory(std::string tag,
                                   std::vector<std::string> children = {});

} // namespace treelink

#endif // TREELINK_STRUCTURE_HPP
