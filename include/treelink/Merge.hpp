/**
 * @file Merge.hpp
 * @brief Merging source nodes into a destination container
 *
 * extend() is the linker step: it moves a batch of source nodes under a
 * destination container, detects keys the destination already owns and
 * reports where every source path ends up, so that references elsewhere
 * can be relocated with the returned PathMap.
 */

#ifndef TREELINK_MERGE_HPP
#define TREELINK_MERGE_HPP

#include "treelink/Document.hpp"
#include "treelink/NameClash.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace treelink {

// Old source path -> new destination path
using PathMap = std::map<std::string, std::string>;

// Merge identity of a node; nullopt when the node has none
using KeyFn = std::function<std::optional<std::string>(const Node&)>;

/**
 * @brief Default key: the node's local name
 */
std::optional<std::string> name_key(const Node& node);

struct ExtendOptions {
    KeyFn src_key = name_key;
    KeyFn dst_key = name_key;
    MergeMode mode = MergeMode::Strict;
};

/**
 * @brief Merge source nodes into a destination container
 *
 * For every named source node the PathMap maps its pre-merge path in
 * src_doc either to the path of the destination child with the same key
 * (a duplicate: the destination already owns that identity) or to
 * "<dst_container path>/<source local name>".
 *
 * Attachment is gated by the overlap of source and destination keys:
 * - no overlap: every source node is attached;
 * - overlap, Graceful: only the non-clashing source nodes are attached;
 * - overlap, Strict: nothing is attached.
 * Overlaps are logged and recorded in clashes. Attached nodes are moved
 * out of src_doc and indexed in dst_doc; transparent source nodes are
 * spliced.
 *
 * The destination's own SHORT-NAME child is not a member, and destination
 * children without a key cannot be matched.
 *
 * @param src_nodes Nodes of src_doc to merge (none may be the root)
 * @param dst_container Destination parent in dst_doc
 * @param src_doc Document holding the source nodes
 * @param dst_doc Document holding dst_container
 * @param clashes Run-wide clash record
 * @param options Key functions and merge mode
 * @return PathMap with one entry per named source node
 * @throws std::invalid_argument if both documents are the same and
 *         dst_container is a source node or lies inside one
 * @throws AnonymousNodeError if a source node has no key
 * @throws DuplicateSourceKeyError if two source nodes share a key
 * @throws PathResolutionError if a node is not resolvable in its document
 *
 * Example:
 * ```cpp
 * // src: /Src/Pdu/{P1,P2}, dst: empty /Dst/Pdu
 * auto map = extend({p1, p2}, dst_pdu, src, dst, clashes);
 * // map == {"/Src/Pdu/P1": "/Dst/Pdu/P1", "/Src/Pdu/P2": "/Dst/Pdu/P2"}
 * ```
 */
PathMap extend(const std::vector<Node*>& src_nodes,
               Node& dst_container,
               Document& src_doc,
               Document& dst_doc,
               NameClashSet& clashes,
               const ExtendOptions& options = {});

/**
 * @brief Member children of a container (all but its SHORT-NAME)
 */
std::vector<Node*> members(const Node& container);

/**
 * @brief Fold a later PathMap into an accumulated one
 *
 * Values of total that are keys of next are rewritten to next's value, so
 * chains like A→B then B→C become A→C; then next's entries are added
 * (replacing entries with the same key).
 */
void accumulate(PathMap& total, const PathMap& next);

} // namespace treelink

#endif // TREELINK_MERGE_HPP
