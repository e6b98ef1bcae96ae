/**
 * @file Relocate.hpp
 * @brief Rewriting reference fields after a merge
 *
 * A reference field is the text of a node (usually tagged "...-REF" or
 * "...-TREF"), or one attribute of a node, whose value is an absolute path.
 * After nodes move, references are brought up to date either with the
 * PathMap returned by extend() or by swapping a known path prefix.
 *
 * Only the text of the fields changes; nodes and structure are untouched.
 */

#ifndef TREELINK_RELOCATE_HPP
#define TREELINK_RELOCATE_HPP

#include "treelink/Identity.hpp"
#include "treelink/Merge.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace treelink {

class ReferenceField {
public:
    // The node's text
    explicit ReferenceField(Node& node) : node_(&node) {}

    // One attribute of the node
    ReferenceField(Node& node, std::string attribute)
        : node_(&node), attribute_(std::move(attribute)) {}

    Node& node() const noexcept { return *node_; }
    const std::optional<std::string>& attribute() const noexcept { return attribute_; }

    // Current path text; empty when the attribute is absent
    std::string text() const;
    void set_text(std::string text) const;

private:
    Node* node_;
    std::optional<std::string> attribute_;
};

/**
 * @brief Every descendant of root tagged tag, in document order
 */
std::vector<ReferenceField> collect_references(Node& root, const std::string& tag);

/**
 * @brief Every descendant of root whose tag ends in "-REF" or "-TREF"
 */
std::vector<ReferenceField> collect_references(Node& root);

/**
 * @brief What relocate() does with a reference missing from the PathMap
 */
enum class UnmappedPolicy {
    Ignore,   // leave it as it is
    Require   // fail before rewriting anything
};

/**
 * @brief Rewrite references that are keys of path_map to the mapped value
 *
 * @return Number of references rewritten
 * @throws UnmappedReferenceError under UnmappedPolicy::Require if any
 *         reference is not a key; no reference is modified in that case
 *
 * Example:
 * ```cpp
 * // ref text "/A/X", map {"/A/X": "/B/X"}
 * relocate(refs, map);  // ref text is now "/B/X"
 * ```
 */
std::size_t relocate(const std::vector<ReferenceField>& refs,
                     const PathMap& path_map,
                     UnmappedPolicy policy = UnmappedPolicy::Ignore);

/**
 * @brief Replace the first occurrence of old_prefix in every reference
 *
 * A field listed more than once in refs is rewritten once.
 *
 * @throws std::invalid_argument if old_prefix is empty
 * @throws PrefixNotFoundError if some reference does not contain old_prefix;
 *         no reference is modified in that case
 *
 * Example:
 * ```cpp
 * // "/Old/Sub/Leaf"
 * relocate_prefix(refs, "/Old/Sub", "/New/Other");  // "/New/Other/Leaf"
 * ```
 */
void relocate_prefix(const std::vector<ReferenceField>& refs,
                     const std::string& old_prefix,
                     const std::string& new_prefix);

/**
 * @brief Prefix the local name of every descendant tagged tag
 *
 * Renamed nodes are new identities, so each one also gets a fresh UUID.
 *
 * @return Number of nodes renamed
 *
 * Example: prefix "ABC", tag "SYSTEM-SIGNAL": X → ABCX, Y → ABCY
 */
std::size_t prefix_names(Node& root, const std::string& tag, const std::string& prefix,
                         const IdentityGenerator& generate = generate_identity);

using ReferenceFilter = std::function<bool(const ReferenceField&)>;

/**
 * @brief Prefix one path segment of each reference
 *
 * Used together with prefix_names() to keep references pointing at the
 * renamed nodes.
 *
 * @param segment Index of the segment to prefix; nullopt means the last one
 * @param filter Only references it accepts are rewritten (all when empty)
 * @return Number of references rewritten
 *
 * Examples (prefix "ABC"):
 * - last segment: "/pkg1/pkg2/X" → "/pkg1/pkg2/ABCX"
 * - segment 1: "/Port/Interface/Data" → "/Port/ABCInterface/Data"
 */
std::size_t prefix_reference_targets(const std::vector<ReferenceField>& refs,
                                     const std::string& prefix,
                                     std::optional<std::size_t> segment = std::nullopt,
                                     const ReferenceFilter& filter = {});

} // namespace treelink

#endif // TREELINK_RELOCATE_HPP
