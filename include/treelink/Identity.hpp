/**
 * @file Identity.hpp
 * @brief Keeping the UUID attribute unique across a merged document
 *
 * Documents merged from independent sources may carry the same identity
 * value on different nodes, which downstream tools reject. Duplicates are
 * replaced with fresh values rather than dropped so that every node keeps
 * an identity.
 */

#ifndef TREELINK_IDENTITY_HPP
#define TREELINK_IDENTITY_HPP

#include "treelink/Document.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace treelink {

using IdentityGenerator = std::function<std::string()>;

/**
 * @brief Random (version 4) UUID string, e.g. "550e8400-e29b-41d4-a716-446655440000"
 */
std::string generate_identity();

/**
 * @brief Give a node a fresh identity
 * @return The new value, or nullopt (with a warning) if the node has none
 */
std::optional<std::string> replace_identity(Node& node,
                                            const IdentityGenerator& generate = generate_identity);

/**
 * @brief Replace duplicate identity values across a whole document
 *
 * Pre-order traversal from the root; the first node carrying a value keeps
 * it, every later node with the same value gets a fresh one. Run once per
 * document, after every merge into it is done.
 *
 * @return Number of identities replaced
 * @throws TreelinkError if the generator keeps producing values already in use
 */
std::size_t ensure_unique_identities(Document& doc,
                                     const IdentityGenerator& generate = generate_identity);

} // namespace treelink

#endif // TREELINK_IDENTITY_HPP
