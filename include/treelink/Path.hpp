/**
 * @file Path.hpp
 * @brief Absolute paths of nodes and path string utilities
 *
 * An absolute path is the '/'-joined chain of local names from the root of
 * a Document down to a node, e.g. "/Communication/Pdu/P1". Anonymous nodes
 * on the chain (ELEMENTS, AR-PACKAGES, PDU-TRIGGERINGS, ...) contribute
 * nothing. Paths are the durable identity that reference fields carry, and
 * they are only meaningful for one Document at one point in time.
 */

#ifndef TREELINK_PATH_HPP
#define TREELINK_PATH_HPP

#include "treelink/Document.hpp"

#include <string>
#include <vector>

namespace treelink {

/**
 * @brief Compute the absolute path of a node
 *
 * Walks the document's parent index from the node to the root.
 *
 * @param node Node whose path is wanted
 * @param doc Document holding the node
 * @return Path such as "/Src/Pdu/P1"; "/" if nothing on the chain is named
 * @throws PathResolutionError if a node below the root has no parent entry
 *
 * Example:
 * ```cpp
 * // root -> AR-PACKAGES -> AR-PACKAGE "Src" -> ELEMENTS -> PDU "P1"
 * absolute_path(p1, doc);  // "/Src/P1"
 * ```
 */
std::string absolute_path(const Node& node, const Document& doc);

/**
 * @brief Split a path into its segments
 *
 * Examples:
 * - "/A/B/C" → ["A", "B", "C"]
 * - "A/B" → ["A", "B"]
 * - "/" → []
 * - "" → []
 */
std::vector<std::string> split_path(const std::string& path);

/**
 * @brief Join segments into an absolute path
 *
 * Examples:
 * - ["A", "B"] → "/A/B"
 * - [] → "/"
 */
std::string join_path(const std::vector<std::string>& segments);

/**
 * @brief Path without its last segment ("/A/B/C" → "/A/B", "/A" → "/")
 */
std::string parent_path(const std::string& path);

/**
 * @brief Last segment of a path ("/A/B/C" → "C", "/" → "")
 */
std::string last_segment(const std::string& path);

/**
 * @brief Find the node an absolute path names
 *
 * Each segment is matched against the named nodes reachable from the
 * current node through anonymous nodes only (pre-order, first match).
 *
 * @param doc Document to search
 * @param path Absolute path
 * @return The node, or nullptr if some segment does not resolve
 *
 * Example:
 * ```cpp
 * Node* pdu = resolve_path(doc, "/Communication/Pdu/P1");
 * ```
 */
Node* resolve_path(Document& doc, const std::string& path);

} // namespace treelink

#endif // TREELINK_PATH_HPP
