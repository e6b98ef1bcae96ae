/**
 * @file Codec.hpp
 * @brief JSON rendering of documents
 *
 * Each node is an object:
 * ```json
 * {
 *   "tag": "AR-PACKAGE",
 *   "attributes": {"UUID": "..."},
 *   "text": "",
 *   "children": [ {"tag": "SHORT-NAME", "text": "Communication"} ]
 * }
 * ```
 * Only "tag" is required. Attribute values must be strings.
 */

#ifndef TREELINK_CODEC_HPP
#define TREELINK_CODEC_HPP

#include "treelink/Document.hpp"
#include "treelink/Value.hpp"

#include <string>

namespace treelink {

/**
 * @brief Build a node tree from its JSON rendering
 * @param j JSON object
 * @param source Label for error messages (file name)
 * @throws ParseError if the structure or a member type is wrong
 */
NodePtr node_from_json(const Value& j, const std::string& source = "<json>");

/**
 * @brief JSON rendering of a node tree; empty members are omitted
 */
Value node_to_json(const Node& node);

/**
 * @brief Load a document from a JSON file; the path becomes its name
 * @throws FileNotFoundError if the file does not exist
 * @throws ParseError if the file is not valid JSON or not a node tree
 */
Document load_document(const std::string& path);

/**
 * @brief Write a document as JSON
 * @throws TreelinkError if the file cannot be written
 */
void save_document(const Document& doc, const std::string& path, int indent = 2);

} // namespace treelink

#endif // TREELINK_CODEC_HPP
