/**
 * @file Errors.hpp
 * @brief Exception types for treelink
 *
 * Error taxonomy:
 * - TreelinkError: Base class
 * - PathResolutionError: Parent index broken (node attached outside the engine)
 * - MissingRequiredContainer: Destination lacks a non-synthesizable container
 * - PrefixNotFoundError: Prefix substitution asked for an absent prefix
 * - UnmappedReferenceError: Reference missing from a PathMap in strict relocation
 * - AnonymousNodeError: Node has no key under the key function in use
 * - DuplicateSourceKeyError: Two source nodes of one merge share a key
 * - MergeStepError: Any of the above, with the document/package being merged
 * - FileNotFoundError, ParseError: Document and plan IO
 * - KeyError, TypeError, MissingMandatoryConfig: Plan configuration
 *
 * Name clashes are not exceptions; they are recorded in a NameClashSet.
 */

#ifndef TREELINK_ERRORS_HPP
#define TREELINK_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace treelink {

/**
 * @brief Base class for all treelink exceptions
 */
class TreelinkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A node's chain to the root is missing from the parent index
 *
 * Always a usage error: the node or one of its ancestors was attached
 * without going through attach().
 */
class PathResolutionError : public TreelinkError {
public:
    /**
     * @param document Name of the document being walked
     * @param node Tag (and name, when known) of the node whose parent is missing
     */
    PathResolutionError(std::string document, std::string node)
        : TreelinkError("Cannot resolve path of '" + node + "' in document '" +
                        document + "': parent link missing")
        , document_(std::move(document))
        , node_(std::move(node))
    {}

    const std::string& document() const noexcept { return document_; }
    const std::string& node() const noexcept { return node_; }

private:
    std::string document_;
    std::string node_;
};

/**
 * @brief A container that cannot be synthesized is absent
 */
class MissingRequiredContainer : public TreelinkError {
public:
    /**
     * @param parent Description of the parent that should hold the container
     * @param tag Tag of the missing container
     */
    MissingRequiredContainer(std::string parent, std::string tag)
        : TreelinkError("Required container '" + tag + "' is missing in '" +
                        parent + "'")
        , parent_(std::move(parent))
        , tag_(std::move(tag))
    {}

    const std::string& parent() const noexcept { return parent_; }
    const std::string& tag() const noexcept { return tag_; }

private:
    std::string parent_;
    std::string tag_;
};

/**
 * @brief Prefix substitution target does not contain the prefix
 */
class PrefixNotFoundError : public TreelinkError {
public:
    PrefixNotFoundError(std::string text, std::string prefix)
        : TreelinkError("The path '" + text + "' does not contain subpath '" +
                        prefix + "'")
        , text_(std::move(text))
        , prefix_(std::move(prefix))
    {}

    const std::string& text() const noexcept { return text_; }
    const std::string& prefix() const noexcept { return prefix_; }

private:
    std::string text_;
    std::string prefix_;
};

/**
 * @brief Strict relocation met a reference with no PathMap entry
 */
class UnmappedReferenceError : public TreelinkError {
public:
    explicit UnmappedReferenceError(std::string text)
        : TreelinkError("Reference '" + text + "' has no relocation entry")
        , text_(std::move(text))
    {}

    const std::string& text() const noexcept { return text_; }

private:
    std::string text_;
};

/**
 * @brief A source node has no key under the key function in use
 */
class AnonymousNodeError : public TreelinkError {
public:
    explicit AnonymousNodeError(std::string tag)
        : TreelinkError("Node '" + tag + "' has no name; supply a key function")
        , tag_(std::move(tag))
    {}

    const std::string& tag() const noexcept { return tag_; }

private:
    std::string tag_;
};

/**
 * @brief Two nodes of the same extend() call share a key
 */
class DuplicateSourceKeyError : public TreelinkError {
public:
    DuplicateSourceKeyError(std::string container, std::string key)
        : TreelinkError("Duplicate source key '" + key + "' under '" +
                        container + "'")
        , container_(std::move(container))
        , key_(std::move(key))
    {}

    const std::string& container() const noexcept { return container_; }
    const std::string& key() const noexcept { return key_; }

private:
    std::string container_;
    std::string key_;
};

/**
 * @brief A merge step failed; names the source document and package
 */
class MergeStepError : public TreelinkError {
public:
    MergeStepError(std::string document, std::string package, std::string details)
        : TreelinkError("Merging package '" + package + "' from '" + document +
                        "' failed: " + details)
        , document_(std::move(document))
        , package_(std::move(package))
        , details_(std::move(details))
    {}

    const std::string& document() const noexcept { return document_; }
    const std::string& package() const noexcept { return package_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string document_;
    std::string package_;
    std::string details_;
};

/**
 * @brief Document or plan file not found
 */
class FileNotFoundError : public TreelinkError {
public:
    explicit FileNotFoundError(std::string path)
        : TreelinkError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Document or plan file is malformed
 */
class ParseError : public TreelinkError {
public:
    /**
     * @param file Path (or label) of the input with the error
     * @param details Parser message or the offending element
     */
    ParseError(std::string file, std::string details)
        : TreelinkError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Plan key not found during dot-path traversal
 */
class KeyError : public TreelinkError {
public:
    KeyError(std::string path, std::string segment)
        : TreelinkError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Plan value has the wrong type or an unknown enumerator
 */
class TypeError : public TreelinkError {
public:
    /**
     * @param path Dot-path of the offending value
     * @param expected What was expected (e.g., "string", "strict|graceful")
     * @param actual What was found
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : TreelinkError("Invalid value at '" + path + "': expected " +
                        expected + ", got " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Mandatory plan keys are missing after layering
 */
class MissingMandatoryConfig : public TreelinkError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : TreelinkError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace treelink

#endif // TREELINK_ERRORS_HPP
