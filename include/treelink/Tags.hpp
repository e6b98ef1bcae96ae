/**
 * @file Tags.hpp
 * @brief Tag and attribute names the engine gives meaning to
 *
 * Everything the engine treats specially by name lives here, so the
 * vocabulary of the target format is defined in one place.
 */

#ifndef TREELINK_TAGS_HPP
#define TREELINK_TAGS_HPP

#include <array>
#include <string>
#include <string_view>

namespace treelink::tags {

// Child whose text is the parent's local name
inline const std::string kName = "SHORT-NAME";

// Attribute holding a node's globally unique identity
inline const std::string kIdentity = "UUID";

inline const std::string kPackage = "AR-PACKAGE";
inline const std::string kElements = "ELEMENTS";
inline const std::string kPackages = "AR-PACKAGES";

/**
 * @brief Transparent (pseudo-)containers
 *
 * Attaching one of these splices its children into the target parent
 * instead of nesting the container itself. Closed set.
 */
inline constexpr std::array<std::string_view, 5> kTransparent = {
    "ELEMENTS",
    "SOCKET-ADDRESSS",
    "DATA-TRANSFORMATIONS",
    "TRANSFORMATION-TECHNOLOGYS",
    "CONNECTION-BUNDLES",
};

inline bool is_transparent(std::string_view tag) noexcept {
    for (auto t : kTransparent) {
        if (t == tag) return true;
    }
    return false;
}

/**
 * @brief Reference nodes end in "-REF" or "-TREF"
 */
inline bool is_reference(std::string_view tag) noexcept {
    auto ends_with = [&](std::string_view suffix) {
        return tag.size() >= suffix.size() &&
               tag.compare(tag.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return ends_with("-REF") || ends_with("-TREF");
}

} // namespace treelink::tags

#endif // TREELINK_TAGS_HPP
