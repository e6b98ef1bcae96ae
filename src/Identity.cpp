/**
 * @file Identity.cpp
 * @brief Implementation of identity uniqueness
 */

#include "treelink/Identity.hpp"
#include "treelink/Errors.hpp"
#include "treelink/Log.hpp"
#include "treelink/Tags.hpp"

#include <uuid/uuid.h>

#include <unordered_set>

namespace treelink {

namespace {

    // Attempts at drawing an unused value before giving up
    constexpr int kMaxDraws = 16;

    void collect_identified(Node& node, std::vector<Node*>& out) {
        if (node.attribute(tags::kIdentity)) out.push_back(&node);
        for (const auto& c : node.children()) {
            collect_identified(*c, out);
        }
    }

} // anonymous namespace

std::string generate_identity() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char text[37];
    uuid_unparse_lower(uuid, text);

    return std::string(text);
}

std::optional<std::string> replace_identity(Node& node, const IdentityGenerator& generate) {
    if (!node.attribute(tags::kIdentity)) {
        log::warning() << "Trying to replace the identity of " << node.describe()
                       << ", which has none";
        return std::nullopt;
    }
    std::string fresh = generate();
    log::debug() << "Replacing identity of " << node.describe() << " with " << fresh;
    node.set_attribute(tags::kIdentity, fresh);
    return fresh;
}

std::size_t ensure_unique_identities(Document& doc, const IdentityGenerator& generate) {
    std::vector<Node*> identified;
    collect_identified(doc.root(), identified);

    std::unordered_set<std::string> seen;
    std::size_t replaced = 0;

    for (Node* node : identified) {
        const std::string current = *node->attribute(tags::kIdentity);
        if (seen.insert(current).second) {
            continue;
        }

        std::string fresh;
        int draws = 0;
        do {
            if (++draws > kMaxDraws) {
                throw TreelinkError("Identity generator keeps returning values already in use in '" +
                                    doc.name() + "'");
            }
            fresh = generate();
        } while (seen.count(fresh) > 0);

        log::debug() << "Duplicate identity " << current << " on " << node->describe()
                     << " replaced with " << fresh;
        node->set_attribute(tags::kIdentity, fresh);
        seen.insert(fresh);
        ++replaced;
    }

    if (replaced > 0) {
        log::info() << "Replaced " << replaced << " duplicate identit"
                    << (replaced == 1 ? "y" : "ies") << " in " << doc.name();
    }
    return replaced;
}

} // namespace treelink
