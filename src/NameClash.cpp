/**
 * @file NameClash.cpp
 * @brief Implementation of the clash record
 */

#include "treelink/NameClash.hpp"

#include <sstream>

namespace treelink {

const char* mode_name(MergeMode mode) noexcept {
    return mode == MergeMode::Strict ? "strict" : "graceful";
}

void NameClashSet::record(ClashEvent event) {
    if (event.mode == MergeMode::Strict) {
        strict_.push_back(std::move(event));
    } else {
        graceful_.push_back(std::move(event));
    }
}

void NameClashSet::reset() noexcept {
    strict_.clear();
    graceful_.clear();
}

std::string NameClashSet::summary() const {
    std::ostringstream oss;
    auto write = [&](const ClashEvent& e) {
        oss << mode_name(e.mode) << ": " << e.keys.size() << " clash(es) merging "
            << e.source_container << " (" << e.source_document << ") into "
            << e.destination_container << ": [";
        for (size_t i = 0; i < e.keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << e.keys[i];
        }
        oss << "]\n";
    };
    for (const auto& e : strict_) write(e);
    for (const auto& e : graceful_) write(e);
    return oss.str();
}

} // namespace treelink
