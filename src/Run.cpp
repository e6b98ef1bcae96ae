/**
 * @file Run.cpp
 * @brief Implementation of a merge run
 */

#include "treelink/Run.hpp"
#include "treelink/Codec.hpp"
#include "treelink/Identity.hpp"
#include "treelink/NameClash.hpp"
#include "treelink/Package.hpp"
#include "treelink/Relocate.hpp"
#include "treelink/Structure.hpp"

#include <exception>

namespace treelink {

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == delim) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

int run_merge(const RunOptions& options, std::ostream& err) {
    try {
        const MergePlan plan = load_plan(options.plan);
        log::set_level(options.log_level.value_or(plan.log_level));

        // Destination
        Document dst = load_document(options.dst_path);
        log::info() << "Loaded destination " << options.dst_path;

        for (const auto& rule : plan.layouts) {
            const auto created = apply_layout(dst, rule);
            if (created > 0) {
                log::info() << "Synthesized " << created << " container(s) under " << rule.parent;
            }
        }

        // Sources
        NameClashSet clashes;
        PackageCopyOptions copy;
        copy.default_mode = plan.default_mode;
        copy.tolerate_missing = plan.tolerate_missing;

        std::vector<std::string> missing;
        for (const auto& src_path : options.src_paths) {
            Document src = load_document(src_path);
            log::info() << "Merging " << src_path;

            CopyReport report = copy_root_packages(src, dst, plan.packages, clashes, copy);
            for (const auto& name : report.missing) {
                missing.push_back(name + " (" + src_path + ")");
            }

            const auto refs = collect_references(dst.root());
            const auto moved = relocate(refs, report.paths);
            log::debug() << moved << " reference(s) relocated after " << src_path;
        }

        if (clashes.any_graceful_clash()) {
            log::warning() << "Skipped clashing elements:\n" << clashes.summary();
        }
        if (clashes.any_strict_clash()) {
            err << "Error: name clashes in strict packages, nothing written\n"
                << clashes.summary();
            return 1;
        }
        if (!missing.empty()) {
            err << "Error: packages missing from sources, nothing written:\n";
            for (const auto& m : missing) err << "  " << m << "\n";
            return 1;
        }

        if (plan.unique_identities) {
            const auto replaced = ensure_unique_identities(dst);
            log::info() << replaced << " duplicate identit(ies) replaced";
        }

        save_document(dst, options.out_path);
        log::info() << "Wrote " << options.out_path;
        return 0;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace treelink
