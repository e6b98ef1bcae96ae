/**
 * @file Package.cpp
 * @brief Implementation of package copying
 */

#include "treelink/Package.hpp"
#include "treelink/Errors.hpp"
#include "treelink/Log.hpp"
#include "treelink/Path.hpp"
#include "treelink/Tags.hpp"

#include <algorithm>

namespace treelink {

MergeMode mode_for(const PackageRule& rule, const std::string& package, MergeMode default_mode) {
    if (rule.graceful.empty()) {
        return default_mode;
    }
    const bool listed = std::find(rule.graceful.begin(), rule.graceful.end(), package) !=
                        rule.graceful.end();
    return listed ? MergeMode::Graceful : MergeMode::Strict;
}

const ContainerLayout& package_layout() {
    static const ContainerLayout layout = {
        {tags::kName, nullptr},
        {tags::kElements, container_factory(tags::kElements)},
        {tags::kPackages, container_factory(tags::kPackages)},
    };
    return layout;
}

Node* find_package(const Node& root, const std::string& name) {
    for (Node* pkg : root.find_all(tags::kPackage)) {
        if (pkg->local_name() == name) return pkg;
    }
    return nullptr;
}

Node& root_packages(Document& doc) {
    if (doc.root().tag() == tags::kPackages) {
        return doc.root();
    }
    return require_container(doc, doc.root(), tags::kPackages);
}

namespace {

    Node* find_member_package(const Node& parent, const std::string& name) {
        for (Node* m : members(parent)) {
            if (m->tag() == tags::kPackage && m->local_name() == name) return m;
        }
        return nullptr;
    }

    Node& create_package(Node& src, Node& dst_parent, const std::string& name,
                         const Document& src_doc, Document& dst_doc,
                         const PackageCopyOptions& options) {
        std::string suffix = absolute_path(src, src_doc);
        std::replace(suffix.begin(), suffix.end(), '/', '-');

        NodePtr pkg = make_named(tags::kPackage, name);
        pkg->set_attribute(tags::kIdentity, options.generate() + suffix);
        pkg->append_child(make_node(tags::kElements));

        Node& added = attach_at(dst_doc, dst_parent, std::move(pkg), dst_parent.child_count());
        log::info() << "Created package " << absolute_path(added, dst_doc);
        return added;
    }

} // anonymous namespace

PathMap copy_package(Node& src,
                     Node& dst_parent,
                     Document& src_doc,
                     Document& dst_doc,
                     NameClashSet& clashes,
                     const PackageRule& rule,
                     const PackageCopyOptions& options) {
    const auto name = src.local_name();
    if (!name) {
        throw MissingRequiredContainer(absolute_path(src, src_doc) + " (" + src.tag() + ")",
                                       tags::kName);
    }

    Node* dst = find_member_package(dst_parent, *name);
    if (dst == nullptr) {
        dst = &create_package(src, dst_parent, *name, src_doc, dst_doc, options);
    }

    PathMap paths;

    if (Node* src_elements = src.find_child(tags::kElements)) {
        Node& dst_elements = ensure_container(dst_doc, *dst, tags::kElements, package_layout());
        ExtendOptions extend_options;
        extend_options.mode = mode_for(rule, *name, options.default_mode);
        accumulate(paths, extend(members(*src_elements), dst_elements,
                                 src_doc, dst_doc, clashes, extend_options));
    }

    if (Node* src_packages = src.find_child(tags::kPackages)) {
        Node& dst_packages = ensure_container(dst_doc, *dst, tags::kPackages, package_layout());
        for (Node* nested : members(*src_packages)) {
            if (nested->tag() != tags::kPackage) continue;
            accumulate(paths, copy_package(*nested, dst_packages, src_doc, dst_doc,
                                           clashes, rule, options));
        }
    }

    return paths;
}

CopyReport copy_root_packages(Document& src_doc,
                              Document& dst_doc,
                              const std::vector<PackageRule>& rules,
                              NameClashSet& clashes,
                              const PackageCopyOptions& options) {
    CopyReport report;

    for (const auto& rule : rules) {
        log::info() << "Copying package " << rule.name << " from " << src_doc.name();

        Node* src = find_package(src_doc.root(), rule.name);
        if (src == nullptr) {
            const bool tolerated =
                std::find(options.tolerate_missing.begin(), options.tolerate_missing.end(),
                          rule.name) != options.tolerate_missing.end();
            if (tolerated) {
                log::info() << "Package " << rule.name << " not in " << src_doc.name()
                            << " (tolerated)";
            } else {
                log::warning() << "Package " << rule.name << " is missing in "
                               << src_doc.name();
                report.missing.push_back(rule.name);
            }
            continue;
        }

        try {
            accumulate(report.paths, copy_package(*src, root_packages(dst_doc), src_doc,
                                                  dst_doc, clashes, rule, options));
        } catch (const MergeStepError&) {
            throw;
        } catch (const TreelinkError& e) {
            throw MergeStepError(src_doc.name(), rule.name, e.what());
        }
    }

    return report;
}

} // namespace treelink
