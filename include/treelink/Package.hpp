/**
 * @file Package.hpp
 * @brief Copying named packages between documents
 *
 * A package is an AR-PACKAGE node: a SHORT-NAME, an ELEMENTS container
 * holding its members and, optionally, an AR-PACKAGES container holding
 * nested packages. Copying a package merges its members into the package
 * of the same name in the destination (creating it when missing) and then
 * recurses into the nested packages.
 */

#ifndef TREELINK_PACKAGE_HPP
#define TREELINK_PACKAGE_HPP

#include "treelink/Identity.hpp"
#include "treelink/Merge.hpp"
#include "treelink/Structure.hpp"

#include <string>
#include <vector>

namespace treelink {

/**
 * @brief Merge policy for one root package
 *
 * When graceful is empty every package of the tree is merged in the run's
 * default mode. Otherwise only the (nested) packages listed are merged
 * gracefully and all the others strictly.
 */
struct PackageRule {
    std::string name;
    std::vector<std::string> graceful;
};

MergeMode mode_for(const PackageRule& rule, const std::string& package, MergeMode default_mode);

struct PackageCopyOptions {
    MergeMode default_mode = MergeMode::Graceful;
    // Root packages whose absence from a source is not an error
    std::vector<std::string> tolerate_missing;
    IdentityGenerator generate = generate_identity;
};

struct CopyReport {
    PathMap paths;
    // Root packages absent from the source and not tolerated
    std::vector<std::string> missing;
};

/**
 * @brief Child order of an AR-PACKAGE: SHORT-NAME, ELEMENTS, AR-PACKAGES
 */
const ContainerLayout& package_layout();

/**
 * @brief First AR-PACKAGE below root with the given name (pre-order)
 */
Node* find_package(const Node& root, const std::string& name);

/**
 * @brief Container holding the root packages of a document
 * @throws MissingRequiredContainer if the root has no AR-PACKAGES
 */
Node& root_packages(Document& doc);

/**
 * @brief Copy one package (recursively) under dst_parent
 *
 * @param src Source AR-PACKAGE in src_doc
 * @param dst_parent AR-PACKAGES container in dst_doc
 * @return Accumulated PathMap of every member merged
 * @throws MissingRequiredContainer if a package has no SHORT-NAME
 */
PathMap copy_package(Node& src,
                     Node& dst_parent,
                     Document& src_doc,
                     Document& dst_doc,
                     NameClashSet& clashes,
                     const PackageRule& rule,
                     const PackageCopyOptions& options = {});

/**
 * @brief Copy every root package a rule names from src_doc into dst_doc
 *
 * Missing source packages are warned about and reported unless tolerated.
 *
 * @throws MergeStepError naming the document and package when a copy fails
 */
CopyReport copy_root_packages(Document& src_doc,
                              Document& dst_doc,
                              const std::vector<PackageRule>& rules,
                              NameClashSet& clashes,
                              const PackageCopyOptions& options = {});

} // namespace treelink

#endif // TREELINK_PACKAGE_HPP
