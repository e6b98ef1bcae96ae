/**
 * @file test_package.cpp
 * @brief Tests for copying packages between documents
 */

#include <gtest/gtest.h>
#include "treelink/Errors.hpp"
#include "treelink/Package.hpp"
#include "treelink/Path.hpp"
#include "treelink/Tags.hpp"

using namespace treelink;

namespace {

NodePtr package(const std::string& name, std::vector<std::string> elements,
                std::vector<NodePtr> nested = {}) {
    auto pkg = make_named(tags::kPackage, name);
    Node& e = pkg->append_child(make_node(tags::kElements));
    for (const auto& n : elements) {
        e.append_child(make_named("I-SIGNAL", n));
    }
    if (!nested.empty()) {
        Node& sub = pkg->append_child(make_node(tags::kPackages));
        for (auto& p : nested) sub.append_child(std::move(p));
    }
    return pkg;
}

Document document(const std::string& name, std::vector<NodePtr> packages) {
    auto root = make_node("AUTOSAR");
    Node& top = root->append_child(make_node(tags::kPackages));
    for (auto& p : packages) top.append_child(std::move(p));
    return Document(std::move(root), name);
}

std::vector<NodePtr> list(NodePtr a, NodePtr b = nullptr) {
    std::vector<NodePtr> out;
    out.push_back(std::move(a));
    if (b) out.push_back(std::move(b));
    return out;
}

std::vector<std::string> element_names(const Node& pkg) {
    std::vector<std::string> out;
    if (Node* e = pkg.find_child(tags::kElements)) {
        for (Node* m : members(*e)) out.push_back(m->local_name().value_or(""));
    }
    return out;
}

IdentityGenerator fixed(const std::string& value) {
    return [value] { return value; };
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

TEST(ModeFor, DefaultWithoutGraceList) {
    PackageRule rule{"Communication", {}};
    EXPECT_EQ(mode_for(rule, "Communication", MergeMode::Graceful), MergeMode::Graceful);
    EXPECT_EQ(mode_for(rule, "Anything", MergeMode::Strict), MergeMode::Strict);
}

TEST(ModeFor, GraceListMakesOthersStrict) {
    PackageRule rule{"Communication", {"ISignal"}};
    EXPECT_EQ(mode_for(rule, "ISignal", MergeMode::Strict), MergeMode::Graceful);
    EXPECT_EQ(mode_for(rule, "Communication", MergeMode::Graceful), MergeMode::Strict);
}

TEST(FindPackage, SearchesNestedPackages) {
    Document doc = document("d", list(package("Top", {}, list(package("Inner", {"S"})))));
    Node* inner = find_package(doc.root(), "Inner");
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(absolute_path(*inner, doc), "/Top/Inner");
    EXPECT_EQ(find_package(doc.root(), "Nope"), nullptr);
}

TEST(RootPackages, RequiresContainer) {
    Document doc(make_node("AUTOSAR"), "bare");
    EXPECT_THROW(root_packages(doc), MissingRequiredContainer);
}

// ============================================================================
// copy_package
// ============================================================================

TEST(CopyPackage, MergesIntoExistingPackage) {
    Document src = document("src", list(package("Comm", {"S1", "S2"})));
    Document dst = document("dst", list(package("Comm", {"S0"})));
    NameClashSet clashes;

    PathMap map = copy_package(*find_package(src.root(), "Comm"), root_packages(dst),
                               src, dst, clashes, PackageRule{"Comm", {}});

    EXPECT_EQ(element_names(*find_package(dst.root(), "Comm")),
              (std::vector<std::string>{"S0", "S1", "S2"}));
    EXPECT_EQ(map.at("/Comm/S1"), "/Comm/S1");
    EXPECT_FALSE(clashes.any_graceful_clash());
}

TEST(CopyPackage, CreatesMissingPackageWithIdentity) {
    Document src = document("src", list(package("Comm", {"S1"})));
    Document dst = document("dst", list(package("Other", {})));
    NameClashSet clashes;

    PackageCopyOptions options;
    options.generate = fixed("id");
    copy_package(*find_package(src.root(), "Comm"), root_packages(dst), src, dst, clashes,
                 PackageRule{"Comm", {}}, options);

    Node* created = find_package(dst.root(), "Comm");
    ASSERT_NE(created, nullptr);
    EXPECT_EQ(created->attribute(tags::kIdentity).value(), "id-Comm");
    EXPECT_EQ(element_names(*created), (std::vector<std::string>{"S1"}));
    EXPECT_EQ(absolute_path(*created, dst), "/Comm");
    // Appended after the packages already there
    EXPECT_EQ(root_packages(dst).child(1).local_name().value(), "Comm");
}

TEST(CopyPackage, RecursesIntoNestedPackages) {
    Document src = document("src", list(package("Comm", {"S1"}, list(package("Pdu", {"P1"})))));
    Document dst = document("dst", list(package("Comm", {})));
    NameClashSet clashes;

    PackageCopyOptions options;
    options.generate = fixed("id");
    PathMap map = copy_package(*find_package(src.root(), "Comm"), root_packages(dst),
                               src, dst, clashes, PackageRule{"Comm", {}}, options);

    Node* pdu = find_package(dst.root(), "Pdu");
    ASSERT_NE(pdu, nullptr);
    EXPECT_EQ(absolute_path(*pdu, dst), "/Comm/Pdu");
    EXPECT_EQ(element_names(*pdu), (std::vector<std::string>{"P1"}));
    EXPECT_EQ(pdu->attribute(tags::kIdentity).value(), "id-Comm-Pdu");
    EXPECT_EQ(map.at("/Comm/Pdu/P1"), "/Comm/Pdu/P1");
    EXPECT_EQ(map.size(), 2u);
}

TEST(CopyPackage, GraceListDecidesModePerPackage) {
    Document src = document(
        "src", list(package("Comm", {"Dup"}, list(package("ISignal", {"Dup", "New"})))));
    Document dst = document(
        "dst", list(package("Comm", {"Dup"}, list(package("ISignal", {"Dup"})))));
    NameClashSet clashes;

    copy_package(*find_package(src.root(), "Comm"), root_packages(dst), src, dst, clashes,
                 PackageRule{"Comm", {"ISignal"}});

    ASSERT_EQ(clashes.strict_events().size(), 1u);
    EXPECT_EQ(clashes.strict_events().front().destination_container, "/Comm");
    ASSERT_EQ(clashes.graceful_events().size(), 1u);
    EXPECT_EQ(clashes.graceful_events().front().destination_container, "/Comm/ISignal");
    EXPECT_EQ(element_names(*find_package(dst.root(), "ISignal")),
              (std::vector<std::string>{"Dup", "New"}));
}

TEST(CopyPackage, PackageWithoutNameThrows) {
    Document src = document("src", list(make_node(tags::kPackage)));
    Document dst = document("dst", {});
    NameClashSet clashes;

    Node* anonymous = src.root().find(tags::kPackage);
    EXPECT_THROW(copy_package(*anonymous, root_packages(dst), src, dst, clashes,
                              PackageRule{"X", {}}),
                 MissingRequiredContainer);
}

// ============================================================================
// copy_root_packages
// ============================================================================

TEST(CopyRootPackages, ReportsMissingPackages) {
    Document src = document("src.json", list(package("Comm", {"S1"})));
    Document dst = document("dst.json", list(package("Comm", {})));
    NameClashSet clashes;

    PackageCopyOptions options;
    options.tolerate_missing = {"DataType"};
    const std::vector<PackageRule> rules = {{"Comm", {}}, {"DataType", {}}, {"Ecu", {}}};

    CopyReport report = copy_root_packages(src, dst, rules, clashes, options);
    EXPECT_EQ(report.missing, (std::vector<std::string>{"Ecu"}));
    EXPECT_EQ(report.paths.at("/Comm/S1"), "/Comm/S1");
    EXPECT_EQ(element_names(*find_package(dst.root(), "Comm")),
              (std::vector<std::string>{"S1"}));
}

TEST(CopyRootPackages, ErrorsCarryDocumentAndPackage) {
    Document src = document("src.json", list(package("Comm", {"S1", "S1"})));
    Document dst = document("dst.json", list(package("Comm", {})));
    NameClashSet clashes;

    try {
        copy_root_packages(src, dst, {{"Comm", {}}}, clashes);
        FAIL() << "expected MergeStepError";
    } catch (const MergeStepError& e) {
        EXPECT_EQ(e.document(), "src.json");
        EXPECT_EQ(e.package(), "Comm");
        EXPECT_NE(e.details().find("S1"), std::string::npos);
    }
}

TEST(CopyRootPackages, DestinationWithoutPackagesThrows) {
    Document src = document("src.json", list(package("Comm", {"S1"})));
    Document dst(make_node("AUTOSAR"), "dst.json");
    NameClashSet clashes;

    EXPECT_THROW(copy_root_packages(src, dst, {{"Comm", {}}}, clashes), MergeStepError);
}
