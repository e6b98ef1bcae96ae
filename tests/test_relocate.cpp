/**
 * @file test_relocate.cpp
 * @brief Tests for reference relocation and name prefixing
 */

#include <gtest/gtest.h>
#include "treelink/Errors.hpp"
#include "treelink/Relocate.hpp"

#include <initializer_list>
#include <memory>
#include <stdexcept>

using namespace treelink;

namespace {

NodePtr refs_tree(std::initializer_list<std::string> targets) {
    auto root = make_node("ROOT");
    for (const auto& t : targets) {
        root->append_child(make_node("I-SIGNAL-REF", t));
    }
    return root;
}

IdentityGenerator counter(const std::string& prefix) {
    auto n = std::make_shared<int>(0);
    return [prefix, n] { return prefix + std::to_string((*n)++); };
}

} // anonymous namespace

// ============================================================================
// collect_references
// ============================================================================

TEST(CollectReferences, BySuffix) {
    auto root = make_node("ROOT");
    root->append_child(make_node("I-SIGNAL-REF", "/a"));
    Node& nested = root->append_child(make_named("X", "x"));
    nested.append_child(make_node("FRAME-TREF", "/b"));
    nested.append_child(make_node("REFERENCE", "/c"));

    auto refs = collect_references(*root);
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].text(), "/a");
    EXPECT_EQ(refs[1].text(), "/b");
}

TEST(CollectReferences, ByTag) {
    auto root = refs_tree({"/a", "/b"});
    root->append_child(make_node("FRAME-REF", "/c"));
    EXPECT_EQ(collect_references(*root, "FRAME-REF").size(), 1u);
    EXPECT_EQ(collect_references(*root, "I-SIGNAL-REF").size(), 2u);
}

TEST(ReferenceField, AttributeField) {
    auto node = make_node("PORT");
    ReferenceField field(*node, "DEST");
    EXPECT_EQ(field.text(), "");
    field.set_text("/P/Q");
    EXPECT_EQ(node->attribute("DEST").value(), "/P/Q");
    EXPECT_EQ(node->text(), "");
}

// ============================================================================
// relocate
// ============================================================================

TEST(Relocate, RewritesMappedReferencesOnly) {
    auto root = refs_tree({"/A/X", "/A/Y", "/Other"});
    auto refs = collect_references(*root);
    PathMap map = {{"/A/X", "/B/X"}, {"/A/Y", "/A/Y"}};

    EXPECT_EQ(relocate(refs, map), 1u);
    EXPECT_EQ(refs[0].text(), "/B/X");
    EXPECT_EQ(refs[1].text(), "/A/Y");
    EXPECT_EQ(refs[2].text(), "/Other");
}

TEST(Relocate, RequirePolicyFailsWithoutModifying) {
    auto root = refs_tree({"/A/X", "/Unmapped"});
    auto refs = collect_references(*root);
    PathMap map = {{"/A/X", "/B/X"}};

    try {
        relocate(refs, map, UnmappedPolicy::Require);
        FAIL() << "expected UnmappedReferenceError";
    } catch (const UnmappedReferenceError& e) {
        EXPECT_EQ(e.text(), "/Unmapped");
    }
    EXPECT_EQ(refs[0].text(), "/A/X");
}

TEST(Relocate, AttributeReferences) {
    auto node = make_node("PORT");
    node->set_attribute("DEST", "/A/X");
    std::vector<ReferenceField> refs = {ReferenceField(*node, "DEST")};
    relocate(refs, {{"/A/X", "/B/X"}});
    EXPECT_EQ(node->attribute("DEST").value(), "/B/X");
}

// ============================================================================
// relocate_prefix
// ============================================================================

TEST(RelocatePrefix, ReplacesPrefixExactly) {
    auto root = refs_tree({"/Old/Sub/Leaf", "/Old/Sub/Other/Leaf"});
    auto refs = collect_references(*root);

    relocate_prefix(refs, "/Old/Sub", "/New/Other");
    EXPECT_EQ(refs[0].text(), "/New/Other/Leaf");
    EXPECT_EQ(refs[1].text(), "/New/Other/Other/Leaf");
}

TEST(RelocatePrefix, ReplacesFirstOccurrenceOnly) {
    auto root = refs_tree({"/A/x/A/y"});
    auto refs = collect_references(*root);
    relocate_prefix(refs, "/A", "/B");
    EXPECT_EQ(refs[0].text(), "/B/x/A/y");
}

TEST(RelocatePrefix, MissingPrefixThrowsAndLeavesTextUnchanged) {
    auto root = refs_tree({"/Old/Sub/Leaf", "/Elsewhere/Leaf"});
    auto refs = collect_references(*root);

    try {
        relocate_prefix(refs, "/Old/Sub", "/New");
        FAIL() << "expected PrefixNotFoundError";
    } catch (const PrefixNotFoundError& e) {
        EXPECT_EQ(e.text(), "/Elsewhere/Leaf");
        EXPECT_EQ(e.prefix(), "/Old/Sub");
    }
    EXPECT_EQ(refs[0].text(), "/Old/Sub/Leaf");
    EXPECT_EQ(refs[1].text(), "/Elsewhere/Leaf");
}

TEST(RelocatePrefix, RepeatedFieldIsRewrittenOnce) {
    auto root = refs_tree({"/Old/Sub/Leaf", "/Old/Sub/Other"});
    auto refs = collect_references(*root);
    refs.push_back(refs[0]);

    // A second pass over the first field would no longer find the prefix
    EXPECT_NO_THROW(relocate_prefix(refs, "/Old/Sub", "/New/Other"));
    EXPECT_EQ(root->child(0).text(), "/New/Other/Leaf");
    EXPECT_EQ(root->child(1).text(), "/New/Other/Other");
}

TEST(RelocatePrefix, RepeatedFieldFailureLeavesAllUnchanged) {
    auto root = refs_tree({"/Old/Sub/Leaf", "/Elsewhere/Leaf"});
    auto refs = collect_references(*root);
    refs.push_back(refs[0]);

    EXPECT_THROW(relocate_prefix(refs, "/Old/Sub", "/New"), PrefixNotFoundError);
    EXPECT_EQ(root->child(0).text(), "/Old/Sub/Leaf");
    EXPECT_EQ(root->child(1).text(), "/Elsewhere/Leaf");
}

TEST(RelocatePrefix, EmptyPrefixIsRejected) {
    auto root = refs_tree({"/Old/Sub/Leaf"});
    auto refs = collect_references(*root);

    EXPECT_THROW(relocate_prefix(refs, "", "/New"), std::invalid_argument);
    EXPECT_EQ(refs[0].text(), "/Old/Sub/Leaf");
}

// ============================================================================
// Name prefixing
// ============================================================================

TEST(PrefixNames, RenamesAndRefreshesIdentity) {
    auto root = make_node("ROOT");
    for (const auto& name : {"X", "Y"}) {
        auto sig = make_named("SYSTEM-SIGNAL", name);
        sig->set_attribute("UUID", "same");
        root->append_child(std::move(sig));
    }
    root->append_child(make_named("I-SIGNAL", "Z"));

    EXPECT_EQ(prefix_names(*root, "SYSTEM-SIGNAL", "ABC", counter("id-")), 2u);
    EXPECT_EQ(*root->child(0).local_name(), "ABCX");
    EXPECT_EQ(*root->child(1).local_name(), "ABCY");
    EXPECT_EQ(*root->child(2).local_name(), "Z");
    EXPECT_EQ(root->child(0).attribute("UUID").value(), "id-0");
    EXPECT_EQ(root->child(1).attribute("UUID").value(), "id-1");
}

TEST(PrefixReferenceTargets, LastSegmentByDefault) {
    auto root = refs_tree({"/pkg1/pkg2/X"});
    auto refs = collect_references(*root);
    EXPECT_EQ(prefix_reference_targets(refs, "ABC"), 1u);
    EXPECT_EQ(refs[0].text(), "/pkg1/pkg2/ABCX");
}

TEST(PrefixReferenceTargets, ChosenSegmentAndFilter) {
    auto root = make_node("ROOT");
    root->append_child(make_node("PORT-REF", "/Port/Interface/Data"));
    root->append_child(make_node("OTHER-REF", "/Port/Interface/Data"));
    root->append_child(make_node("PORT-REF", "/Short"));
    auto refs = collect_references(*root);

    auto only_ports = [](const ReferenceField& r) { return r.node().tag() == "PORT-REF"; };
    EXPECT_EQ(prefix_reference_targets(refs, "ABC", 1, only_ports), 1u);
    EXPECT_EQ(refs[0].text(), "/Port/ABCInterface/Data");
    EXPECT_EQ(refs[1].text(), "/Port/Interface/Data");
    EXPECT_EQ(refs[2].text(), "/Short");
}
