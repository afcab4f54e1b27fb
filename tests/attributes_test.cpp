//! # Attributes Tests
//!
//! Building an item's attribute record from raw attributes: doc fragment
//! collection, `doc(cfg)` folding, includes, re-export docs, aliases and
//! record identity.

#include "clean/attributes.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cleandoc;
using namespace cleandoc::clean;
using namespace cleandoc::host;

namespace {

auto line_doc(AttrId id, std::string text, AttrStyle style = AttrStyle::Outer) -> Attribute {
    return mk_doc_comment(id, style, CommentKind::Line, std::move(text),
                          test::span_at("lib.rs", id));
}

auto raw_doc(AttrId id, std::string text) -> Attribute {
    return mk_attr(id, AttrStyle::Outer, mk_name_value_item_str("doc", std::move(text)),
                   test::span_at("lib.rs", id));
}

auto doc_list(AttrId id, std::vector<NestedMetaItem> items) -> Attribute {
    return mk_attr(id, AttrStyle::Outer, mk_list_item("doc", std::move(items)),
                   test::span_at("lib.rs", id));
}

auto doc_cfg(AttrId id, MetaItem predicate) -> Attribute {
    return doc_list(id, {mk_nested(mk_list_item("cfg", {mk_nested(std::move(predicate))}))});
}

auto doc_include(AttrId id, std::string file, std::string contents) -> Attribute {
    return doc_list(id, {mk_nested(mk_list_item(
                            "include", {mk_nested(mk_name_value_item_str("file", std::move(file))),
                                        mk_nested(mk_name_value_item_str(
                                            "contents", std::move(contents)))}))});
}

} // namespace

class AttributesTest : public ::testing::Test {
protected:
    diag::DiagnosticHandler diag;
};

// ============================================================================
// Doc Collection
// ============================================================================

TEST_F(AttributesTest, SugaredDocsAreJoined) {
    auto attrs = Attributes::from_ast(diag, {line_doc(1, " Hello"), line_doc(2, " world")});

    ASSERT_EQ(attrs.doc_strings.size(), 2u);
    EXPECT_EQ(attrs.doc_strings[0].line, 0u);
    EXPECT_EQ(attrs.doc_strings[1].line, 1u);
    EXPECT_EQ(attrs.doc_value(), "Hello\nworld");
    EXPECT_EQ(attrs.collapsed_doc_value(), "Hello\nworld");
    EXPECT_EQ(attrs.span, test::span_at("lib.rs", 1));
    EXPECT_FALSE(attrs.inner_docs);
    EXPECT_TRUE(attrs.other_attrs.empty());
}

TEST_F(AttributesTest, InnerDocsFollowFirstDocAttribute) {
    auto inner = Attributes::from_ast(diag, {line_doc(1, " Crate docs.", AttrStyle::Inner)});
    auto none = Attributes::from_ast(diag, {});

    EXPECT_TRUE(inner.inner_docs);
    EXPECT_TRUE(none.inner_docs);
    EXPECT_FALSE(none.doc_value().has_value());
    EXPECT_FALSE(none.collapsed_doc_value().has_value());
}

TEST_F(AttributesTest, BlockCommentIsBeautified) {
    auto attrs = Attributes::from_ast(
        diag, {mk_doc_comment(1, AttrStyle::Outer, CommentKind::Block, "*\n * Frobs.\n ")});

    EXPECT_EQ(attrs.doc_value(), "Frobs.");
}

TEST_F(AttributesTest, RawDocBreaksDocValue) {
    auto attrs = Attributes::from_ast(diag, {line_doc(1, " Summary."), raw_doc(2, "Details.")});

    ASSERT_EQ(attrs.doc_strings.size(), 2u);
    EXPECT_TRUE(attrs.doc_strings[1].kind.is_raw());
    EXPECT_EQ(attrs.doc_value(), "Summary.");
    EXPECT_EQ(attrs.collapsed_doc_value(), "Summary.\nDetails.");
}

TEST_F(AttributesTest, NonDocAttributesAreKept) {
    auto attrs = Attributes::from_ast(
        diag, {line_doc(1, " Doc."), mk_attr(2, AttrStyle::Outer, mk_word_item("non_exhaustive"))});

    ASSERT_EQ(attrs.other_attrs.size(), 1u);
    EXPECT_TRUE(attrs.other_attrs[0].has_name("non_exhaustive"));
}

// ============================================================================
// doc(cfg) and target_feature
// ============================================================================

TEST_F(AttributesTest, DocCfgIsFolded) {
    auto attrs = Attributes::from_ast(diag, {doc_cfg(1, mk_word_item("unix"))});

    ASSERT_NE(attrs.cfg, nullptr);
    EXPECT_EQ(*attrs.cfg, Cfg::name_only("unix"));
    EXPECT_TRUE(attrs.has_doc_flag("cfg"));
    EXPECT_FALSE(attrs.has_doc_flag("hidden"));
    EXPECT_EQ(attrs.other_attrs.size(), 1u);
}

TEST_F(AttributesTest, NoCfgMeansNull) {
    auto attrs = Attributes::from_ast(diag, {line_doc(1, " Doc.")});

    EXPECT_EQ(attrs.cfg, nullptr);
}

TEST_F(AttributesTest, InvalidCfgIsReportedAndSkipped) {
    auto attrs = Attributes::from_ast(
        diag, {doc_cfg(1, mk_list_item("not", {mk_nested(mk_word_item("a")),
                                               mk_nested(mk_word_item("b"))}))});

    EXPECT_EQ(attrs.cfg, nullptr);
    ASSERT_EQ(diag.error_count(), 1u);
    EXPECT_EQ(diag.diagnostics()[0].message, "expected 1 cfg-pattern");
    EXPECT_EQ(diag.diagnostics()[0].code, diag::ErrorCodes::INVALID_CFG);
}

TEST_F(AttributesTest, TargetFeatureJoinsCfg) {
    auto target_feature =
        mk_attr(2, AttrStyle::Outer,
                mk_list_item("target_feature", {mk_nested(mk_name_value_item_str("enable", "avx2"))}));
    auto attrs = Attributes::from_ast(diag, {doc_cfg(1, mk_word_item("unix")), target_feature});

    ASSERT_NE(attrs.cfg, nullptr);
    EXPECT_EQ(attrs.cfg->to_string(), "all(unix, target_feature=\"avx2\")");
}

TEST_F(AttributesTest, RepeatedCfgIsIdempotent) {
    auto attrs = Attributes::from_ast(
        diag, {doc_cfg(1, mk_word_item("unix")), doc_cfg(2, mk_word_item("unix"))});

    ASSERT_NE(attrs.cfg, nullptr);
    EXPECT_EQ(*attrs.cfg, Cfg::name_only("unix"));
}

// ============================================================================
// Includes
// ============================================================================

TEST_F(AttributesTest, IncludeBecomesFragment) {
    auto attrs =
        Attributes::from_ast(diag, {doc_include(1, "intro.md", "Included\n"), line_doc(2, " After.")});

    ASSERT_EQ(attrs.doc_strings.size(), 2u);
    EXPECT_EQ(attrs.doc_strings[0].kind, DocFragmentKind::include("intro.md"));
    EXPECT_FALSE(attrs.doc_strings[0].need_backline);
    EXPECT_EQ(attrs.doc_strings[1].line, 1u);
    EXPECT_EQ(attrs.doc_value(), "Included");
    EXPECT_EQ(attrs.collapsed_doc_value(), "Included\nAfter.");
}

TEST_F(AttributesTest, IncompleteIncludeIsIgnored) {
    auto meta = mk_list_item(
        "doc", {mk_nested(mk_list_item("include",
                                       {mk_nested(mk_name_value_item_str("file", "a.md"))}))});

    EXPECT_FALSE(Attributes::extract_include(meta).has_value());

    auto attrs = Attributes::from_ast(diag, {mk_attr(1, AttrStyle::Outer, meta)});
    EXPECT_TRUE(attrs.doc_strings.empty());
}

TEST_F(AttributesTest, ExtractCfgNeedsSinglePredicate) {
    auto two = mk_list_item(
        "doc", {mk_nested(mk_list_item("cfg", {mk_nested(mk_word_item("a")),
                                               mk_nested(mk_word_item("b"))}))});
    auto one = mk_list_item(
        "doc", {mk_nested(mk_list_item("cfg", {mk_nested(mk_word_item("a"))}))});

    EXPECT_EQ(Attributes::extract_cfg(two), nullptr);
    ASSERT_NE(Attributes::extract_cfg(one), nullptr);
    EXPECT_EQ(Attributes::extract_cfg(one)->name, "a");
}

// ============================================================================
// Re-exports
// ============================================================================

TEST_F(AttributesTest, ReexportDocsComeFirst) {
    DefId module{LOCAL_CRATE, 5};
    std::vector<Attribute> reexport{line_doc(10, " From the re-export.")};
    auto attrs = Attributes::from_ast(diag, {line_doc(1, " Original.")},
                                      ReexportAttrs{&reexport, module});

    ASSERT_EQ(attrs.doc_strings.size(), 2u);
    EXPECT_EQ(attrs.doc_strings[0].parent_module, module);
    EXPECT_FALSE(attrs.doc_strings[1].parent_module.has_value());
    EXPECT_TRUE(attrs.doc_strings[0].need_backline);

    // The first block stops at the module boundary
    EXPECT_EQ(attrs.doc_value(), "From the re-export.");
    EXPECT_EQ(attrs.collapsed_doc_value(), "From the re-export.\nOriginal.");

    auto by_module = attrs.collapsed_doc_value_by_module_level();
    EXPECT_EQ(by_module.size(), 2u);
    EXPECT_EQ(by_module[module], "From the re-export.\n");
    EXPECT_EQ(by_module[std::nullopt], "Original.");
}

// ============================================================================
// Flattening
// ============================================================================

TEST_F(AttributesTest, DocValueIsPrefixAndFlatteningIsStable) {
    DefId module{LOCAL_CRATE, 5};
    std::vector<Attribute> reexport{line_doc(10, " From the re-export."), line_doc(11, " Twice.")};

    std::vector<Attributes> cases;
    cases.push_back(Attributes::from_ast(diag, {line_doc(1, " Hello"), line_doc(2, " world")}));
    cases.push_back(Attributes::from_ast(
        diag, {line_doc(1, " Summary."), raw_doc(2, "Details."), line_doc(3, " More.")}));
    cases.push_back(Attributes::from_ast(
        diag, {raw_doc(1, "Raw first."), line_doc(2, " Then sugared.")}));
    cases.push_back(Attributes::from_ast(
        diag, {doc_include(1, "intro.md", "Included\n"), line_doc(2, " After.")}));
    cases.push_back(Attributes::from_ast(diag, {line_doc(1, " Original.")},
                                         ReexportAttrs{&reexport, module}));

    for (const auto& attrs : cases) {
        auto first = attrs.doc_value();
        auto all = attrs.collapsed_doc_value();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(all.has_value());
        EXPECT_EQ(all->compare(0, first->size(), *first), 0) << *first << " vs " << *all;

        for (const std::string& text : {*first, *all}) {
            auto again = Attributes::from_ast(diag, {raw_doc(1, text)});
            EXPECT_EQ(again.doc_value(), text);
            EXPECT_EQ(again.collapsed_doc_value(), text);
        }
    }
    EXPECT_EQ(cases[4].doc_value(), "From the re-export.\nTwice.");
}

// ============================================================================
// Aliases and Lists
// ============================================================================

TEST_F(AttributesTest, DocAliasesInBothForms) {
    auto attrs = Attributes::from_ast(
        diag,
        {doc_list(1, {mk_nested(mk_name_value_item_str("alias", "foo"))}),
         doc_list(2, {mk_nested(mk_list_item("alias", {mk_nested_lit(mk_str_lit("bar")),
                                                       mk_nested_lit(mk_str_lit("")),
                                                       mk_nested_lit(mk_str_lit("baz"))}))}),
         doc_list(3, {mk_nested(mk_name_value_item_str("alias", ""))})});

    auto aliases = attrs.get_doc_aliases();
    EXPECT_EQ(aliases, (std::unordered_set<std::string>{"foo", "bar", "baz"}));
}

TEST_F(AttributesTest, DuplicateAliasesCollapse) {
    auto alias = [](const char* text) {
        return mk_nested(mk_list_item("alias", {mk_nested_lit(mk_str_lit(text))}));
    };
    auto attrs = Attributes::from_ast(diag, {doc_list(1, {alias("foo"), alias(""), alias("foo")})});

    EXPECT_EQ(attrs.get_doc_aliases(), (std::unordered_set<std::string>{"foo"}));
}

TEST_F(AttributesTest, ListsConcatenateEntries) {
    auto attrs = Attributes::from_ast(
        diag, {doc_list(1, {mk_nested(mk_word_item("hidden"))}),
               doc_list(2, {mk_nested(mk_word_item("inline")), mk_nested(mk_word_item("masked"))})});

    auto items = attrs.lists("doc");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_TRUE(has_word(items, "inline"));
    EXPECT_FALSE(has_word(items, "no_inline"));
    ASSERT_TRUE(get_word_attr(items, "masked").has_value());
    EXPECT_TRUE(attrs.has_doc_flag("hidden"));
}

// ============================================================================
// Identity
// ============================================================================

TEST_F(AttributesTest, EqualRecordsHashEqual) {
    std::vector<Attribute> raw{line_doc(1, " Doc."), doc_cfg(2, mk_word_item("unix"))};
    auto a = Attributes::from_ast(diag, raw);
    auto b = Attributes::from_ast(diag, raw);

    EXPECT_EQ(a, b);
    EXPECT_EQ(std::hash<Attributes>{}(a), std::hash<Attributes>{}(b));
}

TEST_F(AttributesTest, OtherAttrsCompareById) {
    auto a = Attributes::from_ast(diag, {mk_attr(1, AttrStyle::Outer, mk_word_item("inline"))});
    auto b = Attributes::from_ast(diag, {mk_attr(2, AttrStyle::Outer, mk_word_item("inline"))});

    EXPECT_FALSE(a == b);
}
