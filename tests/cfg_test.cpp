//! # Cfg Predicate Tests
//!
//! Parsing from meta items, the simplifying algebra, evaluation and the
//! three rendering forms.

#include "clean/cfg.hpp"

#include "host/attr.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace cleandoc;
using namespace cleandoc::clean;
using namespace cleandoc::host;

namespace {

auto word(const char* name) -> NestedMetaItem {
    return mk_nested(mk_word_item(name));
}

auto name_value(const char* name, const char* value) -> NestedMetaItem {
    return mk_nested(mk_name_value_item_str(name, value));
}

auto parse_ok(const MetaItem& meta) -> Cfg {
    auto result = Cfg::parse(meta);
    EXPECT_TRUE(is_ok(result));
    return is_ok(result) ? unwrap(result) : Cfg::False();
}

auto parse_err(const MetaItem& meta) -> std::string {
    auto result = Cfg::parse(meta);
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result).msg : std::string();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(CfgParseTest, WordAndNameValue) {
    EXPECT_EQ(parse_ok(mk_word_item("unix")), Cfg::name_only("unix"));
    EXPECT_EQ(parse_ok(mk_name_value_item_str("target_os", "linux")),
              Cfg::name_value("target_os", "linux"));
}

TEST(CfgParseTest, NestedLists) {
    auto meta = mk_list_item(
        "all", {word("unix"), mk_nested(mk_list_item("not", {name_value("target_arch", "x86")}))});
    Cfg cfg = parse_ok(meta);

    EXPECT_EQ(cfg.to_string(), "all(unix, not(target_arch=\"x86\"))");
}

TEST(CfgParseTest, EmptyListsAreConstants) {
    EXPECT_TRUE(parse_ok(mk_list_item("all", {})).is_true());
    EXPECT_TRUE(parse_ok(mk_list_item("any", {})).is_false());
}

TEST(CfgParseTest, NotNeedsExactlyOneOperand) {
    EXPECT_EQ(parse_err(mk_list_item("not", {word("a"), word("b")})), "expected 1 cfg-pattern");
    EXPECT_EQ(parse_err(mk_list_item("not", {})), "expected 1 cfg-pattern");
}

TEST(CfgParseTest, UnknownPredicate) {
    EXPECT_EQ(parse_err(mk_list_item("foo", {word("a")})), "invalid predicate `foo`");
}

TEST(CfgParseTest, NonStringValue) {
    Lit lit{LitKind::Int, "1", {}};
    EXPECT_EQ(parse_err(mk_name_value_item("target_pointer_width", lit)),
              "value of cfg option should be a string literal");
}

TEST(CfgParseTest, LiteralOperand) {
    auto meta = mk_list_item("any", {mk_nested_lit(mk_str_lit("unix"))});
    EXPECT_EQ(parse_err(meta), "unexpected literal");
}

TEST(CfgParseTest, ErrorInsideListPropagates) {
    auto meta = mk_list_item("all", {word("unix"), mk_nested(mk_list_item("bogus", {}))});
    EXPECT_EQ(parse_err(meta), "invalid predicate `bogus`");
}

// ============================================================================
// Algebra
// ============================================================================

TEST(CfgAlgebraTest, IdentitiesAndAnnihilators) {
    Cfg unix = Cfg::name_only("unix");

    EXPECT_EQ(Cfg::True() & unix, unix);
    EXPECT_EQ(unix & Cfg::True(), unix);
    EXPECT_TRUE((unix & Cfg::False()).is_false());
    EXPECT_TRUE((Cfg::False() & unix).is_false());

    EXPECT_EQ(Cfg::False() | unix, unix);
    EXPECT_TRUE((unix | Cfg::True()).is_true());
}

TEST(CfgAlgebraTest, AndIsIdempotent) {
    Cfg cfg = Cfg::True();
    cfg &= Cfg::name_only("unix");
    cfg &= Cfg::name_value("target_feature", "avx2");
    Cfg once = cfg;
    cfg &= Cfg::name_only("unix");
    cfg &= Cfg::name_value("target_feature", "avx2");

    EXPECT_EQ(cfg, once);
    EXPECT_EQ(cfg.to_string(), "all(unix, target_feature=\"avx2\")");
}

TEST(CfgAlgebraTest, ConjunctionsFlatten) {
    Cfg a = Cfg::name_only("a");
    Cfg b = Cfg::name_only("b");
    Cfg c = Cfg::name_only("c");

    Cfg merged = (a & b) & (b & c);
    EXPECT_EQ(merged, Cfg::all({a, b, c}));

    Cfg prefixed = a & (b & c);
    EXPECT_EQ(prefixed.kind, Cfg::Kind::All);
    EXPECT_EQ(prefixed.sub.size(), 3u);
}

TEST(CfgAlgebraTest, DisjunctionsFlatten) {
    Cfg cfg = Cfg::name_only("unix") | Cfg::name_only("windows");
    cfg |= Cfg::name_only("unix");

    EXPECT_EQ(cfg.to_string(), "any(unix, windows)");
}

TEST(CfgAlgebraTest, Negation) {
    Cfg unix = Cfg::name_only("unix");

    EXPECT_TRUE((!Cfg::True()).is_false());
    EXPECT_TRUE((!Cfg::False()).is_true());
    EXPECT_EQ(!!unix, unix);
    EXPECT_EQ((!unix).to_string(), "not(unix)");
}

TEST(CfgAlgebraTest, EqualValuesHashEqual) {
    Cfg a = Cfg::name_only("unix") & Cfg::name_value("feature", "serde");
    Cfg b = Cfg::name_only("unix") & Cfg::name_value("feature", "serde");

    EXPECT_EQ(std::hash<Cfg>{}(a), std::hash<Cfg>{}(b));
}

TEST(CfgAlgebraTest, Matches) {
    Cfg cfg = Cfg::name_only("unix") & !Cfg::name_value("target_arch", "x86");
    auto on_x86_64 = [](const std::string& name, const std::optional<std::string>& value) {
        if (name == "unix")
            return !value.has_value();
        return name == "target_arch" && value == "x86_64";
    };
    auto on_x86 = [](const std::string& name, const std::optional<std::string>& value) {
        if (name == "unix")
            return !value.has_value();
        return name == "target_arch" && value == "x86";
    };

    EXPECT_TRUE(cfg.matches(on_x86_64));
    EXPECT_FALSE(cfg.matches(on_x86));
}

// ============================================================================
// Rendering
// ============================================================================

TEST(CfgRenderTest, ShortPlain) {
    EXPECT_EQ(Cfg::name_only("unix").render_short_plain(), "Unix");
    EXPECT_EQ(Cfg::name_value("target_os", "macos").render_short_plain(), "macOS");
    EXPECT_EQ(Cfg::name_value("target_feature", "avx2").render_short_plain(), "`avx2`");
    EXPECT_EQ(Cfg::name_value("target_endian", "little").render_short_plain(), "Little-endian");
    EXPECT_EQ(Cfg::name_value("target_pointer_width", "64").render_short_plain(), "64-bit");
    EXPECT_EQ((!Cfg::name_only("windows")).render_short_plain(), "Non-Windows");
    EXPECT_EQ((Cfg::name_only("unix") | Cfg::name_only("windows")).render_short_plain(),
              "Unix or Windows");
}

TEST(CfgRenderTest, UnknownNamesAreQuoted) {
    EXPECT_EQ(Cfg::name_only("foo").render_short_plain(), "`foo`");
    EXPECT_EQ(Cfg::name_value("foo", "bar").render_short_plain(), "`foo=\"bar\"`");
}

TEST(CfgRenderTest, NonSimpleOperandsAreParenthesized) {
    Cfg cfg = Cfg::name_only("unix") &
              (Cfg::name_value("target_os", "linux") | Cfg::name_value("target_os", "macos"));

    EXPECT_EQ(cfg.render_short_plain(), "Unix, and (Linux or macOS)");
}

TEST(CfgRenderTest, ConjunctionsInsideDisjunctionsNeedNoParens) {
    Cfg cfg = (Cfg::name_only("unix") & Cfg::name_value("target_os", "linux")) |
              !Cfg::name_only("windows");

    EXPECT_TRUE(cfg.sub[0].is_all());
    EXPECT_TRUE(cfg.sub[1].is_all());
    EXPECT_FALSE(cfg.is_all());
    EXPECT_EQ(cfg.render_short_plain(), "Unix and Linux, or non-Windows");
}

TEST(CfgRenderTest, LongPlain) {
    EXPECT_EQ(Cfg::name_only("unix").render_long_plain(), "This is supported on Unix only");
    EXPECT_EQ(Cfg::name_value("target_feature", "avx2").render_long_plain(),
              "This is supported with target feature `avx2` only");
    EXPECT_EQ((Cfg::name_only("unix") & Cfg::name_value("target_os", "linux")).render_long_plain(),
              "This is supported on Unix and Linux only");
    EXPECT_EQ((!Cfg::name_only("windows")).render_long_plain(),
              "This is supported on non-Windows only");
}

TEST(CfgRenderTest, LongPlainFeatureLists) {
    Cfg cfg = Cfg::name_value("feature", "a") & Cfg::name_value("feature", "b");

    EXPECT_EQ(cfg.render_long_plain(), "This is supported on crate features `a` and `b` only");
}

TEST(CfgRenderTest, NeitherNor) {
    Cfg cfg = !(Cfg::name_only("unix") | Cfg::name_only("windows"));

    EXPECT_EQ(cfg.render_short_plain(), "Neither Unix nor Windows");
    EXPECT_EQ(cfg.render_long_plain(), "This is supported on neither Unix nor Windows");
}
