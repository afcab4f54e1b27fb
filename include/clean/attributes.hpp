//! # Attributes
//!
//! One normalized `Attributes` record per documented item. It is built from
//! the item's raw attribute list (and, for re-exports, the attributes the
//! re-export adds) by `Attributes::from_ast`:
//!
//! | Raw attribute                         | Ends up in                          |
//! |---------------------------------------|-------------------------------------|
//! | `/// text`, `#[doc = "text"]`         | `doc_strings`                       |
//! | `#[doc(include(file, contents))]`     | `doc_strings` (Include fragment)    |
//! | `#[doc(cfg(pred))]`                   | `cfg` (ANDed)                       |
//! | `#[target_feature(enable = "f")]`     | `cfg` (ANDed as `target_feature`)   |
//! | anything that is not doc text         | `other_attrs`                       |
//!
//! Intra-doc links are filled in later by the link collector and turned into
//! URLs by `links()` once the render cache is populated.

#ifndef CLEANDOC_CLEAN_ATTRIBUTES_HPP
#define CLEANDOC_CLEAN_ATTRIBUTES_HPP

#include "clean/cfg.hpp"
#include "clean/doc_fragment.hpp"
#include "common.hpp"
#include "diag/diagnostic.hpp"
#include "host/attr.hpp"
#include "host/def_id.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cleandoc::render {
struct Cache;
}

namespace cleandoc::clean {

// ============================================================================
// Links
// ============================================================================

/// An intra-doc link found while collecting links, before rendering.
struct ItemLink {
    /// The link as written in the Markdown.
    std::string link;

    /// The text shown for the link. Differs from `link` when the link used a
    /// disambiguator, as in \[`fn@f`\].
    std::string link_text;

    std::optional<host::DefId> did;

    /// URL fragment appended to the target. For primitive links without a
    /// `did` this is the primitive's name plus an optional `#anchor`.
    std::optional<std::string> fragment;

    [[nodiscard]] auto operator==(const ItemLink& other) const -> bool = default;
};

struct RenderedLink {
    /// The text the link was written as, disambiguators included.
    std::string original_text;

    /// The text to display.
    std::string new_text;

    std::string href;

    [[nodiscard]] auto operator==(const RenderedLink& other) const -> bool = default;
};

// ============================================================================
// Attribute List Helpers
// ============================================================================

/// Nested items of every `name(...)` attribute, flattened in order.
[[nodiscard]] auto lists(const std::vector<host::Attribute>& attrs, std::string_view name)
    -> std::vector<host::NestedMetaItem>;

/// True when `items` holds the bare word `word`.
[[nodiscard]] auto has_word(const std::vector<host::NestedMetaItem>& items, std::string_view word)
    -> bool;

[[nodiscard]] auto get_word_attr(const std::vector<host::NestedMetaItem>& items,
                                 std::string_view word) -> std::optional<host::NestedMetaItem>;

// ============================================================================
// Attributes
// ============================================================================

/// Attributes added by a `pub use` re-export, with the module that holds it.
struct ReexportAttrs {
    const std::vector<host::Attribute>* attrs = nullptr;
    host::DefId parent_module;
};

struct Attributes {
    std::vector<DocFragment> doc_strings;

    /// Every attribute that is not doc text, in source order.
    std::vector<host::Attribute> other_attrs;

    /// The merged `doc(cfg)` predicate; null when it is `True`.
    std::shared_ptr<const Cfg> cfg;

    /// Span of the first doc text.
    std::optional<SourceSpan> span;

    std::vector<ItemLink> item_links;

    /// True when the docs were written inside the item (`//!`).
    bool inner_docs = false;

    /// Builds the record for an item. Re-export attributes in `additional`
    /// are processed first and tagged with the re-exporting module. Malformed
    /// `doc(cfg(...))` predicates are reported to `diag` and skipped.
    [[nodiscard]] static auto from_ast(diag::DiagnosticHandler& diag,
                                       const std::vector<host::Attribute>& attrs,
                                       std::optional<ReexportAttrs> additional = std::nullopt)
        -> Attributes;

    /// The `X` of `doc(cfg(X))`, or null.
    [[nodiscard]] static auto extract_cfg(const host::MetaItem& meta) -> const host::MetaItem*;

    /// `(filename, contents)` of the expanded `doc(include(file = "..",
    /// contents = ".."))` form, or nullopt when either half is missing.
    [[nodiscard]] static auto extract_include(const host::MetaItem& meta)
        -> std::optional<std::pair<std::string, std::string>>;

    /// True when some `doc(...)` attribute lists `flag`.
    [[nodiscard]] auto has_doc_flag(std::string_view flag) const -> bool;

    /// The first doc block only: stops at the first fragment whose kind or
    /// parent module differs from the first fragment's, and right after an
    /// included file. The blank-line separator owed to the next block is not
    /// included, so the result is a prefix of `collapsed_doc_value()`.
    [[nodiscard]] auto doc_value() const -> std::optional<std::string>;

    /// All doc text, joined.
    [[nodiscard]] auto collapsed_doc_value() const -> std::optional<std::string>;

    /// Doc text grouped by the module it came from; the key is empty for the
    /// item's own docs.
    [[nodiscard]] auto collapsed_doc_value_by_module_level() const
        -> std::unordered_map<std::optional<host::DefId>, std::string>;

    /// Resolves `item_links` to URLs for a page `depth` levels deep.
    ///
    /// The cache must be fully populated before this is called. Links whose
    /// target has no known location are dropped.
    [[nodiscard]] auto links(host::CrateNum krate, const render::Cache& cache, size_t depth) const
        -> std::vector<RenderedLink>;

    /// Non-empty `doc(alias = "..")` and `doc(alias("..", ..))` values.
    [[nodiscard]] auto get_doc_aliases() const -> std::unordered_set<std::string>;

    [[nodiscard]] auto lists(std::string_view name) const -> std::vector<host::NestedMetaItem> {
        return clean::lists(other_attrs, name);
    }

    /// Compares docs, cfg, span and links by value and `other_attrs` by id.
    [[nodiscard]] auto operator==(const Attributes& other) const -> bool;
};

[[nodiscard]] auto hash_value(const Attributes& attrs) -> size_t;

} // namespace cleandoc::clean

template <> struct std::hash<cleandoc::clean::Attributes> {
    auto operator()(const cleandoc::clean::Attributes& attrs) const noexcept -> size_t {
        return cleandoc::clean::hash_value(attrs);
    }
};

#endif // CLEANDOC_CLEAN_ATTRIBUTES_HPP
