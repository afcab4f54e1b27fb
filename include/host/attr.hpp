//! # Raw Attributes
//!
//! The attribute representation handed over by the host compiler after macro
//! expansion. An attribute is either a sugared doc comment (`///`, `//!`,
//! `/** */`) or a normal attribute whose contents are a meta item:
//!
//! ```text
//! #[doc = "text"]                      NameValue
//! #[non_exhaustive]                    Word
//! #[doc(cfg(unix), alias = "foo")]     List of nested meta items
//! ```
//!
//! Nested list entries are either meta items or bare literals.

#ifndef CLEANDOC_HOST_ATTR_HPP
#define CLEANDOC_HOST_ATTR_HPP

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cleandoc::host {

// ============================================================================
// Literals
// ============================================================================

enum class LitKind {
    Str,
    Int,
    Float,
    Bool,
    Char,
};

/// A literal inside an attribute. `symbol` holds the literal's value text
/// (unquoted for strings).
struct Lit {
    LitKind kind = LitKind::Str;
    std::string symbol;
    SourceSpan span;

    [[nodiscard]] auto is_str() const -> bool {
        return kind == LitKind::Str;
    }
};

// ============================================================================
// Meta Items
// ============================================================================

struct NestedMetaItem;

enum class MetaItemKind {
    Word,      ///< `name`
    List,      ///< `name(a, b = "c")`
    NameValue, ///< `name = "lit"`
};

/// A structured attribute body.
struct MetaItem {
    std::string name;
    SourceSpan span;
    MetaItemKind kind = MetaItemKind::Word;

    /// Entries of a `List` meta item.
    std::vector<NestedMetaItem> items;

    /// The literal of a `NameValue` meta item.
    std::optional<Lit> value;

    [[nodiscard]] auto has_name(std::string_view n) const -> bool {
        return name == n;
    }

    [[nodiscard]] auto is_word() const -> bool {
        return kind == MetaItemKind::Word;
    }

    /// The string value of `name = "value"`.
    [[nodiscard]] auto value_str() const -> std::optional<std::string>;

    /// The entries of `name(...)`, or null when this is not a list.
    [[nodiscard]] auto meta_item_list() const -> const std::vector<NestedMetaItem>*;
};

/// One entry of a meta item list.
struct NestedMetaItem {
    std::variant<MetaItem, Lit> node;

    /// The meta item, or null for a literal entry.
    [[nodiscard]] auto meta_item() const -> const MetaItem*;

    /// The literal, or null for a meta item entry.
    [[nodiscard]] auto literal() const -> const Lit*;

    [[nodiscard]] auto span() const -> const SourceSpan&;

    [[nodiscard]] auto has_name(std::string_view n) const -> bool;
    [[nodiscard]] auto is_word() const -> bool;
    [[nodiscard]] auto value_str() const -> std::optional<std::string>;
    [[nodiscard]] auto meta_item_list() const -> const std::vector<NestedMetaItem>*;
};

// ============================================================================
// Attributes
// ============================================================================

/// Identity of an attribute within a session. Two attributes with the same id
/// are the same occurrence.
using AttrId = uint32_t;

enum class AttrStyle {
    Outer, ///< `#[..]`, `///`
    Inner, ///< `#![..]`, `//!`
};

enum class CommentKind {
    Line,  ///< `///` or `//!`
    Block, ///< `/** */` or `/*! */`
};

/// A sugared doc comment; `text` is the comment body without its marker.
struct DocComment {
    CommentKind kind = CommentKind::Line;
    std::string text;
};

struct Attribute {
    AttrId id = 0;
    AttrStyle style = AttrStyle::Outer;
    SourceSpan span;
    std::variant<MetaItem, DocComment> kind;

    [[nodiscard]] auto is_doc_comment() const -> bool {
        return std::holds_alternative<DocComment>(kind);
    }

    /// The documentation text carried by this attribute: the body of a doc
    /// comment, or the string of `#[doc = "..."]`.
    [[nodiscard]] auto doc_str() const -> std::optional<std::string>;

    /// True for a normal attribute whose path is `n`. Doc comments have no name.
    [[nodiscard]] auto has_name(std::string_view n) const -> bool;

    /// The meta item of a normal attribute.
    [[nodiscard]] auto meta() const -> const MetaItem*;

    [[nodiscard]] auto meta_item_list() const -> const std::vector<NestedMetaItem>*;

    [[nodiscard]] auto value_str() const -> std::optional<std::string>;
};

// ============================================================================
// Builders
// ============================================================================

[[nodiscard]] auto mk_str_lit(std::string value, SourceSpan span = {}) -> Lit;

[[nodiscard]] auto mk_word_item(std::string name, SourceSpan span = {}) -> MetaItem;

/// Builds `name = "value"`.
[[nodiscard]] auto mk_name_value_item_str(std::string name, std::string value,
                                          SourceSpan span = {}) -> MetaItem;

[[nodiscard]] auto mk_name_value_item(std::string name, Lit value, SourceSpan span = {})
    -> MetaItem;

[[nodiscard]] auto mk_list_item(std::string name, std::vector<NestedMetaItem> items,
                                SourceSpan span = {}) -> MetaItem;

[[nodiscard]] auto mk_nested(MetaItem item) -> NestedMetaItem;

[[nodiscard]] auto mk_nested_lit(Lit lit) -> NestedMetaItem;

/// Builds a normal attribute `#[meta]` (or `#![meta]` for inner style).
[[nodiscard]] auto mk_attr(AttrId id, AttrStyle style, MetaItem meta, SourceSpan span = {})
    -> Attribute;

/// Builds a sugared doc comment attribute.
[[nodiscard]] auto mk_doc_comment(AttrId id, AttrStyle style, CommentKind kind, std::string text,
                                  SourceSpan span = {}) -> Attribute;

} // namespace cleandoc::host

#endif // CLEANDOC_HOST_ATTR_HPP
