//! # Doc Fragments
//!
//! A `DocFragment` is one contiguous slice of documentation: the body of a
//! doc comment, the string of a `#[doc = "..."]` attribute, or the contents
//! of an included file. Fragments keep their provenance (starting line, span,
//! re-exporting module) so that doctest failures and re-export docs can be
//! attributed correctly.
//!
//! ## Pipeline
//!
//! ```text
//! raw attribute text
//!   -> beautify_doc_string   strip `/** * */` decoration
//!   -> DocFragment           with line, span, kind, parent module
//!   -> update_need_backline  decide the separator after the previous fragment
//!   -> unindent_fragments    compute the common leading indent
//!   -> add_doc_fragment      rewrap into the flattened Markdown text
//! ```
//!
//! Sugared and raw fragments are kept apart even when adjacent: they are
//! indented differently in source, and only the sugared ones carry the
//! conventional single space after `///`.

#ifndef CLEANDOC_CLEAN_DOC_FRAGMENT_HPP
#define CLEANDOC_CLEAN_DOC_FRAGMENT_HPP

#include "common.hpp"
#include "host/def_id.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cleandoc::clean {

/// Where a fragment's text came from.
struct DocFragmentKind {
    enum class Tag {
        SugaredDoc, ///< `///` or `//!` doc comment
        RawDoc,     ///< `#[doc = "..."]`
        Include,    ///< `#[doc(include = "file")]`
    };

    Tag tag = Tag::SugaredDoc;

    /// The included file's name; empty unless `tag == Include`.
    std::string filename;

    [[nodiscard]] static auto sugared() -> DocFragmentKind {
        return DocFragmentKind{Tag::SugaredDoc, {}};
    }

    [[nodiscard]] static auto raw() -> DocFragmentKind {
        return DocFragmentKind{Tag::RawDoc, {}};
    }

    [[nodiscard]] static auto include(std::string filename) -> DocFragmentKind {
        return DocFragmentKind{Tag::Include, std::move(filename)};
    }

    [[nodiscard]] auto is_include() const -> bool {
        return tag == Tag::Include;
    }

    [[nodiscard]] auto is_sugared() const -> bool {
        return tag == Tag::SugaredDoc;
    }

    [[nodiscard]] auto is_raw() const -> bool {
        return tag == Tag::RawDoc;
    }

    [[nodiscard]] auto operator==(const DocFragmentKind& other) const -> bool = default;
};

struct DocFragment {
    /// Line of the complete doc block where this fragment starts.
    size_t line = 0;
    SourceSpan span;

    /// The module a re-export pulled this fragment through; empty for the
    /// item's own documentation.
    std::optional<host::DefId> parent_module;

    std::string doc;
    DocFragmentKind kind;

    /// Whether flattening must emit an extra newline after this fragment.
    bool need_backline = false;

    /// Leading whitespace to strip from every non-blank line.
    size_t indent = 0;

    [[nodiscard]] auto operator==(const DocFragment& other) const -> bool = default;
};

[[nodiscard]] auto hash_value(const DocFragment& frag) -> size_t;

// ============================================================================
// Text Helpers
// ============================================================================

/// Splits on `\n`, dropping one trailing `\r` per line. A final newline does
/// not produce an empty last line, and empty text has no lines.
[[nodiscard]] auto split_lines(std::string_view text) -> std::vector<std::string_view>;

/// Removes block-comment decoration from multi-line doc text:
///
/// ```text
/// /**             *
///  * Frobs.   ->   * Frobs.   ->  " Frobs."
///  */              (leading/trailing star lines dropped, star column stripped)
/// ```
///
/// Single-line text is returned unchanged.
[[nodiscard]] auto beautify_doc_string(std::string_view text) -> std::string;

// ============================================================================
// Flattening
// ============================================================================

/// Appends `frag` to `out`, stripping `frag.indent` from every non-blank
/// line. Blank lines are kept verbatim. Lines are joined with `\n`, and one
/// more `\n` follows when `need_backline` is set.
///
/// Throws `InvariantError` when a non-blank line is shorter than the indent.
void add_doc_fragment(std::string& out, const DocFragment& frag);

/// Concatenates all fragments. An extra newline separates an included file
/// from a following fragment of a different kind.
[[nodiscard]] auto collapse_fragments(const std::vector<DocFragment>& frags) -> std::string;

/// Decides the separator after the last fragment of `frags`, given the
/// fragment about to be appended. Fragments continuing the same block always
/// get a newline. At a block boundary only comment fragments get one;
/// included files never do.
void update_need_backline(std::vector<DocFragment>& frags, const DocFragment& next);

/// Computes the common indent of all fragments and stores it in each
/// fragment that has at least one line.
void unindent_fragments(std::vector<DocFragment>& frags);

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_DOC_FRAGMENT_HPP
