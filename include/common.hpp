//! # cleandoc Shared Definitions
//!
//! Process-wide documentation options, owned source
//! spans, and the two error channels used by the cleaning pipeline:
//! `Result<T, E>` for input that may legitimately be malformed (a bad cfg
//! predicate), and `InvariantError` for upstream data that breaks a
//! contract the compiler front end guarantees.

#ifndef CLEANDOC_COMMON_HPP
#define CLEANDOC_COMMON_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cleandoc {

// ============================================================================
// Documentation Options
// ============================================================================

/// Global documentation build options.
///
/// These options affect every crate processed in the current process and are
/// set once at startup, either programmatically or via `load_options_from_env()`.
///
/// # Example
///
/// ```cpp
/// DocOptions::nightly_build = true;
/// DocOptions::document_private = false;
/// ```
struct DocOptions {
    /// True when documenting with a nightly toolchain. Selects the nightly
    /// standard library documentation root for primitive links.
    static inline bool nightly_build = false;

    /// Document private items as well as public ones.
    static inline bool document_private = false;

    /// Documentation root used for primitive links on stable toolchains.
    static inline std::string primitive_docs_root = "https://doc.rust-lang.org";

    /// Documentation root used for primitive links on nightly toolchains.
    static inline std::string primitive_docs_nightly_root = "https://doc.rust-lang.org/nightly";
};

/// Value of an environment variable, or nullopt when it is unset.
[[nodiscard]] auto read_env(const char* name) -> std::optional<std::string>;

/// Reads `CLEANDOC_CHANNEL` and `CLEANDOC_DOCUMENT_PRIVATE` from the
/// environment into `DocOptions`. Unset variables leave the current values
/// untouched.
void load_options_from_env();

// ============================================================================
// Source Spans
// ============================================================================

/// A position in a source file.
///
/// Unlike compiler-internal locations, this owns its file name so that a
/// documentation snapshot never borrows from the compiler's source map.
struct SourceLocation {
    /// File name as the source map reports it.
    std::string file;

    /// Line number (1-based, 0 for a dummy location).
    uint32_t line = 0;

    /// Column number (1-based, 0 for a dummy location).
    uint32_t column = 0;

    /// 0-based byte offset into the file.
    uint32_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

struct SourceSpan;

/// Shared pointer to the span a macro expansion was invoked from.
using SourceSpanPtr = std::shared_ptr<const SourceSpan>;

/// A half-open source range.
///
/// Spans produced by macro expansion keep a link to the invocation span in
/// `expanded_from`; `source_callsite()` follows that chain to the outermost
/// invocation.
struct SourceSpan {
    SourceLocation start;

    SourceLocation end;

    /// The span of the macro invocation that produced this span, if any.
    SourceSpanPtr expanded_from;

    /// Returns the dummy span (no file, all positions zero).
    [[nodiscard]] static auto dummy() -> SourceSpan {
        return {};
    }

    /// True for the dummy span.
    [[nodiscard]] auto is_dummy() const -> bool {
        return start == SourceLocation{} && end == SourceLocation{};
    }

    /// Walks the expansion chain up to the outermost call site.
    [[nodiscard]] auto source_callsite() const -> SourceSpan {
        const SourceSpan* cur = this;
        while (cur->expanded_from) {
            cur = cur->expanded_from.get();
        }
        return SourceSpan{cur->start, cur->end, nullptr};
    }

    /// Spans compare by position only; the expansion chain is provenance.
    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool {
        return start == other.start && end == other.end;
    }
};

/// Hashes a span by its positions.
[[nodiscard]] auto hash_value(const SourceSpan& span) -> size_t;

// ============================================================================
// Result Type
// ============================================================================

/// Outcome of a fallible step: the value, or an error `E` (a message by
/// default). The alternatives are told apart by type, so `T` and `E` must
/// differ.
///
/// ```cpp
/// auto parsed = clean::Cfg::parse(meta);
/// if (is_ok(parsed)) {
///     cfg &= unwrap(parsed);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The value of an ok result. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The error of a failed result. Throws `std::bad_variant_access` on a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

// ============================================================================
// Invariant Errors
// ============================================================================

/// A programming-error fault.
///
/// Thrown when an upstream invariant is violated (an indent wider than its
/// line, a link with neither target nor fragment, a missing primitive table
/// entry, an unexpected async desugaring). The encompassing traversal must not
/// continue with a silently wrong document.
class InvariantError : public std::logic_error {
public:
    explicit InvariantError(const std::string& what) : std::logic_error(what) {}
};

// ============================================================================
// Hashing
// ============================================================================

/// Mixes `value` into `seed`.
[[nodiscard]] inline auto hash_combine(size_t seed, size_t value) -> size_t {
    return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

} // namespace cleandoc

#endif // CLEANDOC_COMMON_HPP
