//! # Primitive and Type-Kind Registry
//!
//! Closed enumerations for the language's built-in types (`PrimitiveType`)
//! and for the coarse definition categories used by the link cache
//! (`TypeKind`), with total conversions from the host compiler's tags.
//!
//! `PrimitiveImpls` caches, per primitive, the inherent impl blocks the
//! standard library declares through lang items (`impl i32 { .. }`). The
//! table is computed once and never changes afterwards.
//!
//! ## Usage
//!
//! ```cpp
//! auto prim = primitive_from_symbol("u8");          // PrimitiveType::U8
//! const auto& impls = PrimitiveImpls::instance().impls(*prim, queries.lang_items());
//! ```

#ifndef CLEANDOC_CLEAN_PRIMITIVE_HPP
#define CLEANDOC_CLEAN_PRIMITIVE_HPP

#include "host/def_id.hpp"
#include "host/queries.hpp"
#include "host/tags.hpp"

#include <array>
#include <atomic>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cleandoc::clean {

// ============================================================================
// Primitive Types
// ============================================================================

/// A built-in type. Unlike `host::PrimTy` this also covers the types that are
/// not written as paths (tuples, references, `fn` pointers, `!`).
enum class PrimitiveType {
    Isize,
    I8,
    I16,
    I32,
    I64,
    I128,
    Usize,
    U8,
    U16,
    U32,
    U64,
    U128,
    F32,
    F64,
    Char,
    Bool,
    Str,
    Slice,
    Array,
    Tuple,
    Unit,
    RawPointer,
    Reference,
    Fn,
    Never,
};

/// Every primitive, in declaration order.
[[nodiscard]] auto all_primitive_types() -> const std::array<PrimitiveType, 25>&;

[[nodiscard]] auto primitive_from_hir(const host::PrimTy& prim) -> PrimitiveType;

[[nodiscard]] auto primitive_from(host::IntTy ty) -> PrimitiveType;
[[nodiscard]] auto primitive_from(host::UintTy ty) -> PrimitiveType;
[[nodiscard]] auto primitive_from(host::FloatTy ty) -> PrimitiveType;

/// Maps a primitive's symbol (`"isize"`, `"slice"`, `"pointer"`, `"fn"`, ...)
/// back to the primitive.
[[nodiscard]] auto primitive_from_symbol(std::string_view sym) -> std::optional<PrimitiveType>;

/// The primitive's symbol, inverse of `primitive_from_symbol`.
[[nodiscard]] auto primitive_as_str(PrimitiveType prim) -> std::string_view;

/// The name used in the primitive's documentation page (`primitive.u8.html`).
[[nodiscard]] inline auto primitive_to_url_str(PrimitiveType prim) -> std::string_view {
    return primitive_as_str(prim);
}

// ============================================================================
// Type Kinds
// ============================================================================

/// Coarse category of a definition, as recorded for external paths.
enum class TypeKind {
    Enum,
    Function,
    Module,
    Const,
    Static,
    Struct,
    Union,
    Trait,
    Typedef,
    Foreign,
    Macro,
    Attr,
    Derive,
    TraitAlias,
    Primitive,
};

/// Every definition kind without a documentation page of its own maps to
/// `TypeKind::Foreign`.
[[nodiscard]] auto type_kind_from_def_kind(const host::DefKind& kind) -> TypeKind;

// ============================================================================
// Primitive Impl Cache
// ============================================================================

/// Inherent impls of one primitive; never more than four.
using PrimitiveImplList = std::vector<host::DefId>;

using PrimitiveImplTable = std::unordered_map<PrimitiveType, PrimitiveImplList>;

/// Exactly-once table from primitive to its inherent impls.
///
/// The first call to `all_impls` builds the table from the lang items it is
/// given; later calls return the same table regardless of their argument.
/// Tests construct their own instance instead of using `instance()`.
class PrimitiveImpls {
public:
    PrimitiveImpls() = default;

    PrimitiveImpls(const PrimitiveImpls&) = delete;
    PrimitiveImpls& operator=(const PrimitiveImpls&) = delete;

    /// The process-wide table.
    static PrimitiveImpls& instance();

    [[nodiscard]] auto all_impls(const host::LangItems& lang_items) -> const PrimitiveImplTable&;

    /// Impls of one primitive. Throws `InvariantError` if the table has no
    /// entry for it.
    [[nodiscard]] auto impls(PrimitiveType prim, const host::LangItems& lang_items)
        -> const PrimitiveImplList&;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_.load();
    }

private:
    std::once_flag once_;
    PrimitiveImplTable table_;
    std::atomic<bool> initialized_{false};
};

/// Builds a fresh table without caching it.
[[nodiscard]] auto build_primitive_impls(const host::LangItems& lang_items) -> PrimitiveImplTable;

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_PRIMITIVE_HPP
