//! # Host Compiler Tags
//!
//! Closed enumerations mirroring the tags the host compiler attaches to
//! definitions and types. The clean model converts from these (see
//! `clean/primitive.hpp`) and stores a few of them verbatim where no
//! documentation-specific form is needed.

#ifndef CLEANDOC_HOST_TAGS_HPP
#define CLEANDOC_HOST_TAGS_HPP

#include <string>
#include <variant>

namespace cleandoc::host {

// ============================================================================
// Primitive Type Tags
// ============================================================================

enum class IntTy { Isize, I8, I16, I32, I64, I128 };

enum class UintTy { Usize, U8, U16, U32, U64, U128 };

enum class FloatTy { F32, F64 };

/// A primitive type as the host's name resolution sees it.
struct PrimTy {
    struct Str {};
    struct Bool {};
    struct Char {};

    std::variant<IntTy, UintTy, FloatTy, Str, Bool, Char> kind;
};

// ============================================================================
// Definition Kinds
// ============================================================================

enum class MacroKind {
    Bang,   ///< `foo!()`
    Attr,   ///< `#[foo]`
    Derive, ///< `#[derive(Foo)]`
};

enum class CtorOf { Struct, Variant };

/// What a definition is, as reported by the host's resolver.
struct DefKind {
    enum class Tag {
        Mod,
        Struct,
        Union,
        Enum,
        Variant,
        Trait,
        TyAlias,
        ForeignTy,
        TraitAlias,
        AssocTy,
        TyParam,
        Fn,
        Const,
        ConstParam,
        Static,
        Ctor,
        AssocFn,
        AssocConst,
        Macro,
        ExternCrate,
        Use,
        ForeignMod,
        AnonConst,
        OpaqueTy,
        Field,
        LifetimeParam,
        GlobalAsm,
        Impl,
        Closure,
        Generator,
    };

    Tag tag;

    /// Set only for `Tag::Macro`.
    MacroKind macro_kind = MacroKind::Bang;

    [[nodiscard]] static auto macro(MacroKind kind) -> DefKind {
        return DefKind{Tag::Macro, kind};
    }

    [[nodiscard]] auto operator==(const DefKind& other) const -> bool {
        return tag == other.tag && (tag != Tag::Macro || macro_kind == other.macro_kind);
    }
};

// ============================================================================
// Item Modifiers
// ============================================================================

enum class Mutability { Not, Mut };

enum class Unsafety { Normal, Unsafe };

enum class Constness { NotConst, Const };

enum class Asyncness { No, Yes };

/// Shape of a struct or variant constructor.
enum class CtorKind {
    Fn,      ///< `Foo(..)`
    Const,   ///< `Foo`
    Fictive, ///< `Foo { .. }`
};

/// `?Sized`-style modifier on a trait bound.
enum class TraitBoundModifier { None, Maybe, MaybeConst };

enum class SyntheticTyParamKind { ImplTrait };

/// Whether a trait item has a default and whether it may be overridden.
struct Defaultness {
    enum class Kind { Default, Final };

    Kind kind = Kind::Final;

    /// For `Kind::Default`: whether the item carries a value (body).
    bool has_value_flag = false;

    [[nodiscard]] static auto final_() -> Defaultness {
        return Defaultness{Kind::Final, true};
    }

    [[nodiscard]] static auto default_(bool has_value) -> Defaultness {
        return Defaultness{Kind::Default, has_value};
    }

    [[nodiscard]] auto has_value() const -> bool {
        return kind == Kind::Final || has_value_flag;
    }

    [[nodiscard]] auto is_final() const -> bool {
        return kind == Kind::Final;
    }

    [[nodiscard]] auto is_default() const -> bool {
        return kind == Kind::Default;
    }
};

/// Calling convention of a function.
enum class Abi { Rust, C, System, RustIntrinsic, RustCall, PlatformIntrinsic, Unadjusted };

[[nodiscard]] auto abi_name(Abi abi) -> const char*;

/// Qualifiers in front of a function signature.
struct FnHeader {
    Unsafety unsafety = Unsafety::Normal;
    Constness constness = Constness::NotConst;
    Asyncness asyncness = Asyncness::No;
    Abi abi = Abi::Rust;

    [[nodiscard]] auto operator==(const FnHeader& other) const -> bool = default;
};

} // namespace cleandoc::host

#endif // CLEANDOC_HOST_TAGS_HPP
