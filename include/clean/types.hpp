//! # Clean Types
//!
//! A view of types made for hyperlinking. Paths are resolved to definitions,
//! aliases are gone, and most sugar (boxing, mutability through smart
//! pointers) is dropped. The original type can always be recovered from the
//! compiler given one of these when more detail is needed.
//!
//! ## Variants
//!
//! | Variant        | Source form                         |
//! |----------------|-------------------------------------|
//! | `ResolvedPath` | `Vec<T>`, `Iterator<Item = u8>`     |
//! | `Generic`      | `T`, `Self`                         |
//! | `Primitive`    | `u8`, `str`, `bool`                 |
//! | `BareFunction` | `unsafe extern "C" fn(i32) -> i32`  |
//! | `Tuple`        | `(A, B)`, `()`                      |
//! | `Slice`        | `[T]`                               |
//! | `Array`        | `[T; N]`                            |
//! | `Never`        | `!`                                 |
//! | `RawPointer`   | `*const T`, `*mut T`                |
//! | `BorrowedRef`  | `&'a mut T`                         |
//! | `QPath`        | `<T as Trait>::Name`                |
//! | `Infer`        | `_`                                 |
//! | `ImplTrait`    | `impl A + B`                        |
//!
//! Types are immutable once built and are shared through `TypePtr`. Equality
//! is always structural.

#ifndef CLEANDOC_CLEAN_TYPES_HPP
#define CLEANDOC_CLEAN_TYPES_HPP

#include "clean/attributes.hpp"
#include "clean/primitive.hpp"
#include "common.hpp"
#include "host/def_id.hpp"
#include "host/tags.hpp"

#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace cleandoc::render {
struct Cache;
}

namespace cleandoc::clean {

class DocContext;

struct Type;
struct GenericBound;
struct TypeBinding;
struct GenericParamDef;
struct BareFunctionDecl;

/// Shared, immutable type node.
using TypePtr = std::shared_ptr<const Type>;

/// Deep equality; two null pointers are equal.
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;

// ============================================================================
// Lifetimes and Constants
// ============================================================================

struct Lifetime {
    std::string name;

    [[nodiscard]] static auto statik() -> Lifetime {
        return Lifetime{"'static"};
    }

    [[nodiscard]] static auto elided() -> Lifetime {
        return Lifetime{"'_"};
    }

    [[nodiscard]] auto get_ref() const -> const std::string& {
        return name;
    }

    [[nodiscard]] auto operator==(const Lifetime& other) const -> bool = default;
};

struct Constant {
    TypePtr type_;
    std::string expr;
    std::optional<std::string> value;
    bool is_literal = false;

    [[nodiscard]] auto operator==(const Constant& other) const -> bool;
};

// ============================================================================
// Paths
// ============================================================================

using GenericArg = std::variant<Lifetime, TypePtr, Constant>;

/// `<A, B, Item = C>`
struct AngleBracketedArgs {
    std::vector<GenericArg> args;
    std::vector<TypeBinding> bindings;

    [[nodiscard]] auto operator==(const AngleBracketedArgs& other) const -> bool;
};

/// `(A, B) -> C`; `output` is null without a return type.
struct ParenthesizedArgs {
    std::vector<TypePtr> inputs;
    TypePtr output;

    [[nodiscard]] auto operator==(const ParenthesizedArgs& other) const -> bool;
};

using GenericArgs = std::variant<AngleBracketedArgs, ParenthesizedArgs>;

struct PathSegment {
    std::string name;
    GenericArgs args;

    [[nodiscard]] auto operator==(const PathSegment& other) const -> bool;
};

struct Path {
    /// Written with a leading `::`.
    bool global = false;
    std::vector<PathSegment> segments;

    /// The last segment's name. Throws `InvariantError` on an empty path.
    [[nodiscard]] auto last() const -> const std::string&;

    [[nodiscard]] auto last_name() const -> std::string {
        return last();
    }

    /// `a::b::C`, with a leading `::` for global paths.
    [[nodiscard]] auto whole_name() const -> std::string;

    [[nodiscard]] auto operator==(const Path& other) const -> bool;
};

// ============================================================================
// Bounds
// ============================================================================

/// A trait reference, which may have higher-ranked lifetimes.
struct PolyTrait {
    TypePtr trait_;
    std::vector<GenericParamDef> generic_params;

    [[nodiscard]] auto operator==(const PolyTrait& other) const -> bool;
};

struct GenericBound {
    struct TraitBound {
        PolyTrait poly;
        host::TraitBoundModifier modifier = host::TraitBoundModifier::None;

        [[nodiscard]] auto operator==(const TraitBound& other) const -> bool;
    };

    std::variant<TraitBound, Lifetime> node;

    /// The `?Sized` bound. Records the path of the `Sized` lang item as an
    /// external path in `cx`.
    [[nodiscard]] static auto maybe_sized(DocContext& cx) -> GenericBound;

    /// True for a plain `Sized` bound.
    [[nodiscard]] auto is_sized_bound(const DocContext& cx) const -> bool;

    [[nodiscard]] auto get_poly_trait() const -> std::optional<PolyTrait>;
    [[nodiscard]] auto get_trait_type() const -> TypePtr;

    [[nodiscard]] auto operator==(const GenericBound& other) const -> bool;
};

/// A binding on an associated type: `A = Bar` in `Foo<A = Bar>`, or
/// `A: Send + Sync` in `Foo<A: Send + Sync>`.
struct TypeBinding {
    struct Equality {
        TypePtr ty;
    };
    struct Constraint {
        std::vector<GenericBound> bounds;
    };

    std::string name;
    std::variant<Equality, Constraint> kind;

    /// The bound type. Throws `InvariantError` on a constraint binding.
    [[nodiscard]] auto ty() const -> const TypePtr&;

    [[nodiscard]] auto operator==(const TypeBinding& other) const -> bool;
};

/// A single-segment path naming an external definition.
[[nodiscard]] auto external_path(std::string name, std::vector<GenericArg> args = {},
                                 std::vector<TypeBinding> bindings = {}) -> Path;

// ============================================================================
// Generic Parameters
// ============================================================================

struct GenericParamDefKind {
    struct LifetimeParam {};
    struct TypeParam {
        host::DefId did;
        std::vector<GenericBound> bounds;
        TypePtr default_;
        std::optional<host::SyntheticTyParamKind> synthetic;
    };
    struct ConstParam {
        host::DefId did;
        TypePtr ty;
    };

    std::variant<LifetimeParam, TypeParam, ConstParam> kind;

    [[nodiscard]] auto is_type() const -> bool {
        return std::holds_alternative<TypeParam>(kind);
    }

    /// The default of a type parameter, or the type of a const parameter;
    /// null otherwise. Callers use this to reach the types embedded in a
    /// parameter, whatever the parameter kind.
    [[nodiscard]] auto get_type() const -> TypePtr;

    [[nodiscard]] auto operator==(const GenericParamDefKind& other) const -> bool;
};

struct GenericParamDef {
    std::string name;
    GenericParamDefKind kind;

    /// An `impl Trait` argument turned into a type parameter.
    [[nodiscard]] auto is_synthetic_type_param() const -> bool;

    [[nodiscard]] auto is_type() const -> bool {
        return kind.is_type();
    }

    [[nodiscard]] auto get_type() const -> TypePtr {
        return kind.get_type();
    }

    /// Bounds of a type parameter; null for other kinds.
    [[nodiscard]] auto get_bounds() const -> const std::vector<GenericBound>*;

    [[nodiscard]] auto operator==(const GenericParamDef& other) const -> bool;
};

struct WherePredicate {
    /// `T: Bound`
    struct BoundPredicate {
        TypePtr ty;
        std::vector<GenericBound> bounds;
    };
    /// `'a: 'b`
    struct RegionPredicate {
        Lifetime lifetime;
        std::vector<GenericBound> bounds;
    };
    /// `T::Item = U`
    struct EqPredicate {
        TypePtr lhs;
        TypePtr rhs;
    };

    std::variant<BoundPredicate, RegionPredicate, EqPredicate> pred;

    /// Null for equality predicates.
    [[nodiscard]] auto get_bounds() const -> const std::vector<GenericBound>*;
};

struct Generics {
    std::vector<GenericParamDef> params;
    std::vector<WherePredicate> where_predicates;
};

// ============================================================================
// Type
// ============================================================================

struct Type {
    /// Structs, enums, traits, and most other path types.
    struct ResolvedPath {
        Path path;
        std::optional<std::vector<GenericBound>> param_names;
        host::DefId did;
        /// `T::Name` style path to an associated type.
        bool is_generic = false;
    };
    /// A generic parameter, kept apart so that nobody goes looking for a
    /// definition that does not exist.
    struct Generic {
        std::string name;
    };
    struct Primitive {
        PrimitiveType prim;
    };
    struct BareFunction {
        std::shared_ptr<const BareFunctionDecl> decl;
    };
    struct Tuple {
        std::vector<TypePtr> elems;
    };
    struct Slice {
        TypePtr elem;
    };
    /// `len` is the textual length expression.
    struct Array {
        TypePtr elem;
        std::string len;
    };
    struct Never {};
    struct RawPointer {
        host::Mutability mutability = host::Mutability::Not;
        TypePtr pointee;
    };
    struct BorrowedRef {
        std::optional<Lifetime> lifetime;
        host::Mutability mutability = host::Mutability::Not;
        TypePtr type_;
    };
    struct QPath {
        std::string name;
        TypePtr self_type;
        TypePtr trait_;
    };
    struct Infer {};
    struct ImplTrait {
        std::vector<GenericBound> bounds;
    };

    using Kind = std::variant<ResolvedPath, Generic, Primitive, BareFunction, Tuple, Slice, Array,
                              Never, RawPointer, BorrowedRef, QPath, Infer, ImplTrait>;

    Kind kind;

    // Constructors

    [[nodiscard]] static auto resolved_path(Path path, host::DefId did, bool is_generic = false)
        -> TypePtr;
    [[nodiscard]] static auto generic(std::string name) -> TypePtr;
    [[nodiscard]] static auto primitive(PrimitiveType prim) -> TypePtr;
    [[nodiscard]] static auto bare_function(BareFunctionDecl decl) -> TypePtr;
    [[nodiscard]] static auto tuple(std::vector<TypePtr> elems) -> TypePtr;
    [[nodiscard]] static auto slice(TypePtr elem) -> TypePtr;
    [[nodiscard]] static auto array(TypePtr elem, std::string len) -> TypePtr;
    [[nodiscard]] static auto never() -> TypePtr;
    [[nodiscard]] static auto raw_pointer(host::Mutability mutability, TypePtr pointee) -> TypePtr;
    [[nodiscard]] static auto borrowed_ref(std::optional<Lifetime> lifetime,
                                           host::Mutability mutability, TypePtr type_) -> TypePtr;
    [[nodiscard]] static auto qpath(std::string name, TypePtr self_type, TypePtr trait_) -> TypePtr;
    [[nodiscard]] static auto infer() -> TypePtr;
    [[nodiscard]] static auto impl_trait(std::vector<GenericBound> bounds) -> TypePtr;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T* {
        return std::get_if<T>(&kind);
    }

    // Queries

    /// The primitive whose page documents this type. References to a
    /// primitive, slice or array count as that primitive; a reference to a
    /// generic parameter is `Reference`.
    [[nodiscard]] auto primitive_type() const -> std::optional<PrimitiveType>;

    [[nodiscard]] auto is_generic() const -> bool;

    /// The `Self` generic parameter.
    [[nodiscard]] auto is_self_type() const -> bool;

    /// Type arguments of the last path segment of a resolved path.
    [[nodiscard]] auto generics() const -> std::optional<std::vector<TypePtr>>;

    /// Associated type bindings of the last path segment of a resolved path.
    [[nodiscard]] auto bindings() const -> const std::vector<TypeBinding>*;

    [[nodiscard]] auto is_full_generic() const -> bool {
        return is<Generic>();
    }

    /// A primitive, or a pointer or reference to one.
    [[nodiscard]] auto is_primitive() const -> bool;

    /// `(self type, trait, name)` of a `<T as Trait>::Name` projection.
    [[nodiscard]] auto projection() const
        -> std::optional<std::tuple<TypePtr, host::DefId, std::string>>;

    /// The definition this type links to, primitives excluded.
    [[nodiscard]] auto def_id() const -> std::optional<host::DefId>;

    /// Like `def_id`, but primitives resolve through the cache's primitive
    /// locations.
    [[nodiscard]] auto def_id_full(const render::Cache& cache) const -> std::optional<host::DefId>;

    [[nodiscard]] auto operator==(const Type& other) const -> bool;

private:
    [[nodiscard]] auto inner_def_id(const render::Cache* cache) const
        -> std::optional<host::DefId>;
};

[[nodiscard]] auto hash_value(const Type& ty) -> size_t;

/// Display form of a type, e.g. `&'a mut [u8]`.
[[nodiscard]] auto type_to_string(const Type& ty) -> std::string;

[[nodiscard]] auto bound_to_string(const GenericBound& bound) -> std::string;

// ============================================================================
// Functions
// ============================================================================

struct Argument {
    TypePtr type_;
    std::string name;

    /// How a receiver argument takes `self`.
    struct SelfValue {};
    struct SelfBorrowed {
        std::optional<Lifetime> lifetime;
        host::Mutability mutability;
    };
    struct SelfExplicit {
        TypePtr type_;
    };
    using SelfTy = std::variant<SelfValue, SelfBorrowed, SelfExplicit>;

    /// Classifies an argument named `self`; nullopt for every other name.
    [[nodiscard]] auto to_self() const -> std::optional<SelfTy>;

    [[nodiscard]] auto operator==(const Argument& other) const -> bool;
};

using SelfTy = Argument::SelfTy;

struct Arguments {
    std::vector<Argument> values;

    [[nodiscard]] auto operator==(const Arguments& other) const -> bool = default;
};

/// A function's return type; `ret` is null for the default `()` return.
struct FnRetTy {
    TypePtr ret;

    [[nodiscard]] static auto default_return() -> FnRetTy {
        return FnRetTy{};
    }

    [[nodiscard]] static auto returns(TypePtr ty) -> FnRetTy {
        return FnRetTy{std::move(ty)};
    }

    [[nodiscard]] auto is_default() const -> bool {
        return ret == nullptr;
    }

    [[nodiscard]] auto def_id() const -> std::optional<host::DefId>;
    [[nodiscard]] auto def_id_full(const render::Cache& cache) const -> std::optional<host::DefId>;

    [[nodiscard]] auto operator==(const FnRetTy& other) const -> bool {
        return types_equal(ret, other.ret);
    }
};

struct FnDecl {
    Arguments inputs;
    FnRetTy output;
    bool c_variadic = false;
    Attributes attrs;

    /// The receiver shape, when the first argument is `self`.
    [[nodiscard]] auto self_type() const -> std::optional<SelfTy>;

    /// The return type an `async fn` was written with: `i32` for a desugared
    /// `impl Future<Output = i32>`.
    ///
    /// Throws `InvariantError` when the output is not in that form.
    [[nodiscard]] auto sugared_async_return_type() const -> FnRetTy;

    [[nodiscard]] auto operator==(const FnDecl& other) const -> bool;
};

struct BareFunctionDecl {
    host::Unsafety unsafety = host::Unsafety::Normal;
    std::vector<GenericParamDef> generic_params;
    FnDecl decl;
    host::Abi abi = host::Abi::Rust;

    [[nodiscard]] auto operator==(const BareFunctionDecl& other) const -> bool;
};

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_TYPES_HPP
