//! # Clean Items
//!
//! Anything with a source location, a set of attributes and optionally a
//! name: everything that can be documented. This is a strict superset of the
//! compiler's notion of an item, since struct fields, enum variants and trait
//! members are items here too.
//!
//! ## Structure
//!
//! ```text
//! Crate
//!   module: Item (ModuleItem, is_crate)
//!     Item (Struct) -> fields: Item (StructFieldItem) ...
//!     Item (Trait)  -> items:  Item (TyMethodItem | MethodItem | AssocTypeItem ...)
//!     Item (Impl)   -> items:  Item ...
//! ```
//!
//! Items are built once while traversing the compiler's item tree. The only
//! later change is stripping, which wraps the payload in `StrippedItem`.

#ifndef CLEANDOC_CLEAN_ITEM_HPP
#define CLEANDOC_CLEAN_ITEM_HPP

#include "clean/attributes.hpp"
#include "clean/fake_ids.hpp"
#include "clean/item_type.hpp"
#include "clean/primitive.hpp"
#include "clean/span.hpp"
#include "clean/types.hpp"
#include "host/def_id.hpp"
#include "host/queries.hpp"
#include "host/tags.hpp"

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace cleandoc::clean {

struct Item;
struct ItemKind;

// ============================================================================
// Visibility
// ============================================================================

struct Visibility {
    enum class Kind {
        Public,
        Inherited, ///< No visibility written
        Restricted,
    };

    Kind kind = Kind::Inherited;
    host::DefId restricted_to;

    [[nodiscard]] static auto public_() -> Visibility {
        return Visibility{Kind::Public, {}};
    }

    [[nodiscard]] static auto inherited() -> Visibility {
        return Visibility{Kind::Inherited, {}};
    }

    [[nodiscard]] static auto restricted(host::DefId module) -> Visibility {
        return Visibility{Kind::Restricted, module};
    }

    /// The host reports private items as invisible; here they are inherited.
    [[nodiscard]] static auto from_host(const host::HostVisibility& vis) -> Visibility;

    [[nodiscard]] auto is_public() const -> bool {
        return kind == Kind::Public;
    }

    [[nodiscard]] auto operator==(const Visibility& other) const -> bool = default;
};

// ============================================================================
// Item Payloads
// ============================================================================

struct Module {
    std::vector<Item> items;
    bool is_crate = false;
};

struct Struct {
    host::CtorKind struct_type = host::CtorKind::Fictive;
    Generics generics;
    std::vector<Item> fields;
    bool fields_stripped = false;
};

struct Union {
    Generics generics;
    std::vector<Item> fields;
    bool fields_stripped = false;
};

/// The fields of a struct-like enum variant. Unlike `Struct` it has no name,
/// id or generics of its own.
struct VariantStruct {
    host::CtorKind struct_type = host::CtorKind::Fictive;
    std::vector<Item> fields;
    bool fields_stripped = false;
};

struct Variant {
    struct CLike {};
    struct Tuple {
        std::vector<TypePtr> fields;
    };

    std::variant<CLike, Tuple, VariantStruct> kind;
};

struct Enum {
    std::vector<Item> variants;
    Generics generics;
    bool variants_stripped = false;
};

struct Function {
    FnDecl decl;
    Generics generics;
    host::FnHeader header;
};

struct Trait {
    host::Unsafety unsafety = host::Unsafety::Normal;
    std::vector<Item> items;
    Generics generics;
    std::vector<GenericBound> bounds;
    bool is_auto = false;
};

struct TraitAlias {
    Generics generics;
    std::vector<GenericBound> bounds;
};

struct Typedef {
    /// The aliased type as written. Coming from source it may itself be an
    /// alias.
    TypePtr type_;
    Generics generics;

    /// The final type after resolving aliases; null when `type_` already
    /// is the final type.
    TypePtr item_type;

    [[nodiscard]] auto def_id() const -> std::optional<host::DefId> {
        return type_ ? type_->def_id() : std::nullopt;
    }

    [[nodiscard]] auto def_id_full(const render::Cache& cache) const
        -> std::optional<host::DefId> {
        return type_ ? type_->def_id_full(cache) : std::nullopt;
    }
};

struct OpaqueTy {
    std::vector<GenericBound> bounds;
    Generics generics;
};

struct Static {
    TypePtr type_;
    host::Mutability mutability = host::Mutability::Not;
    /// The initializer expression as written.
    std::optional<std::string> expr;
};

struct Impl {
    host::Unsafety unsafety = host::Unsafety::Normal;
    Generics generics;
    std::unordered_set<std::string> provided_trait_methods;
    TypePtr trait_;
    TypePtr for_;
    std::vector<Item> items;
    bool negative_polarity = false;
    /// Generated for an auto trait.
    bool synthetic = false;
    /// The blanket impl's `for` type, when this impl comes from one.
    TypePtr blanket_impl;
};

struct ImportKind {
    enum class Tag {
        Simple, ///< `use source as name;`
        Glob,   ///< `use source::*;`
    };

    Tag tag = Tag::Glob;
    std::string name;
};

struct ImportSource {
    Path path;
    std::optional<host::DefId> did;
};

struct Import {
    ImportKind kind;
    ImportSource source;
    bool should_be_displayed = true;

    [[nodiscard]] static auto new_simple(std::string name, ImportSource source,
                                         bool should_be_displayed) -> Import;

    [[nodiscard]] static auto new_glob(ImportSource source, bool should_be_displayed) -> Import;
};

struct Macro {
    std::string source;
    std::optional<std::string> imported_from;
};

struct ProcMacro {
    host::MacroKind kind = host::MacroKind::Bang;
    std::vector<std::string> helpers;
};

// ============================================================================
// ItemKind
// ============================================================================

struct ExternCrateItem {
    /// The crate's real name, not the name it is imported as.
    std::optional<std::string> src;
};

struct FunctionItem {
    Function func;
};

struct TypedefItem {
    Typedef typedef_;
    bool is_assoc = false;
};

struct StaticItem {
    Static static_;
};

/// A required trait method: a signature without a body.
struct TyMethodItem {
    Function func;
};

/// A method with a body.
struct MethodItem {
    Function func;
    std::optional<host::Defaultness> defaultness;
};

struct StructFieldItem {
    TypePtr type_;
};

/// A `fn` from an extern block.
struct ForeignFunctionItem {
    Function func;
};

/// A `static` from an extern block.
struct ForeignStaticItem {
    Static static_;
};

/// A `type` from an extern block.
struct ForeignTypeItem {};

struct PrimitiveItem {
    PrimitiveType prim;
};

struct AssocConstItem {
    TypePtr type_;
    std::optional<std::string> default_;
};

/// An associated type of a trait or trait impl. `bounds` may be non-empty
/// because of a `where` clause; `default_` is the default concrete type, as
/// in `type Target = usize;`.
struct AssocTypeItem {
    std::vector<GenericBound> bounds;
    TypePtr default_;
};

/// A payload removed by a stripping pass.
struct StrippedItem {
    std::shared_ptr<const ItemKind> inner;
};

struct KeywordItem {
    std::string keyword;
};

struct ItemKind {
    using Node = std::variant<ExternCrateItem, Import, Struct, Union, Enum, FunctionItem, Module,
                              TypedefItem, OpaqueTy, StaticItem, Constant, Trait, TraitAlias, Impl,
                              TyMethodItem, MethodItem, StructFieldItem, Variant,
                              ForeignFunctionItem, ForeignStaticItem, ForeignTypeItem, Macro,
                              ProcMacro, PrimitiveItem, AssocConstItem, AssocTypeItem,
                              StrippedItem, KeywordItem>;

    Node node;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(node);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T* {
        return std::get_if<T>(&node);
    }

    /// Items nested in this one: struct and union fields, enum variants, the
    /// fields of a struct variant, trait and impl members, module contents.
    /// Empty for every other kind.
    [[nodiscard]] auto inner_items() const -> std::span<const Item>;

    [[nodiscard]] auto is_type_alias() const -> bool {
        return is<TypedefItem>() || is<AssocTypeItem>();
    }
};

/// The page category of `kind`. Stripped kinds are unwrapped first; a
/// stripped kind inside another throws `InvariantError`.
[[nodiscard]] auto item_type_of(const ItemKind& kind) -> ItemType;

// ============================================================================
// Item
// ============================================================================

class DocContext;

struct Item {
    Span source;

    /// Absent for impls and other unnamed items.
    std::optional<std::string> name;

    Attributes attrs;
    Visibility visibility;
    ItemKind kind;
    host::DefId def_id;

    // Construction

    /// Builds an item, reading its attributes from the host.
    [[nodiscard]] static auto from_def_id_and_parts(host::DefId def_id,
                                                    std::optional<std::string> name, ItemKind kind,
                                                    DocContext& cx) -> Item;

    /// Builds an item with attributes already cleaned. Local items take the
    /// span including their body; external items only have a definition
    /// span. Visibility comes from the host.
    [[nodiscard]] static auto from_def_id_and_attrs_and_parts(host::DefId def_id,
                                                              std::optional<std::string> name,
                                                              ItemKind kind, Attributes attrs,
                                                              DocContext& cx) -> Item;

    // Stability

    [[nodiscard]] auto stability(const host::CompilerQueries& queries,
                                 const MaxDefIndexTable& table) const
        -> std::optional<host::Stability>;

    [[nodiscard]] auto const_stability(const host::CompilerQueries& queries,
                                       const MaxDefIndexTable& table) const
        -> std::optional<host::ConstStability>;

    [[nodiscard]] auto deprecation(const host::CompilerQueries& queries,
                                   const MaxDefIndexTable& table) const
        -> std::optional<host::Deprecation>;

    /// `"unstable"`, `"deprecated"`, both space-separated, or nothing.
    [[nodiscard]] auto stability_class(const host::CompilerQueries& queries,
                                       const MaxDefIndexTable& table) const
        -> std::optional<std::string>;

    [[nodiscard]] auto stable_since(const host::CompilerQueries& queries,
                                    const MaxDefIndexTable& table) const
        -> std::optional<std::string>;

    [[nodiscard]] auto const_stable_since(const host::CompilerQueries& queries,
                                          const MaxDefIndexTable& table) const
        -> std::optional<std::string>;

    // Docs and links

    [[nodiscard]] auto doc_value() const -> std::optional<std::string> {
        return attrs.doc_value();
    }

    [[nodiscard]] auto collapsed_doc_value() const -> std::optional<std::string> {
        return attrs.collapsed_doc_value();
    }

    [[nodiscard]] auto links(const render::Cache& cache, size_t depth) const
        -> std::vector<RenderedLink> {
        return attrs.links(def_id.krate, cache, depth);
    }

    // Kind predicates

    [[nodiscard]] auto type_() const -> ItemType {
        return item_type_of(kind);
    }

    [[nodiscard]] auto is_crate() const -> bool;

    [[nodiscard]] auto is_mod() const -> bool {
        return type_() == ItemType::Module;
    }
    [[nodiscard]] auto is_trait() const -> bool {
        return type_() == ItemType::Trait;
    }
    [[nodiscard]] auto is_struct() const -> bool {
        return type_() == ItemType::Struct;
    }
    [[nodiscard]] auto is_enum() const -> bool {
        return type_() == ItemType::Enum;
    }
    [[nodiscard]] auto is_variant() const -> bool {
        return type_() == ItemType::Variant;
    }
    [[nodiscard]] auto is_associated_type() const -> bool {
        return type_() == ItemType::AssocType;
    }
    [[nodiscard]] auto is_associated_const() const -> bool {
        return type_() == ItemType::AssocConst;
    }
    [[nodiscard]] auto is_method() const -> bool {
        return type_() == ItemType::Method;
    }
    [[nodiscard]] auto is_ty_method() const -> bool {
        return type_() == ItemType::TyMethod;
    }
    [[nodiscard]] auto is_typedef() const -> bool {
        return type_() == ItemType::Typedef;
    }
    [[nodiscard]] auto is_primitive() const -> bool {
        return type_() == ItemType::Primitive;
    }
    [[nodiscard]] auto is_union() const -> bool {
        return type_() == ItemType::Union;
    }
    [[nodiscard]] auto is_import() const -> bool {
        return type_() == ItemType::Import;
    }
    [[nodiscard]] auto is_extern_crate() const -> bool {
        return type_() == ItemType::ExternCrate;
    }
    [[nodiscard]] auto is_keyword() const -> bool {
        return type_() == ItemType::Keyword;
    }

    /// Stripped, or an import that is not displayed.
    [[nodiscard]] auto is_stripped() const -> bool;

    /// For structs, unions and struct variants: whether some fields were
    /// stripped. Nullopt for every other kind.
    [[nodiscard]] auto has_stripped_fields() const -> std::optional<bool>;

    [[nodiscard]] auto is_non_exhaustive() const -> bool;

    /// A provided method that can be specialized.
    [[nodiscard]] auto is_default() const -> bool;

    [[nodiscard]] auto is_fake(const MaxDefIndexTable& table) const -> bool {
        return table.is_fake(def_id);
    }

    /// Wraps the payload in `StrippedItem`. Stripping twice is a no-op.
    void strip();
};

/// Debug rendering of an item. Fake items print `**FAKE**` instead of their
/// def-id.
[[nodiscard]] auto debug_string(const Item& item, const MaxDefIndexTable& table) -> std::string;

// ============================================================================
// Crate
// ============================================================================

/// Extra information attached to a trait from another crate.
struct TraitWithExtraInfo {
    Trait trait_;
    bool is_spotlight = false;
};

struct ExternalCrate {
    std::string name;
    std::string src;
    Attributes attrs;
    std::vector<std::pair<host::DefId, PrimitiveType>> primitives;
    std::vector<std::pair<host::DefId, std::string>> keywords;
};

struct Crate {
    std::string name;
    std::string src;
    std::optional<Item> module;
    std::vector<std::pair<host::CrateNum, ExternalCrate>> externs;
    std::vector<std::pair<host::DefId, PrimitiveType>> primitives;

    /// Traits of other crates referenced by this one. Shared with the
    /// renderer, which takes them over once cleaning is done.
    std::shared_ptr<std::unordered_map<host::DefId, TraitWithExtraInfo>> external_traits =
        std::make_shared<std::unordered_map<host::DefId, TraitWithExtraInfo>>();

    bool collapsed = false;
};

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_ITEM_HPP
