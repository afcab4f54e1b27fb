//! # Item Types
//!
//! The documentation-level category of an item. It decides the page an item
//! is rendered to (`struct.Foo.html`, `fn.bar.html`) and the CSS class of
//! its links. The numeric values are stable: search indexes store them.

#ifndef CLEANDOC_CLEAN_ITEM_TYPE_HPP
#define CLEANDOC_CLEAN_ITEM_TYPE_HPP

#include "clean/primitive.hpp"

#include <cstdint>
#include <ostream>
#include <string_view>

namespace cleandoc::clean {

enum class ItemType : uint8_t {
    Module = 0,
    ExternCrate = 1,
    Import = 2,
    Struct = 3,
    Enum = 4,
    Function = 5,
    Typedef = 6,
    Static = 7,
    Trait = 8,
    Impl = 9,
    TyMethod = 10,
    Method = 11,
    StructField = 12,
    Variant = 13,
    Macro = 14,
    Primitive = 15,
    AssocType = 16,
    Constant = 17,
    AssocConst = 18,
    Union = 19,
    ForeignType = 20,
    Keyword = 21,
    OpaqueTy = 22,
    ProcAttribute = 23,
    ProcDerive = 24,
    TraitAlias = 25,
};

/// The page prefix of an item type: `"struct"`, `"fn"`, `"mod"`, ...
[[nodiscard]] auto item_type_as_str(ItemType ty) -> std::string_view;

/// The item type of an external definition recorded with `kind`.
[[nodiscard]] auto item_type_from_type_kind(TypeKind kind) -> ItemType;

inline auto operator<<(std::ostream& os, ItemType ty) -> std::ostream& {
    return os << item_type_as_str(ty);
}

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_ITEM_TYPE_HPP
