#include "clean/item_type.hpp"

namespace cleandoc::clean {

auto item_type_as_str(ItemType ty) -> std::string_view {
    switch (ty) {
    case ItemType::Module:
        return "mod";
    case ItemType::ExternCrate:
        return "externcrate";
    case ItemType::Import:
        return "import";
    case ItemType::Struct:
        return "struct";
    case ItemType::Enum:
        return "enum";
    case ItemType::Function:
        return "fn";
    case ItemType::Typedef:
        return "type";
    case ItemType::Static:
        return "static";
    case ItemType::Trait:
        return "trait";
    case ItemType::Impl:
        return "impl";
    case ItemType::TyMethod:
        return "tymethod";
    case ItemType::Method:
        return "method";
    case ItemType::StructField:
        return "structfield";
    case ItemType::Variant:
        return "variant";
    case ItemType::Macro:
        return "macro";
    case ItemType::Primitive:
        return "primitive";
    case ItemType::AssocType:
        return "associatedtype";
    case ItemType::Constant:
        return "constant";
    case ItemType::AssocConst:
        return "associatedconstant";
    case ItemType::Union:
        return "union";
    case ItemType::ForeignType:
        return "foreigntype";
    case ItemType::Keyword:
        return "keyword";
    case ItemType::OpaqueTy:
        return "opaque";
    case ItemType::ProcAttribute:
        return "attr";
    case ItemType::ProcDerive:
        return "derive";
    case ItemType::TraitAlias:
        return "traitalias";
    }
    return "";
}

auto item_type_from_type_kind(TypeKind kind) -> ItemType {
    switch (kind) {
    case TypeKind::Struct:
        return ItemType::Struct;
    case TypeKind::Union:
        return ItemType::Union;
    case TypeKind::Enum:
        return ItemType::Enum;
    case TypeKind::Function:
        return ItemType::Function;
    case TypeKind::Trait:
        return ItemType::Trait;
    case TypeKind::Module:
        return ItemType::Module;
    case TypeKind::Static:
        return ItemType::Static;
    case TypeKind::Const:
        return ItemType::Constant;
    case TypeKind::Typedef:
        return ItemType::Typedef;
    case TypeKind::Foreign:
        return ItemType::ForeignType;
    case TypeKind::Macro:
        return ItemType::Macro;
    case TypeKind::Attr:
        return ItemType::ProcAttribute;
    case TypeKind::Derive:
        return ItemType::ProcDerive;
    case TypeKind::TraitAlias:
        return ItemType::TraitAlias;
    case TypeKind::Primitive:
        return ItemType::Primitive;
    }
    return ItemType::ForeignType;
}

} // namespace cleandoc::clean
