#include "clean/primitive.hpp"

#include "log/log.hpp"

#include <initializer_list>
#include <type_traits>
#include <variant>

namespace cleandoc::clean {

// ============================================================================
// Primitive Types
// ============================================================================

auto all_primitive_types() -> const std::array<PrimitiveType, 25>& {
    static const std::array<PrimitiveType, 25> all = {
        PrimitiveType::Isize, PrimitiveType::I8,         PrimitiveType::I16,
        PrimitiveType::I32,   PrimitiveType::I64,        PrimitiveType::I128,
        PrimitiveType::Usize, PrimitiveType::U8,         PrimitiveType::U16,
        PrimitiveType::U32,   PrimitiveType::U64,        PrimitiveType::U128,
        PrimitiveType::F32,   PrimitiveType::F64,        PrimitiveType::Char,
        PrimitiveType::Bool,  PrimitiveType::Str,        PrimitiveType::Slice,
        PrimitiveType::Array, PrimitiveType::Tuple,      PrimitiveType::Unit,
        PrimitiveType::RawPointer, PrimitiveType::Reference, PrimitiveType::Fn,
        PrimitiveType::Never,
    };
    return all;
}

auto primitive_from(host::IntTy ty) -> PrimitiveType {
    switch (ty) {
    case host::IntTy::Isize:
        return PrimitiveType::Isize;
    case host::IntTy::I8:
        return PrimitiveType::I8;
    case host::IntTy::I16:
        return PrimitiveType::I16;
    case host::IntTy::I32:
        return PrimitiveType::I32;
    case host::IntTy::I64:
        return PrimitiveType::I64;
    case host::IntTy::I128:
        return PrimitiveType::I128;
    }
    throw InvariantError("unknown integer type tag");
}

auto primitive_from(host::UintTy ty) -> PrimitiveType {
    switch (ty) {
    case host::UintTy::Usize:
        return PrimitiveType::Usize;
    case host::UintTy::U8:
        return PrimitiveType::U8;
    case host::UintTy::U16:
        return PrimitiveType::U16;
    case host::UintTy::U32:
        return PrimitiveType::U32;
    case host::UintTy::U64:
        return PrimitiveType::U64;
    case host::UintTy::U128:
        return PrimitiveType::U128;
    }
    throw InvariantError("unknown unsigned integer type tag");
}

auto primitive_from(host::FloatTy ty) -> PrimitiveType {
    switch (ty) {
    case host::FloatTy::F32:
        return PrimitiveType::F32;
    case host::FloatTy::F64:
        return PrimitiveType::F64;
    }
    throw InvariantError("unknown float type tag");
}

auto primitive_from_hir(const host::PrimTy& prim) -> PrimitiveType {
    return std::visit(
        [](const auto& k) -> PrimitiveType {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, host::PrimTy::Str>) {
                return PrimitiveType::Str;
            } else if constexpr (std::is_same_v<T, host::PrimTy::Bool>) {
                return PrimitiveType::Bool;
            } else if constexpr (std::is_same_v<T, host::PrimTy::Char>) {
                return PrimitiveType::Char;
            } else {
                return primitive_from(k);
            }
        },
        prim.kind);
}

auto primitive_from_symbol(std::string_view sym) -> std::optional<PrimitiveType> {
    for (PrimitiveType prim : all_primitive_types()) {
        if (primitive_as_str(prim) == sym) {
            return prim;
        }
    }
    return std::nullopt;
}

auto primitive_as_str(PrimitiveType prim) -> std::string_view {
    switch (prim) {
    case PrimitiveType::Isize:
        return "isize";
    case PrimitiveType::I8:
        return "i8";
    case PrimitiveType::I16:
        return "i16";
    case PrimitiveType::I32:
        return "i32";
    case PrimitiveType::I64:
        return "i64";
    case PrimitiveType::I128:
        return "i128";
    case PrimitiveType::Usize:
        return "usize";
    case PrimitiveType::U8:
        return "u8";
    case PrimitiveType::U16:
        return "u16";
    case PrimitiveType::U32:
        return "u32";
    case PrimitiveType::U64:
        return "u64";
    case PrimitiveType::U128:
        return "u128";
    case PrimitiveType::F32:
        return "f32";
    case PrimitiveType::F64:
        return "f64";
    case PrimitiveType::Str:
        return "str";
    case PrimitiveType::Bool:
        return "bool";
    case PrimitiveType::Char:
        return "char";
    case PrimitiveType::Array:
        return "array";
    case PrimitiveType::Slice:
        return "slice";
    case PrimitiveType::Tuple:
        return "tuple";
    case PrimitiveType::Unit:
        return "unit";
    case PrimitiveType::RawPointer:
        return "pointer";
    case PrimitiveType::Reference:
        return "reference";
    case PrimitiveType::Fn:
        return "fn";
    case PrimitiveType::Never:
        return "never";
    }
    return "";
}

// ============================================================================
// Type Kinds
// ============================================================================

auto type_kind_from_def_kind(const host::DefKind& kind) -> TypeKind {
    using Tag = host::DefKind::Tag;
    switch (kind.tag) {
    case Tag::Enum:
        return TypeKind::Enum;
    case Tag::Fn:
        return TypeKind::Function;
    case Tag::Mod:
        return TypeKind::Module;
    case Tag::Const:
        return TypeKind::Const;
    case Tag::Static:
        return TypeKind::Static;
    case Tag::Struct:
        return TypeKind::Struct;
    case Tag::Union:
        return TypeKind::Union;
    case Tag::Trait:
        return TypeKind::Trait;
    case Tag::TyAlias:
        return TypeKind::Typedef;
    case Tag::TraitAlias:
        return TypeKind::TraitAlias;
    // Proc-macro attributes and derives get their own kinds from the item,
    // not from the path
    case Tag::Macro:
        return TypeKind::Macro;
    case Tag::ForeignTy:
    case Tag::Variant:
    case Tag::AssocTy:
    case Tag::TyParam:
    case Tag::ConstParam:
    case Tag::Ctor:
    case Tag::AssocFn:
    case Tag::AssocConst:
    case Tag::ExternCrate:
    case Tag::Use:
    case Tag::ForeignMod:
    case Tag::AnonConst:
    case Tag::OpaqueTy:
    case Tag::Field:
    case Tag::LifetimeParam:
    case Tag::GlobalAsm:
    case Tag::Impl:
    case Tag::Closure:
    case Tag::Generator:
        return TypeKind::Foreign;
    }
    return TypeKind::Foreign;
}

// ============================================================================
// Primitive Impl Cache
// ============================================================================

auto build_primitive_impls(const host::LangItems& lang_items) -> PrimitiveImplTable {
    using host::LangItem;

    auto collect = [&](std::initializer_list<LangItem> items) {
        PrimitiveImplList list;
        for (LangItem item : items) {
            if (auto did = lang_items.get(item)) {
                list.push_back(*did);
            }
        }
        return list;
    };

    PrimitiveImplTable table;
    table[PrimitiveType::Isize] = collect({LangItem::IsizeImpl});
    table[PrimitiveType::I8] = collect({LangItem::I8Impl});
    table[PrimitiveType::I16] = collect({LangItem::I16Impl});
    table[PrimitiveType::I32] = collect({LangItem::I32Impl});
    table[PrimitiveType::I64] = collect({LangItem::I64Impl});
    table[PrimitiveType::I128] = collect({LangItem::I128Impl});
    table[PrimitiveType::Usize] = collect({LangItem::UsizeImpl});
    table[PrimitiveType::U8] = collect({LangItem::U8Impl});
    table[PrimitiveType::U16] = collect({LangItem::U16Impl});
    table[PrimitiveType::U32] = collect({LangItem::U32Impl});
    table[PrimitiveType::U64] = collect({LangItem::U64Impl});
    table[PrimitiveType::U128] = collect({LangItem::U128Impl});
    table[PrimitiveType::F32] = collect({LangItem::F32Impl, LangItem::F32RuntimeImpl});
    table[PrimitiveType::F64] = collect({LangItem::F64Impl, LangItem::F64RuntimeImpl});
    table[PrimitiveType::Char] = collect({LangItem::CharImpl});
    table[PrimitiveType::Bool] = collect({LangItem::BoolImpl});
    table[PrimitiveType::Str] = collect({LangItem::StrImpl, LangItem::StrAllocImpl});
    table[PrimitiveType::Slice] = collect({LangItem::SliceImpl, LangItem::SliceU8Impl,
                                           LangItem::SliceAllocImpl, LangItem::SliceU8AllocImpl});
    table[PrimitiveType::Array] = collect({LangItem::ArrayImpl});
    table[PrimitiveType::Tuple] = {};
    table[PrimitiveType::Unit] = {};
    table[PrimitiveType::RawPointer] =
        collect({LangItem::ConstPtrImpl, LangItem::MutPtrImpl, LangItem::ConstSlicePtrImpl,
                 LangItem::MutSlicePtrImpl});
    table[PrimitiveType::Reference] = {};
    table[PrimitiveType::Fn] = {};
    table[PrimitiveType::Never] = {};
    return table;
}

PrimitiveImpls& PrimitiveImpls::instance() {
    static PrimitiveImpls impls;
    return impls;
}

auto PrimitiveImpls::all_impls(const host::LangItems& lang_items) -> const PrimitiveImplTable& {
    std::call_once(once_, [&]() {
        table_ = build_primitive_impls(lang_items);
        initialized_ = true;
        CLEANDOC_LOG_DEBUG("primitive", "computed inherent impls for " << table_.size()
                                                                       << " primitives");
    });
    return table_;
}

auto PrimitiveImpls::impls(PrimitiveType prim, const host::LangItems& lang_items)
    -> const PrimitiveImplList& {
    const auto& table = all_impls(lang_items);
    auto it = table.find(prim);
    if (it == table.end()) {
        throw InvariantError("missing impl for primitive type `" +
                             std::string(primitive_as_str(prim)) + "`");
    }
    return it->second;
}

} // namespace cleandoc::clean
