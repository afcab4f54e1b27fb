#include "host/queries.hpp"

namespace cleandoc::host {

auto lang_item_name(LangItem item) -> const char* {
    switch (item) {
    case LangItem::Sized:
        return "sized";
    case LangItem::BoolImpl:
        return "bool";
    case LangItem::CharImpl:
        return "char";
    case LangItem::StrImpl:
        return "str";
    case LangItem::StrAllocImpl:
        return "str_alloc";
    case LangItem::ArrayImpl:
        return "array";
    case LangItem::SliceImpl:
        return "slice";
    case LangItem::SliceU8Impl:
        return "slice_u8";
    case LangItem::SliceAllocImpl:
        return "slice_alloc";
    case LangItem::SliceU8AllocImpl:
        return "slice_u8_alloc";
    case LangItem::ConstPtrImpl:
        return "const_ptr";
    case LangItem::MutPtrImpl:
        return "mut_ptr";
    case LangItem::ConstSlicePtrImpl:
        return "const_slice_ptr";
    case LangItem::MutSlicePtrImpl:
        return "mut_slice_ptr";
    case LangItem::I8Impl:
        return "i8";
    case LangItem::I16Impl:
        return "i16";
    case LangItem::I32Impl:
        return "i32";
    case LangItem::I64Impl:
        return "i64";
    case LangItem::I128Impl:
        return "i128";
    case LangItem::IsizeImpl:
        return "isize";
    case LangItem::U8Impl:
        return "u8";
    case LangItem::U16Impl:
        return "u16";
    case LangItem::U32Impl:
        return "u32";
    case LangItem::U64Impl:
        return "u64";
    case LangItem::U128Impl:
        return "u128";
    case LangItem::UsizeImpl:
        return "usize";
    case LangItem::F32Impl:
        return "f32";
    case LangItem::F64Impl:
        return "f64";
    case LangItem::F32RuntimeImpl:
        return "f32_runtime";
    case LangItem::F64RuntimeImpl:
        return "f64_runtime";
    }
    return "unknown";
}

auto LangItems::require(LangItem item) const -> DefId {
    auto did = get(item);
    if (!did) {
        throw InvariantError(std::string("requires `") + lang_item_name(item) + "` lang_item");
    }
    return *did;
}

auto abi_name(Abi abi) -> const char* {
    switch (abi) {
    case Abi::Rust:
        return "Rust";
    case Abi::C:
        return "C";
    case Abi::System:
        return "system";
    case Abi::RustIntrinsic:
        return "rust-intrinsic";
    case Abi::RustCall:
        return "rust-call";
    case Abi::PlatformIntrinsic:
        return "platform-intrinsic";
    case Abi::Unadjusted:
        return "unadjusted";
    }
    return "unknown";
}

} // namespace cleandoc::host
