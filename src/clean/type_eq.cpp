//! # Type Identity and Display
//!
//! Structural equality, hashing and the display form of clean types. Shared
//! nodes compare equal by pointer first, then field by field.

#include "clean/types.hpp"

#include <sstream>
#include <type_traits>

namespace cleandoc::clean {

namespace {

auto all_types_equal(const std::vector<TypePtr>& a, const std::vector<TypePtr>& b) -> bool {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!types_equal(a[i], b[i]))
            return false;
    }
    return true;
}

auto generic_args_equal(const GenericArg& a, const GenericArg& b) -> bool {
    if (a.index() != b.index())
        return false;
    if (const auto* ta = std::get_if<TypePtr>(&a))
        return types_equal(*ta, std::get<TypePtr>(b));
    if (const auto* la = std::get_if<Lifetime>(&a))
        return *la == std::get<Lifetime>(b);
    return std::get<Constant>(a) == std::get<Constant>(b);
}

} // namespace

// ============================================================================
// Equality
// ============================================================================

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a == b)
        return true;
    return *a == *b;
}

auto Type::operator==(const Type& other) const -> bool {
    return std::visit(
        [&other](const auto& ta) -> bool {
            using T = std::decay_t<decltype(ta)>;

            if (!std::holds_alternative<T>(other.kind))
                return false;
            const auto& tb = std::get<T>(other.kind);

            if constexpr (std::is_same_v<T, ResolvedPath>) {
                return ta.did == tb.did && ta.is_generic == tb.is_generic && ta.path == tb.path &&
                       ta.param_names == tb.param_names;
            } else if constexpr (std::is_same_v<T, Generic>) {
                return ta.name == tb.name;
            } else if constexpr (std::is_same_v<T, Primitive>) {
                return ta.prim == tb.prim;
            } else if constexpr (std::is_same_v<T, BareFunction>) {
                if (!ta.decl || !tb.decl)
                    return ta.decl == tb.decl;
                return *ta.decl == *tb.decl;
            } else if constexpr (std::is_same_v<T, Tuple>) {
                return all_types_equal(ta.elems, tb.elems);
            } else if constexpr (std::is_same_v<T, Slice>) {
                return types_equal(ta.elem, tb.elem);
            } else if constexpr (std::is_same_v<T, Array>) {
                return ta.len == tb.len && types_equal(ta.elem, tb.elem);
            } else if constexpr (std::is_same_v<T, RawPointer>) {
                return ta.mutability == tb.mutability && types_equal(ta.pointee, tb.pointee);
            } else if constexpr (std::is_same_v<T, BorrowedRef>) {
                return ta.lifetime == tb.lifetime && ta.mutability == tb.mutability &&
                       types_equal(ta.type_, tb.type_);
            } else if constexpr (std::is_same_v<T, QPath>) {
                return ta.name == tb.name && types_equal(ta.self_type, tb.self_type) &&
                       types_equal(ta.trait_, tb.trait_);
            } else if constexpr (std::is_same_v<T, ImplTrait>) {
                return ta.bounds == tb.bounds;
            } else {
                // Never, Infer
                return true;
            }
        },
        kind);
}

auto Constant::operator==(const Constant& other) const -> bool {
    return expr == other.expr && value == other.value && is_literal == other.is_literal &&
           types_equal(type_, other.type_);
}

auto AngleBracketedArgs::operator==(const AngleBracketedArgs& other) const -> bool {
    if (args.size() != other.args.size())
        return false;
    for (size_t i = 0; i < args.size(); ++i) {
        if (!generic_args_equal(args[i], other.args[i]))
            return false;
    }
    return bindings == other.bindings;
}

auto ParenthesizedArgs::operator==(const ParenthesizedArgs& other) const -> bool {
    return all_types_equal(inputs, other.inputs) && types_equal(output, other.output);
}

auto PathSegment::operator==(const PathSegment& other) const -> bool {
    return name == other.name && args == other.args;
}

auto Path::operator==(const Path& other) const -> bool {
    return global == other.global && segments == other.segments;
}

auto PolyTrait::operator==(const PolyTrait& other) const -> bool {
    return types_equal(trait_, other.trait_) && generic_params == other.generic_params;
}

auto GenericBound::TraitBound::operator==(const TraitBound& other) const -> bool {
    return modifier == other.modifier && poly == other.poly;
}

auto GenericBound::operator==(const GenericBound& other) const -> bool {
    return node == other.node;
}

auto TypeBinding::operator==(const TypeBinding& other) const -> bool {
    if (name != other.name || kind.index() != other.kind.index())
        return false;
    if (const auto* eq = std::get_if<Equality>(&kind))
        return types_equal(eq->ty, std::get<Equality>(other.kind).ty);
    return std::get<Constraint>(kind).bounds == std::get<Constraint>(other.kind).bounds;
}

auto GenericParamDefKind::operator==(const GenericParamDefKind& other) const -> bool {
    if (kind.index() != other.kind.index())
        return false;
    if (const auto* a = std::get_if<TypeParam>(&kind)) {
        const auto& b = std::get<TypeParam>(other.kind);
        return a->did == b.did && a->bounds == b.bounds && types_equal(a->default_, b.default_) &&
               a->synthetic == b.synthetic;
    }
    if (const auto* a = std::get_if<ConstParam>(&kind)) {
        const auto& b = std::get<ConstParam>(other.kind);
        return a->did == b.did && types_equal(a->ty, b.ty);
    }
    return true;
}

auto GenericParamDef::operator==(const GenericParamDef& other) const -> bool {
    return name == other.name && kind == other.kind;
}

auto Argument::operator==(const Argument& other) const -> bool {
    return name == other.name && types_equal(type_, other.type_);
}

auto FnDecl::operator==(const FnDecl& other) const -> bool {
    return inputs == other.inputs && output == other.output && c_variadic == other.c_variadic &&
           attrs == other.attrs;
}

auto BareFunctionDecl::operator==(const BareFunctionDecl& other) const -> bool {
    return unsafety == other.unsafety && abi == other.abi &&
           generic_params == other.generic_params && decl == other.decl;
}

// ============================================================================
// Hashing
// ============================================================================

auto hash_value(const Type& ty) -> size_t {
    size_t seed = ty.kind.index();
    auto mix = [&seed](size_t v) { seed = hash_combine(seed, v); };
    auto mix_type = [&mix](const TypePtr& t) { mix(t ? hash_value(*t) : 0); };

    std::visit(
        [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, Type::ResolvedPath>) {
                mix(host::hash_value(t.did));
                mix(std::hash<std::string>{}(t.path.whole_name()));
            } else if constexpr (std::is_same_v<T, Type::Generic>) {
                mix(std::hash<std::string>{}(t.name));
            } else if constexpr (std::is_same_v<T, Type::Primitive>) {
                mix(static_cast<size_t>(t.prim));
            } else if constexpr (std::is_same_v<T, Type::BareFunction>) {
                if (t.decl) {
                    for (const auto& arg : t.decl->decl.inputs.values)
                        mix_type(arg.type_);
                    mix_type(t.decl->decl.output.ret);
                }
            } else if constexpr (std::is_same_v<T, Type::Tuple>) {
                for (const auto& elem : t.elems)
                    mix_type(elem);
            } else if constexpr (std::is_same_v<T, Type::Slice>) {
                mix_type(t.elem);
            } else if constexpr (std::is_same_v<T, Type::Array>) {
                mix_type(t.elem);
                mix(std::hash<std::string>{}(t.len));
            } else if constexpr (std::is_same_v<T, Type::RawPointer>) {
                mix(static_cast<size_t>(t.mutability));
                mix_type(t.pointee);
            } else if constexpr (std::is_same_v<T, Type::BorrowedRef>) {
                mix(static_cast<size_t>(t.mutability));
                mix_type(t.type_);
            } else if constexpr (std::is_same_v<T, Type::QPath>) {
                mix(std::hash<std::string>{}(t.name));
                mix_type(t.self_type);
                mix_type(t.trait_);
            } else if constexpr (std::is_same_v<T, Type::ImplTrait>) {
                mix(t.bounds.size());
            }
        },
        ty.kind);
    return seed;
}

// ============================================================================
// Display
// ============================================================================

namespace {

void write_type(std::ostringstream& ss, const TypePtr& ty) {
    ss << (ty ? type_to_string(*ty) : std::string("<null>"));
}

void write_bounds(std::ostringstream& ss, const std::vector<GenericBound>& bounds) {
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (i > 0)
            ss << " + ";
        ss << bound_to_string(bounds[i]);
    }
}

void write_generic_args(std::ostringstream& ss, const GenericArgs& args) {
    if (const auto* angle = std::get_if<AngleBracketedArgs>(&args)) {
        if (angle->args.empty() && angle->bindings.empty())
            return;
        ss << "<";
        bool first = true;
        for (const auto& arg : angle->args) {
            if (!first)
                ss << ", ";
            first = false;
            if (const auto* lt = std::get_if<Lifetime>(&arg)) {
                ss << lt->name;
            } else if (const auto* ty = std::get_if<TypePtr>(&arg)) {
                write_type(ss, *ty);
            } else {
                ss << std::get<Constant>(arg).expr;
            }
        }
        for (const auto& binding : angle->bindings) {
            if (!first)
                ss << ", ";
            first = false;
            ss << binding.name;
            if (const auto* eq = std::get_if<TypeBinding::Equality>(&binding.kind)) {
                ss << " = ";
                write_type(ss, eq->ty);
            } else {
                ss << ": ";
                write_bounds(ss, std::get<TypeBinding::Constraint>(binding.kind).bounds);
            }
        }
        ss << ">";
        return;
    }

    const auto& paren = std::get<ParenthesizedArgs>(args);
    ss << "(";
    for (size_t i = 0; i < paren.inputs.size(); ++i) {
        if (i > 0)
            ss << ", ";
        write_type(ss, paren.inputs[i]);
    }
    ss << ")";
    if (paren.output) {
        ss << " -> ";
        write_type(ss, paren.output);
    }
}

} // namespace

auto bound_to_string(const GenericBound& bound) -> std::string {
    if (const auto* lt = std::get_if<Lifetime>(&bound.node))
        return lt->name;

    const auto& tb = std::get<GenericBound::TraitBound>(bound.node);
    std::ostringstream ss;
    switch (tb.modifier) {
    case host::TraitBoundModifier::Maybe:
        ss << "?";
        break;
    case host::TraitBoundModifier::MaybeConst:
        ss << "?const ";
        break;
    case host::TraitBoundModifier::None:
        break;
    }
    if (!tb.poly.generic_params.empty()) {
        ss << "for<";
        for (size_t i = 0; i < tb.poly.generic_params.size(); ++i) {
            if (i > 0)
                ss << ", ";
            ss << tb.poly.generic_params[i].name;
        }
        ss << "> ";
    }
    write_type(ss, tb.poly.trait_);
    return ss.str();
}

auto type_to_string(const Type& ty) -> std::string {
    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;
            std::ostringstream ss;

            if constexpr (std::is_same_v<T, Type::ResolvedPath>) {
                if (t.path.global)
                    ss << "::";
                for (size_t i = 0; i < t.path.segments.size(); ++i) {
                    if (i > 0)
                        ss << "::";
                    ss << t.path.segments[i].name;
                    write_generic_args(ss, t.path.segments[i].args);
                }
            } else if constexpr (std::is_same_v<T, Type::Generic>) {
                ss << t.name;
            } else if constexpr (std::is_same_v<T, Type::Primitive>) {
                ss << primitive_as_str(t.prim);
            } else if constexpr (std::is_same_v<T, Type::BareFunction>) {
                if (!t.decl)
                    return "fn()";
                if (t.decl->unsafety == host::Unsafety::Unsafe)
                    ss << "unsafe ";
                if (t.decl->abi != host::Abi::Rust)
                    ss << "extern \"" << host::abi_name(t.decl->abi) << "\" ";
                ss << "fn(";
                const auto& values = t.decl->decl.inputs.values;
                for (size_t i = 0; i < values.size(); ++i) {
                    if (i > 0)
                        ss << ", ";
                    write_type(ss, values[i].type_);
                }
                if (t.decl->decl.c_variadic)
                    ss << (values.empty() ? "..." : ", ...");
                ss << ")";
                if (!t.decl->decl.output.is_default()) {
                    ss << " -> ";
                    write_type(ss, t.decl->decl.output.ret);
                }
            } else if constexpr (std::is_same_v<T, Type::Tuple>) {
                ss << "(";
                for (size_t i = 0; i < t.elems.size(); ++i) {
                    if (i > 0)
                        ss << ", ";
                    write_type(ss, t.elems[i]);
                }
                if (t.elems.size() == 1)
                    ss << ",";
                ss << ")";
            } else if constexpr (std::is_same_v<T, Type::Slice>) {
                ss << "[";
                write_type(ss, t.elem);
                ss << "]";
            } else if constexpr (std::is_same_v<T, Type::Array>) {
                ss << "[";
                write_type(ss, t.elem);
                ss << "; " << t.len << "]";
            } else if constexpr (std::is_same_v<T, Type::Never>) {
                ss << "!";
            } else if constexpr (std::is_same_v<T, Type::RawPointer>) {
                ss << (t.mutability == host::Mutability::Mut ? "*mut " : "*const ");
                write_type(ss, t.pointee);
            } else if constexpr (std::is_same_v<T, Type::BorrowedRef>) {
                ss << "&";
                if (t.lifetime)
                    ss << t.lifetime->name << " ";
                if (t.mutability == host::Mutability::Mut)
                    ss << "mut ";
                write_type(ss, t.type_);
            } else if constexpr (std::is_same_v<T, Type::QPath>) {
                ss << "<";
                write_type(ss, t.self_type);
                ss << " as ";
                write_type(ss, t.trait_);
                ss << ">::" << t.name;
            } else if constexpr (std::is_same_v<T, Type::Infer>) {
                ss << "_";
            } else if constexpr (std::is_same_v<T, Type::ImplTrait>) {
                ss << "impl ";
                write_bounds(ss, t.bounds);
            }
            return ss.str();
        },
        ty.kind);
}

} // namespace cleandoc::clean
