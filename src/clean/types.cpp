//! # Clean Type Queries
//!
//! Construction helpers and structural queries for `Type` and the generic
//! and function scaffolding around it. Equality, hashing and display live in
//! `type_eq.cpp`.

#include "clean/types.hpp"

#include "clean/context.hpp"
#include "render/cache.hpp"

#include <type_traits>

namespace cleandoc::clean {

namespace {

auto make(Type::Kind kind) -> TypePtr {
    return std::make_shared<Type>(Type{std::move(kind)});
}

} // namespace

// ============================================================================
// Type Constructors
// ============================================================================

auto Type::resolved_path(Path path, host::DefId did, bool is_generic) -> TypePtr {
    return make(ResolvedPath{std::move(path), std::nullopt, did, is_generic});
}

auto Type::generic(std::string name) -> TypePtr {
    return make(Generic{std::move(name)});
}

auto Type::primitive(PrimitiveType prim) -> TypePtr {
    return make(Primitive{prim});
}

auto Type::bare_function(BareFunctionDecl decl) -> TypePtr {
    return make(BareFunction{std::make_shared<const BareFunctionDecl>(std::move(decl))});
}

auto Type::tuple(std::vector<TypePtr> elems) -> TypePtr {
    return make(Tuple{std::move(elems)});
}

auto Type::slice(TypePtr elem) -> TypePtr {
    return make(Slice{std::move(elem)});
}

auto Type::array(TypePtr elem, std::string len) -> TypePtr {
    return make(Array{std::move(elem), std::move(len)});
}

auto Type::never() -> TypePtr {
    return make(Never{});
}

auto Type::raw_pointer(host::Mutability mutability, TypePtr pointee) -> TypePtr {
    return make(RawPointer{mutability, std::move(pointee)});
}

auto Type::borrowed_ref(std::optional<Lifetime> lifetime, host::Mutability mutability,
                        TypePtr type_) -> TypePtr {
    return make(BorrowedRef{std::move(lifetime), mutability, std::move(type_)});
}

auto Type::qpath(std::string name, TypePtr self_type, TypePtr trait_) -> TypePtr {
    return make(QPath{std::move(name), std::move(self_type), std::move(trait_)});
}

auto Type::infer() -> TypePtr {
    return make(Infer{});
}

auto Type::impl_trait(std::vector<GenericBound> bounds) -> TypePtr {
    return make(ImplTrait{std::move(bounds)});
}

// ============================================================================
// Type Queries
// ============================================================================

auto Type::primitive_type() const -> std::optional<PrimitiveType> {
    if (const auto* p = as<Primitive>())
        return p->prim;
    if (const auto* r = as<BorrowedRef>()) {
        if (!r->type_)
            return std::nullopt;
        if (const auto* p = r->type_->as<Primitive>())
            return p->prim;
        if (r->type_->is<Slice>())
            return PrimitiveType::Slice;
        if (r->type_->is<Array>())
            return PrimitiveType::Array;
        if (r->type_->is<Generic>())
            return PrimitiveType::Reference;
        return std::nullopt;
    }
    if (is<Slice>())
        return PrimitiveType::Slice;
    if (is<Array>())
        return PrimitiveType::Array;
    if (const auto* t = as<Tuple>())
        return t->elems.empty() ? PrimitiveType::Unit : PrimitiveType::Tuple;
    if (is<RawPointer>())
        return PrimitiveType::RawPointer;
    if (is<BareFunction>())
        return PrimitiveType::Fn;
    if (is<Never>())
        return PrimitiveType::Never;
    return std::nullopt;
}

auto Type::is_generic() const -> bool {
    const auto* p = as<ResolvedPath>();
    return p && p->is_generic;
}

auto Type::is_self_type() const -> bool {
    const auto* g = as<Generic>();
    return g && g->name == "Self";
}

auto Type::generics() const -> std::optional<std::vector<TypePtr>> {
    const auto* p = as<ResolvedPath>();
    if (!p || p->path.segments.empty())
        return std::nullopt;
    const auto* angle = std::get_if<AngleBracketedArgs>(&p->path.segments.back().args);
    if (!angle)
        return std::nullopt;

    std::vector<TypePtr> out;
    for (const auto& arg : angle->args) {
        if (const auto* ty = std::get_if<TypePtr>(&arg))
            out.push_back(*ty);
    }
    return out;
}

auto Type::bindings() const -> const std::vector<TypeBinding>* {
    const auto* p = as<ResolvedPath>();
    if (!p || p->path.segments.empty())
        return nullptr;
    const auto* angle = std::get_if<AngleBracketedArgs>(&p->path.segments.back().args);
    return angle ? &angle->bindings : nullptr;
}

auto Type::is_primitive() const -> bool {
    if (is<Primitive>())
        return true;
    if (const auto* r = as<BorrowedRef>())
        return r->type_ && r->type_->is_primitive();
    if (const auto* p = as<RawPointer>())
        return p->pointee && p->pointee->is_primitive();
    return false;
}

auto Type::projection() const -> std::optional<std::tuple<TypePtr, host::DefId, std::string>> {
    const auto* q = as<QPath>();
    if (!q)
        return std::nullopt;
    const auto* trait_path = q->trait_->as<ResolvedPath>();
    if (!trait_path)
        return std::nullopt;
    return std::make_tuple(q->self_type, trait_path->did, q->name);
}

auto Type::inner_def_id(const render::Cache* cache) const -> std::optional<host::DefId> {
    auto primitive_location = [cache](PrimitiveType prim) -> std::optional<host::DefId> {
        if (!cache)
            return std::nullopt;
        auto it = cache->primitive_locations.find(prim);
        if (it == cache->primitive_locations.end())
            return std::nullopt;
        return it->second;
    };

    return std::visit(
        [&](const auto& t) -> std::optional<host::DefId> {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ResolvedPath>) {
                return t.did;
            } else if constexpr (std::is_same_v<T, Primitive>) {
                return primitive_location(t.prim);
            } else if constexpr (std::is_same_v<T, BorrowedRef>) {
                if (t.type_->template is<Generic>())
                    return primitive_location(PrimitiveType::Reference);
                return t.type_->inner_def_id(cache);
            } else if constexpr (std::is_same_v<T, Tuple>) {
                return primitive_location(t.elems.empty() ? PrimitiveType::Unit
                                                          : PrimitiveType::Tuple);
            } else if constexpr (std::is_same_v<T, BareFunction>) {
                return primitive_location(PrimitiveType::Fn);
            } else if constexpr (std::is_same_v<T, Never>) {
                return primitive_location(PrimitiveType::Never);
            } else if constexpr (std::is_same_v<T, Slice>) {
                return primitive_location(PrimitiveType::Slice);
            } else if constexpr (std::is_same_v<T, Array>) {
                return primitive_location(PrimitiveType::Array);
            } else if constexpr (std::is_same_v<T, RawPointer>) {
                return primitive_location(PrimitiveType::RawPointer);
            } else if constexpr (std::is_same_v<T, QPath>) {
                return t.self_type->inner_def_id(cache);
            } else {
                // Generic, Infer, ImplTrait
                return std::nullopt;
            }
        },
        kind);
}

auto Type::def_id() const -> std::optional<host::DefId> {
    return inner_def_id(nullptr);
}

auto Type::def_id_full(const render::Cache& cache) const -> std::optional<host::DefId> {
    return inner_def_id(&cache);
}

// ============================================================================
// Paths
// ============================================================================

auto Path::last() const -> const std::string& {
    if (segments.empty()) {
        throw InvariantError("path segments were empty");
    }
    return segments.back().name;
}

auto Path::whole_name() const -> std::string {
    std::string out = global ? "::" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0)
            out += "::";
        out += segments[i].name;
    }
    return out;
}

// ============================================================================
// Bounds
// ============================================================================

auto GenericBound::maybe_sized(DocContext& cx) -> GenericBound {
    host::DefId did = cx.queries().lang_items().require(host::LangItem::Sized);
    Path path = external_path(cx.queries().item_name(did));
    cx.record_extern_fqn(did, TypeKind::Trait);
    return GenericBound{TraitBound{PolyTrait{Type::resolved_path(std::move(path), did), {}},
                                   host::TraitBoundModifier::Maybe}};
}

auto GenericBound::is_sized_bound(const DocContext& cx) const -> bool {
    const auto* bound = std::get_if<TraitBound>(&node);
    if (!bound || bound->modifier != host::TraitBoundModifier::None || !bound->poly.trait_)
        return false;
    auto did = bound->poly.trait_->def_id();
    return did.has_value() && did == cx.queries().lang_items().sized_trait();
}

auto GenericBound::get_poly_trait() const -> std::optional<PolyTrait> {
    if (const auto* bound = std::get_if<TraitBound>(&node))
        return bound->poly;
    return std::nullopt;
}

auto GenericBound::get_trait_type() const -> TypePtr {
    if (const auto* bound = std::get_if<TraitBound>(&node))
        return bound->poly.trait_;
    return nullptr;
}

auto TypeBinding::ty() const -> const TypePtr& {
    if (const auto* eq = std::get_if<Equality>(&kind))
        return eq->ty;
    throw InvariantError("expected equality type binding for parenthesized generic args");
}

// ============================================================================
// Generic Parameters
// ============================================================================

auto GenericParamDefKind::get_type() const -> TypePtr {
    if (const auto* ty = std::get_if<TypeParam>(&kind))
        return ty->default_;
    if (const auto* ct = std::get_if<ConstParam>(&kind))
        return ct->ty;
    return nullptr;
}

auto GenericParamDef::is_synthetic_type_param() const -> bool {
    const auto* ty = std::get_if<GenericParamDefKind::TypeParam>(&kind.kind);
    return ty && ty->synthetic.has_value();
}

auto GenericParamDef::get_bounds() const -> const std::vector<GenericBound>* {
    if (const auto* ty = std::get_if<GenericParamDefKind::TypeParam>(&kind.kind))
        return &ty->bounds;
    return nullptr;
}

auto WherePredicate::get_bounds() const -> const std::vector<GenericBound>* {
    if (const auto* b = std::get_if<BoundPredicate>(&pred))
        return &b->bounds;
    if (const auto* r = std::get_if<RegionPredicate>(&pred))
        return &r->bounds;
    return nullptr;
}

// ============================================================================
// Functions
// ============================================================================

auto Argument::to_self() const -> std::optional<SelfTy> {
    if (name != "self")
        return std::nullopt;
    if (!type_)
        throw InvariantError("`self` argument has no type");
    if (type_->is_self_type())
        return SelfTy{SelfValue{}};
    if (const auto* r = type_->as<Type::BorrowedRef>()) {
        if (r->type_->is_self_type())
            return SelfTy{SelfBorrowed{r->lifetime, r->mutability}};
    }
    return SelfTy{SelfExplicit{type_}};
}

auto FnRetTy::def_id() const -> std::optional<host::DefId> {
    return ret ? ret->def_id() : std::nullopt;
}

auto FnRetTy::def_id_full(const render::Cache& cache) const -> std::optional<host::DefId> {
    return ret ? ret->def_id_full(cache) : std::nullopt;
}

auto FnDecl::self_type() const -> std::optional<SelfTy> {
    if (inputs.values.empty())
        return std::nullopt;
    return inputs.values.front().to_self();
}

auto FnDecl::sugared_async_return_type() const -> FnRetTy {
    const auto* impl = output.ret ? output.ret->as<Type::ImplTrait>() : nullptr;
    if (!impl || impl->bounds.empty()) {
        throw InvariantError("unexpected desugaring of async function");
    }
    const auto* bound = std::get_if<GenericBound::TraitBound>(&impl->bounds.front().node);
    if (!bound || !bound->poly.trait_) {
        throw InvariantError("unexpected desugaring of async function");
    }
    const auto* bindings = bound->poly.trait_->bindings();
    if (!bindings || bindings->empty()) {
        throw InvariantError("async function output has no `Output` binding");
    }
    return FnRetTy::returns(bindings->front().ty());
}

// ============================================================================
// External Paths
// ============================================================================

auto external_path(std::string name, std::vector<GenericArg> args,
                   std::vector<TypeBinding> bindings) -> Path {
    PathSegment segment{std::move(name), AngleBracketedArgs{std::move(args), std::move(bindings)}};
    return Path{false, {std::move(segment)}};
}

} // namespace cleandoc::clean
