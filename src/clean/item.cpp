//! # Clean Item Queries
//!
//! Construction of items from host definitions, the kind predicates, and
//! the stability lookups. Stability and deprecation are never looked up for
//! fake items: the host has no entries for them.

#include "clean/item.hpp"

#include "clean/context.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace cleandoc::clean {

// ============================================================================
// Visibility and Imports
// ============================================================================

auto Visibility::from_host(const host::HostVisibility& vis) -> Visibility {
    switch (vis.kind) {
    case host::HostVisibility::Kind::Public:
        return public_();
    case host::HostVisibility::Kind::Restricted:
        return restricted(vis.restricted_to);
    case host::HostVisibility::Kind::Invisible:
        break;
    }
    return inherited();
}

auto Import::new_simple(std::string name, ImportSource source, bool should_be_displayed)
    -> Import {
    return Import{ImportKind{ImportKind::Tag::Simple, std::move(name)}, std::move(source),
                  should_be_displayed};
}

auto Import::new_glob(ImportSource source, bool should_be_displayed) -> Import {
    return Import{ImportKind{ImportKind::Tag::Glob, {}}, std::move(source), should_be_displayed};
}

// ============================================================================
// ItemKind
// ============================================================================

auto ItemKind::inner_items() const -> std::span<const Item> {
    return std::visit(
        [](const auto& k) -> std::span<const Item> {
            using T = std::decay_t<decltype(k)>;

            if constexpr (std::is_same_v<T, Struct> || std::is_same_v<T, Union>) {
                return k.fields;
            } else if constexpr (std::is_same_v<T, Variant>) {
                if (const auto* vs = std::get_if<VariantStruct>(&k.kind))
                    return vs->fields;
                return {};
            } else if constexpr (std::is_same_v<T, Enum>) {
                return k.variants;
            } else if constexpr (std::is_same_v<T, Trait> || std::is_same_v<T, Impl> ||
                                 std::is_same_v<T, Module>) {
                return k.items;
            } else {
                return {};
            }
        },
        node);
}

auto item_type_of(const ItemKind& kind) -> ItemType {
    const ItemKind* k = &kind;
    if (const auto* stripped = kind.as<StrippedItem>()) {
        if (!stripped->inner) {
            throw InvariantError("stripped item without a payload");
        }
        k = stripped->inner.get();
    }

    return std::visit(
        [](const auto& node) -> ItemType {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, Module>) {
                return ItemType::Module;
            } else if constexpr (std::is_same_v<T, ExternCrateItem>) {
                return ItemType::ExternCrate;
            } else if constexpr (std::is_same_v<T, Import>) {
                return ItemType::Import;
            } else if constexpr (std::is_same_v<T, Struct>) {
                return ItemType::Struct;
            } else if constexpr (std::is_same_v<T, Union>) {
                return ItemType::Union;
            } else if constexpr (std::is_same_v<T, Enum>) {
                return ItemType::Enum;
            } else if constexpr (std::is_same_v<T, FunctionItem> ||
                                 std::is_same_v<T, ForeignFunctionItem>) {
                return ItemType::Function;
            } else if constexpr (std::is_same_v<T, TypedefItem>) {
                return ItemType::Typedef;
            } else if constexpr (std::is_same_v<T, OpaqueTy>) {
                return ItemType::OpaqueTy;
            } else if constexpr (std::is_same_v<T, StaticItem> ||
                                 std::is_same_v<T, ForeignStaticItem>) {
                return ItemType::Static;
            } else if constexpr (std::is_same_v<T, Constant>) {
                return ItemType::Constant;
            } else if constexpr (std::is_same_v<T, Trait>) {
                return ItemType::Trait;
            } else if constexpr (std::is_same_v<T, Impl>) {
                return ItemType::Impl;
            } else if constexpr (std::is_same_v<T, TyMethodItem>) {
                return ItemType::TyMethod;
            } else if constexpr (std::is_same_v<T, MethodItem>) {
                return ItemType::Method;
            } else if constexpr (std::is_same_v<T, StructFieldItem>) {
                return ItemType::StructField;
            } else if constexpr (std::is_same_v<T, Variant>) {
                return ItemType::Variant;
            } else if constexpr (std::is_same_v<T, Macro>) {
                return ItemType::Macro;
            } else if constexpr (std::is_same_v<T, PrimitiveItem>) {
                return ItemType::Primitive;
            } else if constexpr (std::is_same_v<T, AssocConstItem>) {
                return ItemType::AssocConst;
            } else if constexpr (std::is_same_v<T, AssocTypeItem>) {
                return ItemType::AssocType;
            } else if constexpr (std::is_same_v<T, ForeignTypeItem>) {
                return ItemType::ForeignType;
            } else if constexpr (std::is_same_v<T, KeywordItem>) {
                return ItemType::Keyword;
            } else if constexpr (std::is_same_v<T, TraitAlias>) {
                return ItemType::TraitAlias;
            } else if constexpr (std::is_same_v<T, ProcMacro>) {
                switch (node.kind) {
                case host::MacroKind::Attr:
                    return ItemType::ProcAttribute;
                case host::MacroKind::Derive:
                    return ItemType::ProcDerive;
                case host::MacroKind::Bang:
                    break;
                }
                return ItemType::Macro;
            } else {
                static_assert(std::is_same_v<T, StrippedItem>);
                throw InvariantError("item was stripped twice");
            }
        },
        k->node);
}

// ============================================================================
// Construction
// ============================================================================

auto Item::from_def_id_and_parts(host::DefId def_id, std::optional<std::string> name,
                                 ItemKind kind, DocContext& cx) -> Item {
    Attributes attrs = Attributes::from_ast(cx.diag(), cx.queries().get_attrs(def_id));
    return from_def_id_and_attrs_and_parts(def_id, std::move(name), std::move(kind),
                                           std::move(attrs), cx);
}

auto Item::from_def_id_and_attrs_and_parts(host::DefId def_id, std::optional<std::string> name,
                                           ItemKind kind, Attributes attrs, DocContext& cx)
    -> Item {
    CLEANDOC_LOG_DEBUG("clean", "name=" << name.value_or("<none>") << ", def_id=" << def_id);

    SourceSpan source =
        def_id.is_local() ? cx.queries().span_with_body(def_id) : cx.queries().def_span(def_id);

    Item item;
    item.source = Span::from_host_span(source);
    item.name = std::move(name);
    item.attrs = std::move(attrs);
    item.visibility = Visibility::from_host(cx.queries().visibility(def_id));
    item.kind = std::move(kind);
    item.def_id = def_id;
    return item;
}

// ============================================================================
// Stability
// ============================================================================

auto Item::stability(const host::CompilerQueries& queries, const MaxDefIndexTable& table) const
    -> std::optional<host::Stability> {
    if (is_fake(table)) {
        return std::nullopt;
    }
    return queries.lookup_stability(def_id);
}

auto Item::const_stability(const host::CompilerQueries& queries,
                           const MaxDefIndexTable& table) const
    -> std::optional<host::ConstStability> {
    if (is_fake(table)) {
        return std::nullopt;
    }
    return queries.lookup_const_stability(def_id);
}

auto Item::deprecation(const host::CompilerQueries& queries, const MaxDefIndexTable& table) const
    -> std::optional<host::Deprecation> {
    if (is_fake(table)) {
        return std::nullopt;
    }
    return queries.lookup_deprecation(def_id);
}

auto Item::stability_class(const host::CompilerQueries& queries,
                           const MaxDefIndexTable& table) const -> std::optional<std::string> {
    auto stab = stability(queries, table);
    if (!stab) {
        return std::nullopt;
    }

    std::string classes;
    if (stab->level.is_unstable()) {
        classes = "unstable";
    }
    if (deprecation(queries, table)) {
        classes += classes.empty() ? "deprecated" : " deprecated";
    }
    if (classes.empty()) {
        return std::nullopt;
    }
    return classes;
}

auto Item::stable_since(const host::CompilerQueries& queries, const MaxDefIndexTable& table) const
    -> std::optional<std::string> {
    auto stab = stability(queries, table);
    if (!stab || !stab->level.is_stable()) {
        return std::nullopt;
    }
    return stab->level.since;
}

auto Item::const_stable_since(const host::CompilerQueries& queries,
                              const MaxDefIndexTable& table) const -> std::optional<std::string> {
    auto stab = const_stability(queries, table);
    if (!stab || !stab->level.is_stable()) {
        return std::nullopt;
    }
    return stab->level.since;
}

// ============================================================================
// Predicates
// ============================================================================

auto Item::is_crate() const -> bool {
    const ItemKind* k = &kind;
    if (const auto* stripped = kind.as<StrippedItem>()) {
        k = stripped->inner.get();
    }
    const auto* module = k ? k->as<Module>() : nullptr;
    return module && module->is_crate;
}

auto Item::is_stripped() const -> bool {
    if (kind.is<StrippedItem>()) {
        return true;
    }
    if (const auto* import = kind.as<Import>()) {
        return !import->should_be_displayed;
    }
    return false;
}

auto Item::has_stripped_fields() const -> std::optional<bool> {
    if (const auto* s = kind.as<Struct>()) {
        return s->fields_stripped;
    }
    if (const auto* u = kind.as<Union>()) {
        return u->fields_stripped;
    }
    if (const auto* v = kind.as<Variant>()) {
        if (const auto* vs = std::get_if<VariantStruct>(&v->kind)) {
            return vs->fields_stripped;
        }
    }
    return std::nullopt;
}

auto Item::is_non_exhaustive() const -> bool {
    return std::any_of(attrs.other_attrs.begin(), attrs.other_attrs.end(),
                       [](const host::Attribute& a) { return a.has_name("non_exhaustive"); });
}

auto Item::is_default() const -> bool {
    const auto* method = kind.as<MethodItem>();
    return method && method->defaultness && method->defaultness->has_value() &&
           !method->defaultness->is_final();
}

void Item::strip() {
    if (kind.is<StrippedItem>()) {
        return;
    }
    auto inner = std::make_shared<const ItemKind>(std::move(kind));
    kind = ItemKind{StrippedItem{std::move(inner)}};
}

// ============================================================================
// Debug Output
// ============================================================================

namespace {

auto visibility_string(const Visibility& vis) -> std::string {
    switch (vis.kind) {
    case Visibility::Kind::Public:
        return "Public";
    case Visibility::Kind::Inherited:
        return "Inherited";
    case Visibility::Kind::Restricted: {
        std::ostringstream ss;
        ss << "Restricted(" << vis.restricted_to << ")";
        return ss.str();
    }
    }
    return "Inherited";
}

} // namespace

auto debug_string(const Item& item, const MaxDefIndexTable& table) -> std::string {
    std::ostringstream ss;
    ss << "Item { source: ";
    if (item.source.is_dummy()) {
        ss << "<dummy>";
    } else {
        ss << item.source.filename() << ":" << item.source.lo().line << ":"
           << item.source.lo().column;
    }
    ss << ", name: " << (item.name ? "\"" + *item.name + "\"" : std::string("None"));
    ss << ", kind: " << item.type_();
    if (item.is_stripped()) {
        ss << " (stripped)";
    }
    ss << ", docs: " << item.attrs.doc_strings.size();
    ss << ", visibility: " << visibility_string(item.visibility);
    ss << ", def_id: ";
    if (item.is_fake(table)) {
        ss << "**FAKE**";
    } else {
        ss << item.def_id;
    }
    ss << " }";
    return ss.str();
}

} // namespace cleandoc::clean
