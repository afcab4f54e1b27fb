#include "host/attr.hpp"

namespace cleandoc::host {

// ============================================================================
// MetaItem
// ============================================================================

auto MetaItem::value_str() const -> std::optional<std::string> {
    if (kind == MetaItemKind::NameValue && value && value->is_str()) {
        return value->symbol;
    }
    return std::nullopt;
}

auto MetaItem::meta_item_list() const -> const std::vector<NestedMetaItem>* {
    return kind == MetaItemKind::List ? &items : nullptr;
}

// ============================================================================
// NestedMetaItem
// ============================================================================

auto NestedMetaItem::meta_item() const -> const MetaItem* {
    return std::get_if<MetaItem>(&node);
}

auto NestedMetaItem::literal() const -> const Lit* {
    return std::get_if<Lit>(&node);
}

auto NestedMetaItem::span() const -> const SourceSpan& {
    if (const auto* mi = meta_item()) {
        return mi->span;
    }
    return std::get<Lit>(node).span;
}

auto NestedMetaItem::has_name(std::string_view n) const -> bool {
    const auto* mi = meta_item();
    return mi && mi->has_name(n);
}

auto NestedMetaItem::is_word() const -> bool {
    const auto* mi = meta_item();
    return mi && mi->is_word();
}

auto NestedMetaItem::value_str() const -> std::optional<std::string> {
    const auto* mi = meta_item();
    return mi ? mi->value_str() : std::nullopt;
}

auto NestedMetaItem::meta_item_list() const -> const std::vector<NestedMetaItem>* {
    const auto* mi = meta_item();
    return mi ? mi->meta_item_list() : nullptr;
}

// ============================================================================
// Attribute
// ============================================================================

auto Attribute::doc_str() const -> std::optional<std::string> {
    if (const auto* comment = std::get_if<DocComment>(&kind)) {
        return comment->text;
    }
    const auto& mi = std::get<MetaItem>(kind);
    if (mi.has_name("doc")) {
        return mi.value_str();
    }
    return std::nullopt;
}

auto Attribute::has_name(std::string_view n) const -> bool {
    const auto* mi = meta();
    return mi && mi->has_name(n);
}

auto Attribute::meta() const -> const MetaItem* {
    return std::get_if<MetaItem>(&kind);
}

auto Attribute::meta_item_list() const -> const std::vector<NestedMetaItem>* {
    const auto* mi = meta();
    return mi ? mi->meta_item_list() : nullptr;
}

auto Attribute::value_str() const -> std::optional<std::string> {
    const auto* mi = meta();
    return mi ? mi->value_str() : std::nullopt;
}

// ============================================================================
// Builders
// ============================================================================

auto mk_str_lit(std::string value, SourceSpan span) -> Lit {
    return Lit{LitKind::Str, std::move(value), std::move(span)};
}

auto mk_word_item(std::string name, SourceSpan span) -> MetaItem {
    MetaItem mi;
    mi.name = std::move(name);
    mi.span = std::move(span);
    mi.kind = MetaItemKind::Word;
    return mi;
}

auto mk_name_value_item_str(std::string name, std::string value, SourceSpan span) -> MetaItem {
    auto lit = mk_str_lit(std::move(value), span);
    return mk_name_value_item(std::move(name), std::move(lit), std::move(span));
}

auto mk_name_value_item(std::string name, Lit value, SourceSpan span) -> MetaItem {
    MetaItem mi;
    mi.name = std::move(name);
    mi.span = std::move(span);
    mi.kind = MetaItemKind::NameValue;
    mi.value = std::move(value);
    return mi;
}

auto mk_list_item(std::string name, std::vector<NestedMetaItem> items, SourceSpan span)
    -> MetaItem {
    MetaItem mi;
    mi.name = std::move(name);
    mi.span = std::move(span);
    mi.kind = MetaItemKind::List;
    mi.items = std::move(items);
    return mi;
}

auto mk_nested(MetaItem item) -> NestedMetaItem {
    return NestedMetaItem{std::move(item)};
}

auto mk_nested_lit(Lit lit) -> NestedMetaItem {
    return NestedMetaItem{std::move(lit)};
}

auto mk_attr(AttrId id, AttrStyle style, MetaItem meta, SourceSpan span) -> Attribute {
    return Attribute{id, style, std::move(span), std::move(meta)};
}

auto mk_doc_comment(AttrId id, AttrStyle style, CommentKind kind, std::string text,
                    SourceSpan span) -> Attribute {
    return Attribute{id, style, std::move(span), DocComment{kind, std::move(text)}};
}

} // namespace cleandoc::host
