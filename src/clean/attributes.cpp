//! # Attributes Implementation
//!
//! Folding an item's raw attributes into doc fragments, the merged
//! `doc(cfg)` predicate and intra-doc links, then flattening and link
//! rendering.

#include "clean/attributes.hpp"

#include "log/log.hpp"
#include "render/cache.hpp"

#include <algorithm>

namespace cleandoc::clean {

// ============================================================================
// Attribute List Helpers
// ============================================================================

auto lists(const std::vector<host::Attribute>& attrs, std::string_view name)
    -> std::vector<host::NestedMetaItem> {
    std::vector<host::NestedMetaItem> out;
    for (const auto& attr : attrs) {
        if (!attr.has_name(name)) {
            continue;
        }
        if (const auto* list = attr.meta_item_list()) {
            out.insert(out.end(), list->begin(), list->end());
        }
    }
    return out;
}

auto has_word(const std::vector<host::NestedMetaItem>& items, std::string_view word) -> bool {
    return std::any_of(items.begin(), items.end(), [word](const host::NestedMetaItem& item) {
        return item.is_word() && item.has_name(word);
    });
}

auto get_word_attr(const std::vector<host::NestedMetaItem>& items, std::string_view word)
    -> std::optional<host::NestedMetaItem> {
    for (const auto& item : items) {
        if (item.is_word() && item.has_name(word)) {
            return item;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Extraction
// ============================================================================

auto Attributes::extract_cfg(const host::MetaItem& meta) -> const host::MetaItem* {
    if (meta.kind != host::MetaItemKind::List || meta.items.size() != 1) {
        return nullptr;
    }
    const auto* cfg_item = meta.items[0].meta_item();
    if (!cfg_item || !cfg_item->has_name("cfg")) {
        return nullptr;
    }
    const auto* inner = cfg_item->meta_item_list();
    if (!inner || inner->size() != 1) {
        return nullptr;
    }
    return (*inner)[0].meta_item();
}

auto Attributes::extract_include(const host::MetaItem& meta)
    -> std::optional<std::pair<std::string, std::string>> {
    const auto* list = meta.meta_item_list();
    if (!list) {
        return std::nullopt;
    }
    for (const auto& entry : *list) {
        if (!entry.has_name("include")) {
            continue;
        }
        // `#[doc(include = "file")]` has been expanded to
        // `#[doc(include(file = "file", contents = "..."))]` by now.
        const auto* parts = entry.meta_item_list();
        if (!parts) {
            return std::nullopt;
        }
        std::optional<std::string> filename;
        std::optional<std::string> contents;
        for (const auto& part : *parts) {
            if (part.has_name("file")) {
                if (auto v = part.value_str()) {
                    filename = std::move(v);
                }
            } else if (part.has_name("contents")) {
                if (auto v = part.value_str()) {
                    contents = std::move(v);
                }
            }
        }
        if (filename && contents) {
            return std::make_pair(std::move(*filename), std::move(*contents));
        }
        CLEANDOC_LOG_TRACE("attrs", "dropping include without file or contents");
        return std::nullopt;
    }
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

namespace {

/// Running state of `from_ast`.
struct FragmentCollector {
    diag::DiagnosticHandler& diag;
    std::vector<DocFragment> doc_strings;
    std::vector<host::Attribute> other_attrs;
    std::optional<SourceSpan> span;
    Cfg cfg = Cfg::True();
    size_t doc_line = 0;

    void push(DocFragment frag) {
        update_need_backline(doc_strings, frag);
        doc_strings.push_back(std::move(frag));
    }

    void visit(const host::Attribute& attr, std::optional<host::DefId> parent_module) {
        if (auto value = attr.doc_str()) {
            CLEANDOC_LOG_TRACE("attrs", "got doc_str=\"" << *value << "\"");
            std::string doc = beautify_doc_string(*value);
            DocFragment frag;
            frag.line = doc_line;
            frag.span = attr.span;
            frag.parent_module = parent_module;
            frag.kind = attr.is_doc_comment() ? DocFragmentKind::sugared() : DocFragmentKind::raw();
            doc_line += split_lines(doc).size();
            frag.doc = std::move(doc);
            push(std::move(frag));
            if (!span) {
                span = attr.span;
            }
            return;
        }

        if (attr.has_name("doc")) {
            if (const auto* meta = attr.meta()) {
                visit_doc_list(attr, *meta, parent_module);
            }
        }
        other_attrs.push_back(attr);
    }

    void visit_doc_list(const host::Attribute& attr, const host::MetaItem& meta,
                        std::optional<host::DefId> parent_module) {
        if (const auto* cfg_meta = Attributes::extract_cfg(meta)) {
            auto parsed = Cfg::parse(*cfg_meta);
            if (is_ok(parsed)) {
                cfg &= std::move(unwrap(parsed));
            } else {
                const auto& err = unwrap_err(parsed);
                diag.span_err(err.span, err.msg, diag::ErrorCodes::INVALID_CFG);
            }
            return;
        }

        if (auto include = Attributes::extract_include(meta)) {
            DocFragment frag;
            frag.line = doc_line;
            frag.span = attr.span;
            frag.parent_module = parent_module;
            frag.kind = DocFragmentKind::include(std::move(include->first));
            doc_line += split_lines(include->second).size();
            frag.doc = std::move(include->second);
            push(std::move(frag));
        }
    }
};

} // namespace

auto Attributes::from_ast(diag::DiagnosticHandler& diag, const std::vector<host::Attribute>& attrs,
                          std::optional<ReexportAttrs> additional) -> Attributes {
    FragmentCollector collector{diag, {}, {}, std::nullopt, Cfg::True(), 0};

    // Docs added on a re-export come before the original docs
    if (additional && additional->attrs) {
        for (const auto& attr : *additional->attrs) {
            collector.visit(attr, additional->parent_module);
        }
    }
    for (const auto& attr : attrs) {
        collector.visit(attr, std::nullopt);
    }

    // `#[target_feature(enable = "feat")]` also gates the docs, as if it
    // were `#[doc(cfg(target_feature = "feat"))]`
    for (const auto& item : clean::lists(attrs, "target_feature")) {
        if (!item.has_name("enable")) {
            continue;
        }
        if (auto feat = item.value_str()) {
            auto parsed = Cfg::parse(host::mk_name_value_item_str("target_feature", *feat));
            if (is_ok(parsed)) {
                collector.cfg &= std::move(unwrap(parsed));
            }
        }
    }

    unindent_fragments(collector.doc_strings);

    Attributes out;
    out.doc_strings = std::move(collector.doc_strings);
    out.other_attrs = std::move(collector.other_attrs);
    if (!collector.cfg.is_true()) {
        out.cfg = std::make_shared<const Cfg>(std::move(collector.cfg));
    }
    out.span = std::move(collector.span);

    auto first_doc = std::find_if(attrs.begin(), attrs.end(), [](const host::Attribute& a) {
        return a.doc_str().has_value();
    });
    out.inner_docs = first_doc == attrs.end() || first_doc->style == host::AttrStyle::Inner;

    CLEANDOC_LOG_DEBUG("attrs", "collected " << out.doc_strings.size() << " doc fragments, "
                                             << out.other_attrs.size() << " other attributes");
    return out;
}

// ============================================================================
// Queries
// ============================================================================

auto Attributes::has_doc_flag(std::string_view flag) const -> bool {
    for (const auto& attr : other_attrs) {
        if (!attr.has_name("doc")) {
            continue;
        }
        if (const auto* items = attr.meta_item_list()) {
            for (const auto& item : *items) {
                const auto* meta = item.meta_item();
                if (meta && meta->has_name(flag)) {
                    return true;
                }
            }
        }
    }
    return false;
}

auto Attributes::doc_value() const -> std::optional<std::string> {
    if (doc_strings.empty()) {
        return std::nullopt;
    }
    const DocFragment& first = doc_strings.front();
    const DocFragment* last = &first;
    std::string out;
    add_doc_fragment(out, first);
    for (size_t i = 1; i < doc_strings.size(); ++i) {
        const DocFragment& frag = doc_strings[i];
        if (first.kind.is_include() || frag.kind != first.kind ||
            frag.parent_module != first.parent_module) {
            break;
        }
        add_doc_fragment(out, frag);
        last = &frag;
    }
    // The separator belongs to the block boundary, not to this block
    if (last->need_backline && !out.empty() && out.back() == '\n') {
        out.pop_back();
    }
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

auto Attributes::collapsed_doc_value() const -> std::optional<std::string> {
    if (doc_strings.empty()) {
        return std::nullopt;
    }
    return collapse_fragments(doc_strings);
}

auto Attributes::collapsed_doc_value_by_module_level() const
    -> std::unordered_map<std::optional<host::DefId>, std::string> {
    std::unordered_map<std::optional<host::DefId>, std::string> out;
    for (const auto& frag : doc_strings) {
        add_doc_fragment(out[frag.parent_module], frag);
    }
    return out;
}

auto Attributes::get_doc_aliases() const -> std::unordered_set<std::string> {
    std::unordered_set<std::string> aliases;
    for (const auto& item : lists("doc")) {
        if (!item.has_name("alias")) {
            continue;
        }
        if (auto value = item.value_str()) {
            if (!value->empty()) {
                aliases.insert(std::move(*value));
            }
        } else if (const auto* list = item.meta_item_list()) {
            for (const auto& entry : *list) {
                const auto* lit = entry.literal();
                if (lit && lit->is_str() && !lit->symbol.empty()) {
                    aliases.insert(lit->symbol);
                }
            }
        }
    }
    return aliases;
}

// ============================================================================
// Link Rendering
// ============================================================================

namespace {

/// Documentation root for a primitive link in crate `krate`.
auto primitive_root(host::CrateNum krate, const render::Cache& cache, size_t depth)
    -> std::string {
    auto loc = cache.extern_locations.find(krate);
    if (loc != cache.extern_locations.end()) {
        switch (loc->second.location.kind) {
        case render::ExternalLocation::Kind::Local:
            return render::root_path(depth);
        case render::ExternalLocation::Kind::Remote:
            return loc->second.location.url;
        case render::ExternalLocation::Kind::Unknown:
            break;
        }
    }
    // The crate name is left out so primitive links agree across crates
    return DocOptions::nightly_build ? DocOptions::primitive_docs_nightly_root
                                     : DocOptions::primitive_docs_root;
}

} // namespace

auto Attributes::links(host::CrateNum krate, const render::Cache& cache, size_t depth) const
    -> std::vector<RenderedLink> {
    std::vector<RenderedLink> out;
    out.reserve(item_links.size());

    for (const auto& link : item_links) {
        if (link.did) {
            auto target = render::href(*link.did, cache, depth);
            if (!target) {
                CLEANDOC_LOG_TRACE("links", "dropping unresolved link `" << link.link << "`");
                continue;
            }
            std::string url = std::move(target->url);
            if (link.fragment) {
                url += '#';
                url += *link.fragment;
            }
            out.push_back(RenderedLink{link.link, link.link_text, std::move(url)});
            continue;
        }

        if (!link.fragment) {
            throw InvariantError("link `" + link.link + "` has neither a target nor a primitive");
        }

        // A primitive: the page is named by hand
        const std::string& fragment = *link.fragment;
        size_t tail = std::min(fragment.find('#'), fragment.size());
        std::string url = primitive_root(krate, cache, depth);
        if (!url.empty() && url.back() != '/') {
            url += '/';
        }
        url += "std/primitive.";
        url += fragment.substr(0, tail);
        url += ".html";
        url += fragment.substr(tail);
        out.push_back(RenderedLink{link.link, link.link_text, std::move(url)});
    }
    return out;
}

// ============================================================================
// Identity
// ============================================================================

auto Attributes::operator==(const Attributes& other) const -> bool {
    bool same_cfg = (!cfg && !other.cfg) || (cfg && other.cfg && *cfg == *other.cfg);
    return doc_strings == other.doc_strings && same_cfg && span == other.span &&
           item_links == other.item_links &&
           std::equal(other_attrs.begin(), other_attrs.end(), other.other_attrs.begin(),
                      other.other_attrs.end(),
                      [](const host::Attribute& a, const host::Attribute& b) { return a.id == b.id; });
}

auto hash_value(const Attributes& attrs) -> size_t {
    size_t seed = 0;
    for (const auto& frag : attrs.doc_strings) {
        seed = hash_combine(seed, hash_value(frag));
    }
    seed = hash_combine(seed, attrs.cfg ? hash_value(*attrs.cfg) : 0);
    seed = hash_combine(seed, attrs.span ? hash_value(*attrs.span) : 0);
    for (const auto& link : attrs.item_links) {
        seed = hash_combine(seed, std::hash<std::string>{}(link.link));
        seed = hash_combine(seed, std::hash<std::string>{}(link.link_text));
        seed = hash_combine(seed, link.did ? host::hash_value(*link.did) : 0);
        seed = hash_combine(seed, link.fragment ? std::hash<std::string>{}(*link.fragment) : 0);
    }
    for (const auto& attr : attrs.other_attrs) {
        seed = hash_combine(seed, std::hash<host::AttrId>{}(attr.id));
    }
    return seed;
}

} // namespace cleandoc::clean
