#include "render/cache.hpp"

#include "log/log.hpp"

namespace cleandoc::render {

auto ExternalLocation::remote(std::string url) -> ExternalLocation {
    if (url.empty() || url.back() != '/') {
        url += '/';
    }
    return ExternalLocation{Kind::Remote, std::move(url)};
}

auto root_path(size_t depth) -> std::string {
    std::string out;
    out.reserve(depth * 3);
    for (size_t i = 0; i < depth; ++i) {
        out += "../";
    }
    return out;
}

auto href(host::DefId did, const Cache& cache, size_t depth) -> std::optional<Href> {
    if (!did.is_local() && !cache.document_private && !cache.public_items.contains(did)) {
        CLEANDOC_LOG_TRACE("links", "no href for private external " << did);
        return std::nullopt;
    }

    const PathEntry* entry = nullptr;
    std::string url;

    if (auto it = cache.paths.find(did); it != cache.paths.end()) {
        entry = &it->second;
        url = root_path(depth);
    } else {
        auto ext = cache.external_paths.find(did);
        if (ext == cache.external_paths.end()) {
            CLEANDOC_LOG_TRACE("links", "no cached path for " << did);
            return std::nullopt;
        }
        entry = &ext->second;

        auto loc = cache.extern_locations.find(did.krate);
        if (loc == cache.extern_locations.end()) {
            throw InvariantError("no extern location recorded for crate " +
                                 std::to_string(did.krate));
        }
        switch (loc->second.location.kind) {
        case ExternalLocation::Kind::Remote:
            url = loc->second.location.url;
            break;
        case ExternalLocation::Kind::Local:
            url = root_path(depth);
            break;
        case ExternalLocation::Kind::Unknown:
            return std::nullopt;
        }
    }

    const auto& fqp = entry->fqp;
    if (fqp.empty()) {
        throw InvariantError("empty path recorded for definition");
    }

    for (size_t i = 0; i + 1 < fqp.size(); ++i) {
        url += fqp[i];
        url += '/';
    }
    if (entry->type == clean::ItemType::Module) {
        url += fqp.back();
        url += "/index.html";
    } else {
        url += clean::item_type_as_str(entry->type);
        url += '.';
        url += fqp.back();
        url += ".html";
    }

    return Href{std::move(url), entry->type, fqp};
}

} // namespace cleandoc::render
