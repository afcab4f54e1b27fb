#include "clean/context.hpp"

#include "clean/item_type.hpp"
#include "log/log.hpp"

#include <iterator>

namespace cleandoc::clean {

DocContext::DocContext(const host::CompilerQueries& queries, diag::DiagnosticHandler& diag,
                       MaxDefIndexTable& max_def_idx)
    : queries_(queries), diag_(diag), max_def_idx_(max_def_idx) {
    cache_.document_private = DocOptions::document_private;
}

auto DocContext::next_def_id(host::CrateNum krate) -> host::DefId {
    host::DefId start{krate, queries_.def_index_limit(krate)};

    auto [it, inserted] = fake_def_ids_.try_emplace(krate, start);
    host::DefId did = it->second;
    it->second = host::DefId{krate, did.index + 1};

    if (inserted) {
        max_def_idx_.record(krate, start.index);
    }
    all_fake_def_ids_.insert(did);

    CLEANDOC_LOG_TRACE("clean", "allocated fake id " << did);
    return did;
}

void DocContext::record_extern_fqn(host::DefId did, TypeKind kind) {
    std::vector<std::string> fqn;
    fqn.push_back(queries_.crate_name(did.krate));

    std::vector<std::string> relative;
    for (auto& elem : queries_.def_path(did)) {
        if (!elem.empty()) {
            relative.push_back(std::move(elem));
        }
    }

    if (kind == TypeKind::Macro) {
        if (relative.empty()) {
            throw InvariantError("macro definition has an empty path");
        }
        fqn.push_back(std::move(relative.back()));
    } else {
        fqn.insert(fqn.end(), std::make_move_iterator(relative.begin()),
                   std::make_move_iterator(relative.end()));
    }

    if (did.is_local()) {
        cache_.exact_paths[did] = std::move(fqn);
    } else {
        cache_.external_paths[did] = render::PathEntry{std::move(fqn), item_type_from_type_kind(kind)};
    }
}

} // namespace cleandoc::clean
