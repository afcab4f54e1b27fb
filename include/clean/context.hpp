//! # Doc Context
//!
//! State shared by one cleaning pass over a crate: the host compiler's
//! queries, the diagnostic sink, the fake-id threshold table, and the render
//! cache that cleaning fills with the paths of external definitions.

#ifndef CLEANDOC_CLEAN_CONTEXT_HPP
#define CLEANDOC_CLEAN_CONTEXT_HPP

#include "clean/fake_ids.hpp"
#include "clean/primitive.hpp"
#include "diag/diagnostic.hpp"
#include "host/def_id.hpp"
#include "host/queries.hpp"
#include "render/cache.hpp"

#include <unordered_map>
#include <unordered_set>

namespace cleandoc::clean {

class DocContext {
public:
    DocContext(const host::CompilerQueries& queries, diag::DiagnosticHandler& diag,
               MaxDefIndexTable& max_def_idx);

    [[nodiscard]] auto queries() const -> const host::CompilerQueries& {
        return queries_;
    }

    [[nodiscard]] auto diag() -> diag::DiagnosticHandler& {
        return diag_;
    }

    [[nodiscard]] auto max_def_idx() const -> const MaxDefIndexTable& {
        return max_def_idx_;
    }

    [[nodiscard]] auto cache() -> render::Cache& {
        return cache_;
    }

    [[nodiscard]] auto cache() const -> const render::Cache& {
        return cache_;
    }

    /// Hands out a fresh id for a synthesized item of `krate`.
    ///
    /// Ids start at the host's definition count for the crate and increase
    /// by one per call. The first call for a crate records that count as the
    /// crate's fake threshold.
    [[nodiscard]] auto next_def_id(host::CrateNum krate) -> host::DefId;

    /// True for ids handed out by `next_def_id`.
    [[nodiscard]] auto is_fake_def_id(host::DefId did) const -> bool {
        return all_fake_def_ids_.contains(did);
    }

    /// Records the fully-qualified path of `did` for link rendering. Macros
    /// are recorded as `crate::name`, as they live at the crate root.
    void record_extern_fqn(host::DefId did, TypeKind kind);

private:
    const host::CompilerQueries& queries_;
    diag::DiagnosticHandler& diag_;
    MaxDefIndexTable& max_def_idx_;
    render::Cache cache_;

    std::unordered_map<host::CrateNum, host::DefId> fake_def_ids_;
    std::unordered_set<host::DefId> all_fake_def_ids_;
};

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_CONTEXT_HPP
