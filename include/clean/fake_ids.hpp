//! # Fake Definition Ids
//!
//! Items synthesized during cleaning (auto-trait and blanket impls, for
//! instance) have no real definition in the compiler. They get ids past the
//! end of their crate's definition table, and `MaxDefIndexTable` remembers
//! where that end is so that such "fake" ids can be recognized later.
//!
//! ```text
//! crate 1:  0 ........ 41 | 42  43  44 ...
//!           real defs     | fake ids (threshold = 42)
//! ```
//!
//! Fake items have no stability or deprecation entries, so those lookups
//! are skipped for them.

#ifndef CLEANDOC_CLEAN_FAKE_IDS_HPP
#define CLEANDOC_CLEAN_FAKE_IDS_HPP

#include "host/def_id.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace cleandoc::clean {

/// Per-crate fake id threshold. Thresholds are only ever raised.
///
/// Thread-safe; crates may be cleaned from several threads sharing one table.
class MaxDefIndexTable {
public:
    MaxDefIndexTable() = default;

    MaxDefIndexTable(const MaxDefIndexTable&) = delete;
    auto operator=(const MaxDefIndexTable&) -> MaxDefIndexTable& = delete;

    /// Records `index` as the first fake index of `krate`, unless a higher
    /// threshold is already recorded.
    void record(host::CrateNum krate, host::DefIndex index);

    [[nodiscard]] auto get(host::CrateNum krate) const -> std::optional<host::DefIndex>;

    /// True when `did` is at or past its crate's threshold. Crates without a
    /// threshold have no fake ids.
    [[nodiscard]] auto is_fake(host::DefId did) const -> bool;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<host::CrateNum, host::DefIndex> max_;
};

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_FAKE_IDS_HPP
