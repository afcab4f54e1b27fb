#include "clean/fake_ids.hpp"

#include "log/log.hpp"

namespace cleandoc::clean {

void MaxDefIndexTable::record(host::CrateNum krate, host::DefIndex index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = max_.try_emplace(krate, index);
    if (!inserted && it->second < index) {
        it->second = index;
    }
    CLEANDOC_LOG_TRACE("clean", "fake threshold for crate " << krate << " is " << it->second);
}

auto MaxDefIndexTable::get(host::CrateNum krate) const -> std::optional<host::DefIndex> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = max_.find(krate);
    if (it == max_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto MaxDefIndexTable::is_fake(host::DefId did) const -> bool {
    auto threshold = get(did.krate);
    return threshold.has_value() && *threshold <= did.index;
}

void MaxDefIndexTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    max_.clear();
}

} // namespace cleandoc::clean
