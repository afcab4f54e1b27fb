//! # Definition Identifiers
//!
//! Stable, comparable handles for compiler definitions. A `DefId` pairs the
//! crate that owns a definition with the definition's index inside that
//! crate. Identifiers are plain values: they never borrow from the compiler.

#ifndef CLEANDOC_HOST_DEF_ID_HPP
#define CLEANDOC_HOST_DEF_ID_HPP

#include "common.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>

namespace cleandoc::host {

/// Identifies one crate (compilation unit) in the current session.
using CrateNum = uint32_t;

/// Index of a definition inside its crate.
using DefIndex = uint32_t;

/// The crate being documented.
constexpr CrateNum LOCAL_CRATE = 0;

/// The index of a crate's root module.
constexpr DefIndex CRATE_DEF_INDEX = 0;

/// A definition anywhere in the crate graph.
struct DefId {
    CrateNum krate = LOCAL_CRATE;
    DefIndex index = CRATE_DEF_INDEX;

    [[nodiscard]] auto is_local() const -> bool {
        return krate == LOCAL_CRATE;
    }

    [[nodiscard]] auto is_top_level_module() const -> bool {
        return index == CRATE_DEF_INDEX;
    }

    [[nodiscard]] auto operator==(const DefId& other) const -> bool = default;
    [[nodiscard]] auto operator<=>(const DefId& other) const = default;
};

inline auto operator<<(std::ostream& os, const DefId& did) -> std::ostream& {
    return os << "DefId(" << did.krate << ":" << did.index << ")";
}

/// Hashes a definition identifier.
[[nodiscard]] inline auto hash_value(const DefId& did) -> size_t {
    return hash_combine(std::hash<CrateNum>{}(did.krate), std::hash<DefIndex>{}(did.index));
}

} // namespace cleandoc::host

template <> struct std::hash<cleandoc::host::DefId> {
    auto operator()(const cleandoc::host::DefId& did) const noexcept -> size_t {
        return cleandoc::host::hash_value(did);
    }
};

#endif // CLEANDOC_HOST_DEF_ID_HPP
