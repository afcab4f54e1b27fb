//! # Compiler Queries
//!
//! The read-only interface the clean model uses to ask the host compiler about
//! definitions: attributes, spans, visibility, stability and the lang-item
//! registry. The embedding compiler implements `CompilerQueries`; tests use an
//! in-memory implementation.
//!
//! ## Stability Tables
//!
//! | Query                    | Answers                                   |
//! |--------------------------|-------------------------------------------|
//! | `lookup_stability`       | `#[stable]` / `#[unstable]` of an item    |
//! | `lookup_const_stability` | `#[rustc_const_stable]` and friends       |
//! | `lookup_deprecation`     | `#[deprecated]`                           |

#ifndef CLEANDOC_HOST_QUERIES_HPP
#define CLEANDOC_HOST_QUERIES_HPP

#include "common.hpp"
#include "host/attr.hpp"
#include "host/def_id.hpp"
#include "host/tags.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cleandoc::host {

// ============================================================================
// Stability
// ============================================================================

/// The stability level of an API.
struct StabilityLevel {
    enum class Kind { Unstable, Stable };

    Kind kind = Kind::Unstable;
    std::optional<std::string> reason; ///< Unstable only.
    std::optional<uint32_t> issue;     ///< Unstable only.
    std::string since;                 ///< Stable only.

    [[nodiscard]] static auto stable(std::string since) -> StabilityLevel {
        return StabilityLevel{Kind::Stable, std::nullopt, std::nullopt, std::move(since)};
    }

    [[nodiscard]] static auto unstable(std::optional<std::string> reason = std::nullopt,
                                       std::optional<uint32_t> issue = std::nullopt)
        -> StabilityLevel {
        return StabilityLevel{Kind::Unstable, std::move(reason), issue, {}};
    }

    [[nodiscard]] auto is_unstable() const -> bool {
        return kind == Kind::Unstable;
    }

    [[nodiscard]] auto is_stable() const -> bool {
        return kind == Kind::Stable;
    }
};

struct Stability {
    StabilityLevel level;
    std::string feature;
};

struct ConstStability {
    StabilityLevel level;
    std::string feature;
    bool promotable = false;
};

struct Deprecation {
    std::optional<std::string> since;
    std::optional<std::string> note;
    std::optional<std::string> suggestion;
};

// ============================================================================
// Visibility
// ============================================================================

/// Visibility as the host's privacy checker reports it.
struct HostVisibility {
    enum class Kind {
        Public,     ///< `pub`
        Restricted, ///< `pub(in path)`, `pub(crate)`, private
        Invisible,  ///< Not visible anywhere (e.g. a stripped import)
    };

    Kind kind = Kind::Public;

    /// The module the item is restricted to.
    DefId restricted_to;

    [[nodiscard]] static auto public_() -> HostVisibility {
        return HostVisibility{Kind::Public, {}};
    }

    [[nodiscard]] static auto restricted(DefId module) -> HostVisibility {
        return HostVisibility{Kind::Restricted, module};
    }

    [[nodiscard]] static auto invisible() -> HostVisibility {
        return HostVisibility{Kind::Invisible, {}};
    }
};

// ============================================================================
// Lang Items
// ============================================================================

/// The language items the documentation model needs to know about.
enum class LangItem {
    Sized,
    BoolImpl,
    CharImpl,
    StrImpl,
    StrAllocImpl,
    ArrayImpl,
    SliceImpl,
    SliceU8Impl,
    SliceAllocImpl,
    SliceU8AllocImpl,
    ConstPtrImpl,
    MutPtrImpl,
    ConstSlicePtrImpl,
    MutSlicePtrImpl,
    I8Impl,
    I16Impl,
    I32Impl,
    I64Impl,
    I128Impl,
    IsizeImpl,
    U8Impl,
    U16Impl,
    U32Impl,
    U64Impl,
    U128Impl,
    UsizeImpl,
    F32Impl,
    F64Impl,
    F32RuntimeImpl,
    F64RuntimeImpl,
};

[[nodiscard]] auto lang_item_name(LangItem item) -> const char*;

/// Registry of the lang items defined in the crate graph.
class LangItems {
public:
    void set(LangItem item, DefId did) {
        items_[item] = did;
    }

    [[nodiscard]] auto get(LangItem item) const -> std::optional<DefId> {
        auto it = items_.find(item);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto sized_trait() const -> std::optional<DefId> {
        return get(LangItem::Sized);
    }

    /// Like `get`, but a missing item is a broken invariant.
    [[nodiscard]] auto require(LangItem item) const -> DefId;

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

private:
    std::unordered_map<LangItem, DefId> items_;
};

// ============================================================================
// Query Interface
// ============================================================================

/// Read-only view of the host compiler.
class CompilerQueries {
public:
    virtual ~CompilerQueries() = default;

    virtual auto lookup_stability(DefId did) const -> std::optional<Stability> = 0;

    virtual auto lookup_const_stability(DefId did) const -> std::optional<ConstStability> = 0;

    virtual auto lookup_deprecation(DefId did) const -> std::optional<Deprecation> = 0;

    /// Attributes attached to a definition, in declaration order.
    virtual auto get_attrs(DefId did) const -> std::vector<Attribute> = 0;

    /// The definition-only span (the signature line).
    virtual auto def_span(DefId did) const -> SourceSpan = 0;

    /// The full span of a local item, including its body.
    virtual auto span_with_body(DefId did) const -> SourceSpan = 0;

    virtual auto visibility(DefId did) const -> HostVisibility = 0;

    virtual auto lang_items() const -> const LangItems& = 0;

    virtual auto item_name(DefId did) const -> std::string = 0;

    /// Path components of a definition, without the crate name.
    virtual auto def_path(DefId did) const -> std::vector<std::string> = 0;

    virtual auto crate_name(CrateNum krate) const -> std::string = 0;

    /// One past the highest definition index the host assigned in `krate`.
    virtual auto def_index_limit(CrateNum krate) const -> DefIndex = 0;
};

} // namespace cleandoc::host

#endif // CLEANDOC_HOST_QUERIES_HPP
