//! # Configuration Predicates
//!
//! `Cfg` is the boolean expression tree behind `#[cfg(...)]` and
//! `#[doc(cfg(...))]`. Documentation uses it to say where an item is
//! available ("This is supported on Unix only").
//!
//! ## Algebra
//!
//! Predicates are combined with `&=`, `|=` and `!`. Combination folds
//! identities and annihilators (`True & x == x`, `False & x == False`),
//! flattens nested `All`/`Any` lists and never adds a duplicate operand, so
//! folding the same predicate twice is a no-op:
//!
//! ```cpp
//! Cfg cfg = Cfg::True();
//! cfg &= Cfg::name_only("unix");
//! cfg &= Cfg::name_value("target_feature", "avx2");
//! cfg &= Cfg::name_only("unix");
//! // cfg == all(unix, target_feature="avx2")
//! ```

#ifndef CLEANDOC_CLEAN_CFG_HPP
#define CLEANDOC_CLEAN_CFG_HPP

#include "common.hpp"
#include "host/attr.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cleandoc::clean {

/// Why a meta item could not be read as a predicate.
struct InvalidCfgError {
    std::string msg;
    SourceSpan span;
};

struct Cfg {
    enum class Kind {
        True,  ///< Always holds
        False, ///< Never holds
        Name,  ///< `name` or `name = "value"`
        Not,   ///< Negation of `sub[0]`
        All,   ///< Conjunction of `sub`
        Any,   ///< Disjunction of `sub`
    };

    Kind kind = Kind::True;
    std::string name;
    std::optional<std::string> value;
    std::vector<Cfg> sub;

    // ========================================================================
    // Constructors
    // ========================================================================

    [[nodiscard]] static auto True() -> Cfg;
    [[nodiscard]] static auto False() -> Cfg;
    [[nodiscard]] static auto name_only(std::string name) -> Cfg;
    [[nodiscard]] static auto name_value(std::string name, std::string value) -> Cfg;
    [[nodiscard]] static auto not_(Cfg inner) -> Cfg;
    [[nodiscard]] static auto all(std::vector<Cfg> sub) -> Cfg;
    [[nodiscard]] static auto any(std::vector<Cfg> sub) -> Cfg;

    /// Parses a meta item such as `unix`, `target_os = "linux"` or
    /// `all(unix, not(target_arch = "x86"))`.
    [[nodiscard]] static auto parse(const host::MetaItem& meta) -> Result<Cfg, InvalidCfgError>;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] auto is_true() const -> bool {
        return kind == Kind::True;
    }

    [[nodiscard]] auto is_false() const -> bool {
        return kind == Kind::False;
    }

    /// True for leaves and negations: values that render without parentheses.
    [[nodiscard]] auto is_simple() const -> bool;

    /// True for everything that binds at least as tightly as a conjunction:
    /// leaves, negations, `False` and `All`. Operands of a disjunction that
    /// fail this are parenthesized.
    [[nodiscard]] auto is_all() const -> bool;

    /// Evaluates the predicate; `is_set(name, value)` reports each leaf.
    [[nodiscard]] auto matches(
        const std::function<bool(const std::string&, const std::optional<std::string>&)>& is_set)
        const -> bool;

    // ========================================================================
    // Algebra
    // ========================================================================

    auto operator&=(Cfg other) -> Cfg&;
    auto operator|=(Cfg other) -> Cfg&;

    [[nodiscard]] auto operator&(Cfg other) const -> Cfg;
    [[nodiscard]] auto operator|(Cfg other) const -> Cfg;
    [[nodiscard]] auto operator!() const -> Cfg;

    [[nodiscard]] auto operator==(const Cfg& other) const -> bool;

    // ========================================================================
    // Rendering
    // ========================================================================

    /// Canonical attribute syntax: `all(unix, target_feature="avx2")`.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Short label for badges: "Unix", "`avx2`".
    [[nodiscard]] auto render_short_plain() const -> std::string;

    /// Sentence form: "This is supported on Unix only".
    [[nodiscard]] auto render_long_plain() const -> std::string;
};

[[nodiscard]] auto hash_value(const Cfg& cfg) -> size_t;

} // namespace cleandoc::clean

template <> struct std::hash<cleandoc::clean::Cfg> {
    auto operator()(const cleandoc::clean::Cfg& cfg) const noexcept -> size_t {
        return cleandoc::clean::hash_value(cfg);
    }
};

#endif // CLEANDOC_CLEAN_CFG_HPP
