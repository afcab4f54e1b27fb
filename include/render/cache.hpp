//! # Render Location Cache
//!
//! The renderer's record of where each documented definition ends up. It is
//! filled by the renderer's crawl over the clean crate, and read by the link
//! resolver (`Attributes::links`) to turn definition ids into relative or
//! absolute URLs.
//!
//! ## URL Layout
//!
//! | Definition         | URL (relative to the crate root)         |
//! |--------------------|------------------------------------------|
//! | module `a::b`      | `a/b/index.html`                         |
//! | struct `a::Foo`    | `a/struct.Foo.html`                      |
//! | fn `a::b::bar`     | `a/b/fn.bar.html`                        |
//! | primitive `u8`     | `std/primitive.u8.html`                  |
//!
//! Local paths are prefixed with `../` once per level of the page being
//! rendered (`depth`); remote crates use their documented base URL.

#ifndef CLEANDOC_RENDER_CACHE_HPP
#define CLEANDOC_RENDER_CACHE_HPP

#include "clean/item_type.hpp"
#include "clean/primitive.hpp"
#include "common.hpp"
#include "host/def_id.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cleandoc::render {

/// Where the documentation of an external crate lives.
struct ExternalLocation {
    enum class Kind {
        Remote,  ///< Hosted at `url`
        Local,   ///< Rendered next to the current crate
        Unknown, ///< Not documented anywhere we know of
    };

    Kind kind = Kind::Unknown;

    /// Base URL of a remote crate, always ending in `/`.
    std::string url;

    [[nodiscard]] static auto remote(std::string url) -> ExternalLocation;

    [[nodiscard]] static auto local() -> ExternalLocation {
        return ExternalLocation{Kind::Local, {}};
    }

    [[nodiscard]] static auto unknown() -> ExternalLocation {
        return ExternalLocation{Kind::Unknown, {}};
    }
};

struct ExternCrateLocation {
    std::string name;
    std::string src;
    ExternalLocation location;
};

/// Fully-qualified path of a definition and the kind of page it renders to.
struct PathEntry {
    std::vector<std::string> fqp;
    clean::ItemType type;
};

struct Cache {
    /// Definitions of the local crate.
    std::unordered_map<host::DefId, PathEntry> paths;

    /// Paths of local definitions recorded while cleaning, before the crawl
    /// decides what gets a page.
    std::unordered_map<host::DefId, std::vector<std::string>> exact_paths;

    /// Definitions of other crates that the local crate refers to.
    std::unordered_map<host::DefId, PathEntry> external_paths;

    std::unordered_map<host::CrateNum, ExternCrateLocation> extern_locations;

    /// The definition that carries each primitive's documentation.
    std::unordered_map<clean::PrimitiveType, host::DefId> primitive_locations;

    /// External definitions reachable from outside their crate.
    std::unordered_set<host::DefId> public_items;

    bool document_private = false;
};

/// A resolved link target.
struct Href {
    std::string url;
    clean::ItemType type;
    std::vector<std::string> fqp;
};

/// Resolves `did` to a URL as seen from a page `depth` levels below the
/// documentation root. Returns nullopt for private external definitions
/// (unless documenting private items), for definitions missing from the
/// cache, and for crates whose documentation location is unknown.
[[nodiscard]] auto href(host::DefId did, const Cache& cache, size_t depth) -> std::optional<Href>;

/// `"../"` repeated `depth` times.
[[nodiscard]] auto root_path(size_t depth) -> std::string;

} // namespace cleandoc::render

#endif // CLEANDOC_RENDER_CACHE_HPP
