//! # Configuration Predicates Implementation
//!
//! Parsing, simplifying combination and the human-readable rendering of
//! `Cfg` trees.

#include "clean/cfg.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace cleandoc::clean {

// ============================================================================
// Constructors
// ============================================================================

auto Cfg::True() -> Cfg {
    return Cfg{Kind::True, {}, std::nullopt, {}};
}

auto Cfg::False() -> Cfg {
    return Cfg{Kind::False, {}, std::nullopt, {}};
}

auto Cfg::name_only(std::string name) -> Cfg {
    return Cfg{Kind::Name, std::move(name), std::nullopt, {}};
}

auto Cfg::name_value(std::string name, std::string value) -> Cfg {
    return Cfg{Kind::Name, std::move(name), std::move(value), {}};
}

auto Cfg::not_(Cfg inner) -> Cfg {
    std::vector<Cfg> sub;
    sub.push_back(std::move(inner));
    return Cfg{Kind::Not, {}, std::nullopt, std::move(sub)};
}

auto Cfg::all(std::vector<Cfg> sub) -> Cfg {
    return Cfg{Kind::All, {}, std::nullopt, std::move(sub)};
}

auto Cfg::any(std::vector<Cfg> sub) -> Cfg {
    return Cfg{Kind::Any, {}, std::nullopt, std::move(sub)};
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

auto parse_nested(const host::NestedMetaItem& nested) -> Result<Cfg, InvalidCfgError> {
    if (const auto* mi = nested.meta_item()) {
        return Cfg::parse(*mi);
    }
    return InvalidCfgError{"unexpected literal", nested.span()};
}

} // namespace

auto Cfg::parse(const host::MetaItem& meta) -> Result<Cfg, InvalidCfgError> {
    if (meta.name.empty()) {
        return InvalidCfgError{"expected a single identifier", meta.span};
    }

    switch (meta.kind) {
    case host::MetaItemKind::Word:
        return name_only(meta.name);

    case host::MetaItemKind::NameValue: {
        if (meta.value && meta.value->is_str()) {
            return name_value(meta.name, meta.value->symbol);
        }
        const SourceSpan& span = meta.value ? meta.value->span : meta.span;
        return InvalidCfgError{"value of cfg option should be a string literal", span};
    }

    case host::MetaItemKind::List:
        break;
    }

    if (meta.name == "all" || meta.name == "any") {
        bool is_all = meta.name == "all";
        Cfg acc = is_all ? True() : False();
        for (const auto& item : meta.items) {
            auto sub = parse_nested(item);
            if (is_err(sub)) {
                return unwrap_err(sub);
            }
            if (is_all) {
                acc &= std::move(unwrap(sub));
            } else {
                acc |= std::move(unwrap(sub));
            }
        }
        return acc;
    }

    if (meta.name == "not") {
        if (meta.items.size() != 1) {
            return InvalidCfgError{"expected 1 cfg-pattern", meta.span};
        }
        auto sub = parse_nested(meta.items[0]);
        if (is_err(sub)) {
            return unwrap_err(sub);
        }
        return !unwrap(sub);
    }

    return InvalidCfgError{"invalid predicate `" + meta.name + "`", meta.span};
}

// ============================================================================
// Queries
// ============================================================================

auto Cfg::is_simple() const -> bool {
    switch (kind) {
    case Kind::True:
    case Kind::False:
    case Kind::Name:
    case Kind::Not:
        return true;
    case Kind::All:
    case Kind::Any:
        return false;
    }
    return false;
}

auto Cfg::is_all() const -> bool {
    switch (kind) {
    case Kind::False:
    case Kind::Name:
    case Kind::Not:
    case Kind::All:
        return true;
    case Kind::True:
    case Kind::Any:
        return false;
    }
    return false;
}

auto Cfg::matches(
    const std::function<bool(const std::string&, const std::optional<std::string>&)>& is_set)
    const -> bool {
    switch (kind) {
    case Kind::True:
        return true;
    case Kind::False:
        return false;
    case Kind::Name:
        return is_set(name, value);
    case Kind::Not:
        return !sub[0].matches(is_set);
    case Kind::All:
        return std::all_of(sub.begin(), sub.end(),
                           [&](const Cfg& c) { return c.matches(is_set); });
    case Kind::Any:
        return std::any_of(sub.begin(), sub.end(),
                           [&](const Cfg& c) { return c.matches(is_set); });
    }
    return false;
}

// ============================================================================
// Algebra
// ============================================================================

namespace {

void push_unique(std::vector<Cfg>& list, Cfg cfg) {
    if (std::find(list.begin(), list.end(), cfg) == list.end()) {
        list.push_back(std::move(cfg));
    }
}

/// Shared shape of `&=` and `|=`. `unit` is the identity of the operator
/// (True for AND), `zero` its annihilator and `list` the flattening kind.
void combine(Cfg& self, Cfg other, Cfg::Kind unit, Cfg::Kind zero, Cfg::Kind list) {
    if (self.kind == zero || other.kind == unit) {
        return;
    }
    if (other.kind == zero) {
        self = std::move(other);
        return;
    }
    if (self.kind == unit) {
        self = std::move(other);
        return;
    }
    if (self.kind == list && other.kind == list) {
        for (auto& c : other.sub) {
            push_unique(self.sub, std::move(c));
        }
        return;
    }
    if (self.kind == list) {
        push_unique(self.sub, std::move(other));
        return;
    }
    if (other.kind == list) {
        push_unique(other.sub, std::move(self));
        self = std::move(other);
        return;
    }
    if (self != other) {
        std::vector<Cfg> pair;
        pair.push_back(std::move(self));
        pair.push_back(std::move(other));
        self = Cfg{list, {}, std::nullopt, std::move(pair)};
    }
}

} // namespace

auto Cfg::operator&=(Cfg other) -> Cfg& {
    combine(*this, std::move(other), Kind::True, Kind::False, Kind::All);
    return *this;
}

auto Cfg::operator|=(Cfg other) -> Cfg& {
    combine(*this, std::move(other), Kind::False, Kind::True, Kind::Any);
    return *this;
}

auto Cfg::operator&(Cfg other) const -> Cfg {
    Cfg result = *this;
    result &= std::move(other);
    return result;
}

auto Cfg::operator|(Cfg other) const -> Cfg {
    Cfg result = *this;
    result |= std::move(other);
    return result;
}

auto Cfg::operator!() const -> Cfg {
    switch (kind) {
    case Kind::True:
        return False();
    case Kind::False:
        return True();
    case Kind::Not:
        return sub[0];
    default:
        return not_(*this);
    }
}

auto Cfg::operator==(const Cfg& other) const -> bool {
    return kind == other.kind && name == other.name && value == other.value && sub == other.sub;
}

auto hash_value(const Cfg& cfg) -> size_t {
    size_t seed = std::hash<int>{}(static_cast<int>(cfg.kind));
    seed = hash_combine(seed, std::hash<std::string>{}(cfg.name));
    if (cfg.value) {
        seed = hash_combine(seed, std::hash<std::string>{}(*cfg.value));
    }
    for (const auto& c : cfg.sub) {
        seed = hash_combine(seed, hash_value(c));
    }
    return seed;
}

// ============================================================================
// Rendering
// ============================================================================

auto Cfg::to_string() const -> std::string {
    auto join = [](const char* head, const std::vector<Cfg>& list) {
        std::string out = head;
        out += "(";
        for (size_t i = 0; i < list.size(); ++i) {
            if (i != 0) {
                out += ", ";
            }
            out += list[i].to_string();
        }
        out += ")";
        return out;
    };

    switch (kind) {
    case Kind::True:
        return "all()";
    case Kind::False:
        return "any()";
    case Kind::Name:
        return value ? name + "=\"" + *value + "\"" : name;
    case Kind::Not:
        return "not(" + sub[0].to_string() + ")";
    case Kind::All:
        return join("all", sub);
    case Kind::Any:
        return join("any", sub);
    }
    return {};
}

namespace {

enum class Format { ShortPlain, LongPlain };

auto human_readable(const std::string& name, const std::optional<std::string>& value)
    -> std::string {
    if (!value) {
        if (name == "unix")
            return "Unix";
        if (name == "windows")
            return "Windows";
        if (name == "debug_assertions")
            return "debug-assertions enabled";
        return {};
    }

    const std::string& v = *value;
    if (name == "target_os") {
        static const std::pair<const char*, const char*> os_names[] = {
            {"android", "Android"},     {"dragonfly", "DragonFly BSD"},
            {"emscripten", "Emscripten"}, {"freebsd", "FreeBSD"},
            {"fuchsia", "Fuchsia"},     {"haiku", "Haiku"},
            {"hermit", "HermitCore"},   {"illumos", "illumos"},
            {"ios", "iOS"},             {"l4re", "L4Re"},
            {"linux", "Linux"},         {"macos", "macOS"},
            {"netbsd", "NetBSD"},       {"openbsd", "OpenBSD"},
            {"redox", "Redox"},         {"solaris", "Solaris"},
            {"windows", "Windows"},
        };
        for (const auto& [key, label] : os_names) {
            if (v == key)
                return label;
        }
    } else if (name == "target_arch") {
        static const std::pair<const char*, const char*> arch_names[] = {
            {"aarch64", "AArch64"},   {"arm", "ARM"},           {"asmjs", "JavaScript"},
            {"mips", "MIPS"},         {"mips64", "MIPS-64"},    {"msp430", "MSP430"},
            {"powerpc", "PowerPC"},   {"powerpc64", "PowerPC-64"}, {"s390x", "s390x"},
            {"sparc64", "SPARC64"},   {"wasm32", "WebAssembly"}, {"wasm64", "WebAssembly"},
            {"x86", "x86"},           {"x86_64", "x86-64"},
        };
        for (const auto& [key, label] : arch_names) {
            if (v == key)
                return label;
        }
    } else if (name == "target_vendor") {
        if (v == "apple")
            return "Apple";
        if (v == "pc")
            return "PC";
        if (v == "rumprun")
            return "Rumprun";
        if (v == "sun")
            return "Sun";
        if (v == "fortanix")
            return "Fortanix";
    } else if (name == "target_env") {
        if (v == "gnu")
            return "GNU";
        if (v == "msvc")
            return "MSVC";
        if (v == "musl")
            return "musl";
        if (v == "newlib")
            return "Newlib";
        if (v == "uclibc")
            return "uClibc";
        if (v == "sgx")
            return "SGX";
    }
    return {};
}

void render(std::ostringstream& out, const Cfg& cfg, Format fmt);

void render_with_opt_paren(std::ostringstream& out, const Cfg& cfg, bool paren, Format fmt) {
    if (paren) {
        out << "(";
    }
    render(out, cfg, fmt);
    if (paren) {
        out << ")";
    }
}

auto all_leaves_named(const std::vector<Cfg>& list, const char* name) -> bool {
    return std::all_of(list.begin(), list.end(), [&](const Cfg& c) {
        return c.kind == Cfg::Kind::Name && c.name == name && c.value.has_value();
    });
}

void render(std::ostringstream& out, const Cfg& cfg, Format fmt) {
    bool simple_list = std::all_of(cfg.sub.begin(), cfg.sub.end(),
                                   [](const Cfg& c) { return c.is_simple(); });

    switch (cfg.kind) {
    case Cfg::Kind::True:
        out << "everywhere";
        return;

    case Cfg::Kind::False:
        out << "nowhere";
        return;

    case Cfg::Kind::Not: {
        const Cfg& child = cfg.sub[0];
        if (child.kind == Cfg::Kind::Any) {
            bool simple = std::all_of(child.sub.begin(), child.sub.end(),
                                      [](const Cfg& c) { return c.is_simple(); });
            const char* sep = simple ? " nor " : ", nor ";
            for (size_t i = 0; i < child.sub.size(); ++i) {
                out << (i == 0 ? "neither " : sep);
                render_with_opt_paren(out, child.sub[i], !child.sub[i].is_all(), fmt);
            }
        } else if (child.kind == Cfg::Kind::Name) {
            out << "non-";
            render(out, child, fmt);
        } else {
            out << "not (";
            render(out, child, fmt);
            out << ")";
        }
        return;
    }

    case Cfg::Kind::Any:
    case Cfg::Kind::All: {
        bool is_any = cfg.kind == Cfg::Kind::Any;
        const char* sep = is_any ? (simple_list ? " or " : ", or ")
                                 : (simple_list ? " and " : ", and ");

        // A long list of features only is written once as "crate features `a` and `b`".
        bool short_longhand = false;
        if (fmt == Format::LongPlain) {
            if (all_leaves_named(cfg.sub, "feature")) {
                out << "crate features ";
                short_longhand = true;
            } else if (all_leaves_named(cfg.sub, "target_feature")) {
                out << "target features ";
                short_longhand = true;
            }
        }

        for (size_t i = 0; i < cfg.sub.size(); ++i) {
            const Cfg& c = cfg.sub[i];
            if (i != 0) {
                out << sep;
            }
            if (short_longhand) {
                out << "`" << *c.value << "`";
            } else {
                bool paren = is_any ? !c.is_all() : !c.is_simple();
                render_with_opt_paren(out, c, paren, fmt);
            }
        }
        return;
    }

    case Cfg::Kind::Name:
        break;
    }

    if (cfg.value) {
        const std::string& v = *cfg.value;
        if (cfg.name == "target_endian") {
            out << v << "-endian";
            return;
        }
        if (cfg.name == "target_pointer_width") {
            out << v << "-bit";
            return;
        }
        if (cfg.name == "target_feature") {
            out << (fmt == Format::LongPlain ? "target feature `" : "`") << v << "`";
            return;
        }
        if (cfg.name == "feature") {
            out << (fmt == Format::LongPlain ? "crate feature `" : "`") << v << "`";
            return;
        }
    }

    std::string label = human_readable(cfg.name, cfg.value);
    if (!label.empty()) {
        out << label;
    } else if (cfg.value) {
        out << "`" << cfg.name << "=\"" << *cfg.value << "\"`";
    } else {
        out << "`" << cfg.name << "`";
    }
}

auto should_capitalize_first_letter(const Cfg& cfg) -> bool {
    switch (cfg.kind) {
    case Cfg::Kind::True:
    case Cfg::Kind::False:
    case Cfg::Kind::Not:
        return true;
    case Cfg::Kind::Any:
    case Cfg::Kind::All:
        return !cfg.sub.empty() && should_capitalize_first_letter(cfg.sub.front());
    case Cfg::Kind::Name:
        return cfg.name == "debug_assertions" || cfg.name == "target_endian";
    }
    return false;
}

auto should_append_only_to_description(const Cfg& cfg) -> bool {
    switch (cfg.kind) {
    case Cfg::Kind::True:
    case Cfg::Kind::False:
        return false;
    case Cfg::Kind::Any:
    case Cfg::Kind::All:
    case Cfg::Kind::Name:
        return true;
    case Cfg::Kind::Not:
        return cfg.sub[0].kind == Cfg::Kind::Name;
    }
    return false;
}

} // namespace

auto Cfg::render_short_plain() const -> std::string {
    std::ostringstream out;
    render(out, *this, Format::ShortPlain);
    std::string msg = out.str();
    if (should_capitalize_first_letter(*this)) {
        auto it = std::find_if(msg.begin(), msg.end(),
                               [](unsigned char c) { return std::isalnum(c) != 0; });
        if (it != msg.end()) {
            *it = static_cast<char>(std::toupper(static_cast<unsigned char>(*it)));
        }
    }
    return msg;
}

auto Cfg::render_long_plain() const -> std::string {
    bool with = kind == Kind::Name && name == "target_feature";
    std::ostringstream out;
    out << "This is supported " << (with ? "with" : "on") << " ";
    render(out, *this, Format::LongPlain);
    if (should_append_only_to_description(*this)) {
        out << " only";
    }
    return out.str();
}

} // namespace cleandoc::clean
