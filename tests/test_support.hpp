//! # Test Support
//!
//! An in-memory `CompilerQueries` backend for the clean-model tests. Every
//! table is a public map the test fills in before building items.

#ifndef CLEANDOC_TESTS_TEST_SUPPORT_HPP
#define CLEANDOC_TESTS_TEST_SUPPORT_HPP

#include "host/attr.hpp"
#include "host/def_id.hpp"
#include "host/queries.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace cleandoc::test {

class FakeCompilerQueries : public host::CompilerQueries {
public:
    std::unordered_map<host::DefId, host::Stability> stability;
    std::unordered_map<host::DefId, host::ConstStability> const_stability;
    std::unordered_map<host::DefId, host::Deprecation> deprecation;
    std::unordered_map<host::DefId, std::vector<host::Attribute>> attrs;
    std::unordered_map<host::DefId, SourceSpan> def_spans;
    std::unordered_map<host::DefId, SourceSpan> body_spans;
    std::unordered_map<host::DefId, host::HostVisibility> visibilities;
    std::unordered_map<host::DefId, std::string> names;
    std::unordered_map<host::DefId, std::vector<std::string>> paths;
    std::unordered_map<host::CrateNum, std::string> crate_names;
    std::unordered_map<host::CrateNum, host::DefIndex> index_limits;
    host::LangItems lang;

    auto lookup_stability(host::DefId did) const -> std::optional<host::Stability> override {
        return find(stability, did);
    }

    auto lookup_const_stability(host::DefId did) const
        -> std::optional<host::ConstStability> override {
        return find(const_stability, did);
    }

    auto lookup_deprecation(host::DefId did) const -> std::optional<host::Deprecation> override {
        return find(deprecation, did);
    }

    auto get_attrs(host::DefId did) const -> std::vector<host::Attribute> override {
        return find(attrs, did).value_or(std::vector<host::Attribute>{});
    }

    auto def_span(host::DefId did) const -> SourceSpan override {
        return find(def_spans, did).value_or(SourceSpan{});
    }

    auto span_with_body(host::DefId did) const -> SourceSpan override {
        return find(body_spans, did).value_or(SourceSpan{});
    }

    auto visibility(host::DefId did) const -> host::HostVisibility override {
        return find(visibilities, did).value_or(host::HostVisibility::public_());
    }

    auto lang_items() const -> const host::LangItems& override {
        return lang;
    }

    auto item_name(host::DefId did) const -> std::string override {
        return find(names, did).value_or(std::string{});
    }

    auto def_path(host::DefId did) const -> std::vector<std::string> override {
        return find(paths, did).value_or(std::vector<std::string>{});
    }

    auto crate_name(host::CrateNum krate) const -> std::string override {
        return find(crate_names, krate).value_or(std::string{"krate"});
    }

    auto def_index_limit(host::CrateNum krate) const -> host::DefIndex override {
        return find(index_limits, krate).value_or(host::DefIndex{100});
    }

private:
    template <typename K, typename V>
    static auto find(const std::unordered_map<K, V>& map, const K& key) -> std::optional<V> {
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/// A span on `line` of `file`, columns 1 to 10.
inline auto span_at(const std::string& file, uint32_t line) -> SourceSpan {
    SourceSpan span;
    span.start = SourceLocation{file, line, 1, 0};
    span.end = SourceLocation{file, line, 10, 0};
    return span;
}

} // namespace cleandoc::test

#endif // CLEANDOC_TESTS_TEST_SUPPORT_HPP
