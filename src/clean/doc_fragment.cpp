//! # Doc Fragment Normalization
//!
//! Beautifying, unindenting and flattening of documentation fragments.

#include "clean/doc_fragment.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace cleandoc::clean {

namespace {

auto is_blank(std::string_view line) -> bool {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

auto join_lines(const std::vector<std::string_view>& lines) -> std::string {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i != 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

} // namespace

auto hash_value(const DocFragment& frag) -> size_t {
    size_t seed = std::hash<size_t>{}(frag.line);
    seed = hash_combine(seed, hash_value(frag.span));
    seed = hash_combine(seed, frag.parent_module ? host::hash_value(*frag.parent_module) : 0);
    seed = hash_combine(seed, std::hash<std::string>{}(frag.doc));
    seed = hash_combine(seed, static_cast<size_t>(frag.kind.tag));
    seed = hash_combine(seed, std::hash<std::string>{}(frag.kind.filename));
    seed = hash_combine(seed, frag.need_backline ? 1 : 0);
    return hash_combine(seed, frag.indent);
}

// ============================================================================
// Text Helpers
// ============================================================================

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = nl == std::string_view::npos ? text.size() : nl;
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        pos = nl + 1;
    }
    return lines;
}

namespace {

/// Range of lines left after dropping decoration and blank lines at both
/// ends, or nullopt when nothing is dropped.
auto vertical_trim(const std::vector<std::string_view>& lines)
    -> std::optional<std::pair<size_t, size_t>> {
    size_t i = 0;
    size_t j = lines.size();

    auto all_stars = [](std::string_view s) {
        return std::all_of(s.begin(), s.end(), [](char c) { return c == '*'; });
    };

    if (!lines.empty() && all_stars(lines[0])) {
        i++;
    }
    while (i < j && is_blank(lines[i])) {
        i++;
    }
    // The closing line may start with any character, e.g. ` */` leaves " "
    if (j > i && all_stars(lines[j - 1].empty() ? lines[j - 1] : lines[j - 1].substr(1))) {
        j--;
    }
    while (j > i && is_blank(lines[j - 1])) {
        j--;
    }

    if (i != 0 || j != lines.size()) {
        return std::make_pair(i, j);
    }
    return std::nullopt;
}

/// Column of a `*` shared by every line and preceded only by spaces, tabs or
/// stars.
auto horizontal_trim(const std::vector<std::string_view>& lines) -> std::optional<size_t> {
    size_t col = std::numeric_limits<size_t>::max();
    bool first = true;

    for (std::string_view line : lines) {
        for (size_t j = 0; j < line.size(); ++j) {
            char c = line[j];
            if (j > col || (c != '*' && c != ' ' && c != '\t')) {
                return std::nullopt;
            }
            if (c == '*') {
                if (first) {
                    col = j;
                    first = false;
                } else if (col != j) {
                    return std::nullopt;
                }
                break;
            }
        }
        if (col >= line.size()) {
            return std::nullopt;
        }
    }
    return col;
}

} // namespace

auto beautify_doc_string(std::string_view text) -> std::string {
    if (text.find('\n') == std::string_view::npos) {
        return std::string(text);
    }

    std::vector<std::string_view> lines = split_lines(text);
    bool changes = false;

    if (auto range = vertical_trim(lines)) {
        changes = true;
        lines = std::vector<std::string_view>(lines.begin() + static_cast<ptrdiff_t>(range->first),
                                              lines.begin() + static_cast<ptrdiff_t>(range->second));
    }

    if (auto col = horizontal_trim(lines)) {
        changes = true;
        for (auto& line : lines) {
            line = line.substr(*col + 1);
        }
    }

    return changes ? join_lines(lines) : std::string(text);
}

// ============================================================================
// Flattening
// ============================================================================

void add_doc_fragment(std::string& out, const DocFragment& frag) {
    auto lines = split_lines(frag.doc);
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string_view line = lines[i];
        if (!is_blank(line)) {
            if (line.size() < frag.indent) {
                throw InvariantError("doc fragment line `" + std::string(line) +
                                     "` is shorter than its indent of " +
                                     std::to_string(frag.indent));
            }
            out += line.substr(frag.indent);
        } else {
            out += line;
        }
        if (i + 1 < lines.size()) {
            out += '\n';
        }
    }
    if (frag.need_backline) {
        out += '\n';
    }
}

auto collapse_fragments(const std::vector<DocFragment>& frags) -> std::string {
    std::string acc;
    const DocFragmentKind* prev_kind = nullptr;
    for (const auto& frag : frags) {
        if (!acc.empty() && prev_kind && prev_kind->is_include() && *prev_kind != frag.kind) {
            acc += '\n';
        }
        add_doc_fragment(acc, frag);
        prev_kind = &frag.kind;
    }
    return acc;
}

void update_need_backline(std::vector<DocFragment>& frags, const DocFragment& next) {
    if (frags.empty()) {
        return;
    }
    DocFragment& prev = frags.back();
    if (prev.kind.is_include() || prev.kind != next.kind ||
        prev.parent_module != next.parent_module) {
        // Padding between blocks, but never after an included file
        prev.need_backline = prev.kind.is_sugared() || prev.kind.is_raw();
    } else {
        prev.need_backline = true;
    }
}

void unindent_fragments(std::vector<DocFragment>& frags) {
    if (frags.empty()) {
        return;
    }

    // With a mix of `///` comments and other kinds, the sugared fragments
    // decide: their conventional leading space counts as one column that
    // the other kinds lack.
    bool mixed = false;
    for (size_t i = 1; i < frags.size(); ++i) {
        if (frags[i - 1].kind != frags[i].kind) {
            mixed = true;
            break;
        }
    }
    bool any_sugared = std::any_of(frags.begin(), frags.end(),
                                   [](const DocFragment& f) { return f.kind.is_sugared(); });
    size_t add = mixed && any_sugared ? 1 : 0;

    size_t min_indent = std::numeric_limits<size_t>::max();
    for (const auto& frag : frags) {
        size_t frag_min = std::numeric_limits<size_t>::max();
        for (std::string_view line : split_lines(frag.doc)) {
            if (is_blank(line)) {
                continue;
            }
            size_t whitespace = 0;
            while (whitespace < line.size() && (line[whitespace] == ' ' || line[whitespace] == '\t')) {
                whitespace++;
            }
            frag_min = std::min(frag_min, whitespace) + (frag.kind.is_sugared() ? 0 : add);
        }
        min_indent = std::min(min_indent, frag_min);
    }

    for (auto& frag : frags) {
        if (split_lines(frag.doc).empty()) {
            continue;
        }
        frag.indent = !frag.kind.is_sugared() && min_indent > 0 ? min_indent - add : min_indent;
    }

    CLEANDOC_LOG_TRACE("attrs", "unindented " << frags.size() << " fragments by " << min_indent);
}

} // namespace cleandoc::clean
