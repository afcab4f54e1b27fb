//! # Common Definitions Implementation
//!
//! Environment-driven option loading and span hashing.

#include "common.hpp"

#include <cstdlib>

namespace cleandoc {

namespace {

auto hash_location(const SourceLocation& loc) -> size_t {
    size_t h = std::hash<std::string>{}(loc.file);
    h = hash_combine(h, std::hash<uint32_t>{}(loc.line));
    h = hash_combine(h, std::hash<uint32_t>{}(loc.column));
    h = hash_combine(h, std::hash<uint32_t>{}(loc.offset));
    return h;
}

} // namespace

auto read_env(const char* name) -> std::optional<std::string> {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        std::string value = buf;
        free(buf);
        return value;
    }
    return std::nullopt;
#else
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

void load_options_from_env() {
    if (auto channel = read_env("CLEANDOC_CHANNEL")) {
        DocOptions::nightly_build = (*channel == "nightly" || *channel == "dev");
    }
    if (auto private_items = read_env("CLEANDOC_DOCUMENT_PRIVATE")) {
        DocOptions::document_private = !private_items->empty() && *private_items != "0";
    }
}

auto hash_value(const SourceSpan& span) -> size_t {
    return hash_combine(hash_location(span.start), hash_location(span.end));
}

} // namespace cleandoc
