//! # Log Configuration from the Environment
//!
//! The embedding tool owns the command line, so cleandoc takes its logging
//! setup from `CLEANDOC_LOG*` variables only.

#include "common.hpp"
#include "log/log.hpp"

namespace cleandoc::log {

namespace {

/// A bare level name (`debug`) versus a module filter (`attrs=trace`, `a,b`).
bool looks_like_filter(std::string_view value) {
    return value.find_first_of("=,") != std::string_view::npos;
}

} // namespace

LogConfig log_config_from_env() {
    LogConfig config;

    if (auto value = read_env("CLEANDOC_LOG"); value && !value->empty()) {
        if (looks_like_filter(*value)) {
            config.filter_spec = *value;
        } else {
            config.level = parse_level(*value);
        }
    }

    config.log_file = read_env("CLEANDOC_LOG_FILE").value_or("");

    auto format = read_env("CLEANDOC_LOG_FORMAT").value_or("text");
    if (format == "json" || format == "JSON") {
        config.format = LogFormat::JSON;
    }

    return config;
}

} // namespace cleandoc::log
