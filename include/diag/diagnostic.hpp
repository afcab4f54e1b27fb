//! # Diagnostic Handler
//!
//! Accumulates the user-facing diagnostics produced while building the clean
//! documentation tree. Diagnostics are never fatal: construction continues
//! after reporting, and the embedding tool decides what to do with the count.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category       | Example                          |
//! |--------|----------------|----------------------------------|
//! | D      | Doc attributes | D001 - Invalid `doc(cfg(...))`   |

#pragma once

#include "common.hpp"

#include <iterator>
#include <ostream>
#include <string>
#include <vector>

namespace cleandoc::diag {

namespace ErrorCodes {
constexpr const char* INVALID_CFG = "D001";
} // namespace ErrorCodes

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
};

/// One reported problem. `code` may be empty for notes.
struct Diagnostic {
    DiagnosticSeverity severity;
    std::string code;
    std::string message;
    SourceSpan primary_span;
    std::vector<std::string> notes; ///< Rendered as `= note:` lines
};

/// Collects diagnostics and optionally echoes them to a stream.
///
/// The handler is passed by reference through construction; it is not a
/// global so that tests can inspect exactly what a call reported.
class DiagnosticHandler {
public:
    /// Creates a handler that only accumulates.
    DiagnosticHandler() = default;

    /// Creates a handler that also prints each diagnostic to `out`.
    explicit DiagnosticHandler(std::ostream& out) : out_(&out) {}

    void emit(Diagnostic diag);

    /// Reports an error at `span`.
    void span_err(const SourceSpan& span, const std::string& message,
                  const std::string& code = ErrorCodes::INVALID_CFG);

    /// Reports a warning at `span`.
    void span_warn(const SourceSpan& span, const std::string& message, const std::string& code);

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }

    [[nodiscard]] auto error_count() const -> size_t {
        return error_count_;
    }

    [[nodiscard]] auto warning_count() const -> size_t {
        return warning_count_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return error_count_ > 0;
    }

    void clear();

    /// Renders one diagnostic as `error[D001]: message` plus a location line.
    [[nodiscard]] static auto format(const Diagnostic& diag) -> std::string;

private:
    std::ostream* out_ = nullptr;
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
};

[[nodiscard]] auto severity_string(DiagnosticSeverity sev) -> const char*;

} // namespace cleandoc::diag
