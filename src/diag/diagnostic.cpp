//! # Diagnostic Handler Implementation

#include "diag/diagnostic.hpp"

#include "log/log.hpp"

namespace cleandoc::diag {

auto severity_string(DiagnosticSeverity sev) -> const char* {
    constexpr const char* NAMES[] = {"error", "warning", "note"};
    auto index = static_cast<size_t>(sev);
    return index < std::size(NAMES) ? NAMES[index] : "unknown";
}

auto DiagnosticHandler::format(const Diagnostic& diag) -> std::string {
    std::string text = severity_string(diag.severity);
    if (!diag.code.empty()) {
        text += '[' + diag.code + ']';
    }
    text += ": " + diag.message + '\n';

    if (const auto& start = diag.primary_span.start; !diag.primary_span.is_dummy()) {
        text += "  --> " + start.file + ':' + std::to_string(start.line) + ':' +
                std::to_string(start.column) + '\n';
    }
    for (const auto& note : diag.notes) {
        text += "  = note: " + note + '\n';
    }
    return text;
}

void DiagnosticHandler::emit(Diagnostic diag) {
    switch (diag.severity) {
    case DiagnosticSeverity::Error:
        ++error_count_;
        break;
    case DiagnosticSeverity::Warning:
        ++warning_count_;
        break;
    case DiagnosticSeverity::Note:
        break;
    }

    CLEANDOC_LOG_DEBUG("diag", "reported " << diag.code << " at " << diag.primary_span.start.file
                                           << ":" << diag.primary_span.start.line);

    if (out_ != nullptr) {
        *out_ << format(diag);
    }
    diagnostics_.push_back(std::move(diag));
}

void DiagnosticHandler::span_err(const SourceSpan& span, const std::string& message,
                                 const std::string& code) {
    emit({DiagnosticSeverity::Error, code, message, span, {}});
}

void DiagnosticHandler::span_warn(const SourceSpan& span, const std::string& message,
                                  const std::string& code) {
    emit({DiagnosticSeverity::Warning, code, message, span, {}});
}

void DiagnosticHandler::clear() {
    *this = out_ != nullptr ? DiagnosticHandler(*out_) : DiagnosticHandler();
}

} // namespace cleandoc::diag
