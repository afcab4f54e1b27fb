#ifndef CLEANDOC_CLEAN_SPAN_HPP
#define CLEANDOC_CLEAN_SPAN_HPP

#include "common.hpp"

#include <string>
#include <utility>

namespace cleandoc::clean {

/// An item's source span. Always points at the outermost macro call site,
/// so items produced by a macro show the invocation and not the macro body.
class Span {
public:
    Span() = default;

    [[nodiscard]] static auto from_host_span(const SourceSpan& span) -> Span {
        return Span(span.source_callsite());
    }

    [[nodiscard]] static auto dummy() -> Span {
        return Span();
    }

    [[nodiscard]] auto span() const -> const SourceSpan& {
        return span_;
    }

    [[nodiscard]] auto is_dummy() const -> bool {
        return span_.is_dummy();
    }

    [[nodiscard]] auto filename() const -> const std::string& {
        return span_.start.file;
    }

    [[nodiscard]] auto lo() const -> const SourceLocation& {
        return span_.start;
    }

    [[nodiscard]] auto hi() const -> const SourceLocation& {
        return span_.end;
    }

    [[nodiscard]] auto operator==(const Span& other) const -> bool {
        return span_ == other.span_;
    }

private:
    explicit Span(SourceSpan span) : span_(std::move(span)) {}

    SourceSpan span_;
};

} // namespace cleandoc::clean

#endif // CLEANDOC_CLEAN_SPAN_HPP
