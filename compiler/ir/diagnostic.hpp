#pragma once

#include "source_span.hpp"

#include <optional>
#include <string>

namespace stencil::ir
{
    struct Diagnostic
    {
        std::string code;
        std::string message;
        std::optional<SourceSpan> span;
        bool isWarning{false};
    };
} // namespace stencil::ir
