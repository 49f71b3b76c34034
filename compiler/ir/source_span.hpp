#pragma once

#include <cstdint>

namespace stencil::ir
{
    struct SourceLocation
    {
        std::uint32_t offset{0};
        std::uint32_t line{1};
        std::uint32_t column{1};
    };

    struct SourceSpan
    {
        SourceLocation begin{};
        SourceLocation end{};
    };
} // namespace stencil::ir
