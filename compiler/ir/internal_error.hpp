#pragma once

#include <string>

namespace stencil::ir
{
    // A broken compiler invariant. The document being processed must be abandoned.
    struct InternalError
    {
        std::string code;
        std::string stage;
        std::string detail;
    };
} // namespace stencil::ir
