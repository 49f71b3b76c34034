#pragma once

#include "node.hpp"

namespace stencil::ir
{
    // Checks the shape guarantees the code emitter relies on.
    [[nodiscard]] bool verify(const Document& document);
}
