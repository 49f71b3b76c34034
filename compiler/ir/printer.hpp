#pragma once

#include "node.hpp"

#include <iosfwd>

namespace stencil::ir
{
    void print(const Document& document, std::ostream& stream);
}
