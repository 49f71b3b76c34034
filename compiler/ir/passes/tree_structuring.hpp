#pragma once

#include "../node.hpp"
#include "../internal_error.hpp"

#include <string_view>
#include <vector>

namespace stencil::passes
{
    [[nodiscard]] bool isVoidElement(std::string_view tagName);

    /**
     * Rebuild the children of one container into nested Element/Attribute nodes.
     * Raw markup children are tokenized in order; every other child is threaded
     * into the element that is open at its position. Mismatched closing tags are
     * reported on the element and do not stop structuring.
     * Returns false when the container's markup does not balance; the reasons are
     * appended to errors and the document must not be used further.
     */
    bool structureChildren(ir::Document& document, ir::NodeId container, std::vector<ir::InternalError>& errors);

    /**
     * Structure every container of the document, children before parents.
     */
    bool structureMarkup(ir::Document& document, std::vector<ir::InternalError>& errors);
} // namespace stencil::passes
