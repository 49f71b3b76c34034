#pragma once

#include "../node.hpp"
#include "component_classifier.hpp"
#include "../internal_error.hpp"

#include <vector>

namespace stencil::passes
{
    struct ConstructReference
    {
        ir::NodeId parent{ir::kInvalidNode};
        ir::NodeId node{ir::kInvalidNode};
    };

    // Non-component constructs in post-order, so that a construct precedes any construct enclosing it.
    [[nodiscard]] std::vector<ConstructReference> collectOrphanConstructs(const ir::Document& document,
                                                                          const ComponentClassifier& classifier);

    /**
     * Turn constructs that are not components back into plain elements.
     * The construct's attributes become Attribute children followed by the body's children.
     * Returns false when a construct violates the matcher's shape guarantees.
     */
    bool lowerOrphanConstructs(ir::Document& document,
                               const ComponentClassifier& classifier,
                               std::vector<ir::InternalError>& errors);
} // namespace stencil::passes
