#pragma once

#include "../ir/diagnostic.hpp"
#include "../ir/internal_error.hpp"
#include "../ir/node.hpp"
#include "../ir/passes/component_classifier.hpp"

#include <string_view>
#include <vector>

namespace stencil
{
    struct PipelineOptions
    {
        bool verify{true};
    };

    struct CompilationResult
    {
        ir::Document document;
        std::vector<ir::Diagnostic> diagnostics;
        std::vector<ir::InternalError> internalErrors;

        // True when the tree is safe to hand to an emitter.
        [[nodiscard]] bool usable() const noexcept;
        [[nodiscard]] bool hasErrors() const noexcept;
    };

    /**
     * Read one template and run the structuring passes over it:
     * template reader, tree structuring, orphan construct lowering, verification.
     * A failing pass stops the pipeline for this document only.
     */
    [[nodiscard]] CompilationResult compileTemplate(std::string_view source,
                                                    std::string_view documentName,
                                                    const passes::ComponentClassifier& classifier,
                                                    const PipelineOptions& options = {});
} // namespace stencil
