#include "pipeline.hpp"

#include "../frontend/template_reader.hpp"
#include "../ir/passes/orphan_lowering.hpp"
#include "../ir/passes/tree_structuring.hpp"
#include "../ir/verifier.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace stencil
{
    bool CompilationResult::usable() const noexcept
    {
        return internalErrors.empty();
    }

    bool CompilationResult::hasErrors() const noexcept
    {
        return !internalErrors.empty()
            || std::any_of(diagnostics.begin(), diagnostics.end(), [](const ir::Diagnostic& diagnostic) {
                   return !diagnostic.isWarning;
               });
    }

    CompilationResult compileTemplate(std::string_view source,
                                      std::string_view documentName,
                                      const passes::ComponentClassifier& classifier,
                                      const PipelineOptions& options)
    {
        CompilationResult result;

        frontend::TemplateReader reader{source, documentName};
        result.document = reader.read();
        result.diagnostics = reader.diagnostics();

        if (!passes::structureMarkup(result.document, result.internalErrors))
        {
            return result;
        }

        if (!passes::lowerOrphanConstructs(result.document, classifier, result.internalErrors))
        {
            return result;
        }

        if (options.verify && !ir::verify(result.document))
        {
            ir::InternalError error;
            error.code = "STENCIL-I5401";
            error.stage = "verifier";
            error.detail = "structured tree of '" + std::string{documentName} + "' failed verification.";
            result.internalErrors.emplace_back(std::move(error));
            return result;
        }

        const auto nodeDiagnostics = ir::collectDiagnostics(result.document);
        result.diagnostics.insert(result.diagnostics.end(), nodeDiagnostics.begin(), nodeDiagnostics.end());
        return result;
    }
} // namespace stencil
