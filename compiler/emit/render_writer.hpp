#pragma once

#include "../ir/diagnostic.hpp"
#include "../ir/internal_error.hpp"
#include "../ir/node.hpp"
#include "code_writer.hpp"
#include "scope_stack.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::emit
{
    /**
     * Writes render-tree builder calls for a structured document.
     * Elements become openElement/closeElement pairs; constructs that survived
     * orphan lowering are components whose body is captured in a child-content
     * closure opened by the scope stack.
     */
    class RenderWriter final : public ClosureWriter
    {
    public:
        explicit RenderWriter(std::string targetPrefix = "builder");

        [[nodiscard]] bool write(const ir::Document& document);

        [[nodiscard]] const std::string& output() const noexcept;
        [[nodiscard]] const std::vector<ir::Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] const std::vector<ir::InternalError>& errors() const noexcept;

        ClosureHandle beginChildContent(std::string_view outerTarget, std::string_view innerTarget) override;
        void endChildContent(const ClosureHandle& handle) override;

    private:
        bool writeChildren(const ir::Document& document, ir::NodeId id);
        bool writeNode(const ir::Document& document, ir::NodeId id);
        bool writeElement(const ir::Document& document, ir::NodeId id);
        bool writeComponent(const ir::Document& document, ir::NodeId id);
        bool writeAttribute(const ir::Document& document, ir::NodeId id);
        bool writeAttributeValue(const ir::Document& document, ir::NodeId attribute, const std::vector<ir::NodeId>& parts);
        void writeCall(std::string_view method);
        void reportError(std::string_view code, std::string detail);

    private:
        CodeWriter m_writer;
        ScopeStack m_scopes;
        std::vector<ir::Diagnostic> m_diagnostics;
        std::vector<ir::InternalError> m_errors;
        std::uint32_t m_nextClosureId{0};
        std::vector<std::uint32_t> m_openClosures;
    };
} // namespace stencil::emit
