#include "render_writer.hpp"

#include <utility>

namespace stencil::emit
{
    namespace
    {
        std::string_view trimView(std::string_view text)
        {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }

            const auto last = text.find_last_not_of(" \t\r\n");
            return text.substr(first, last - first + 1);
        }
    } // namespace

    RenderWriter::RenderWriter(std::string targetPrefix)
        : m_scopes(std::move(targetPrefix))
    {
    }

    bool RenderWriter::write(const ir::Document& document)
    {
        bool success = writeChildren(document, document.root());
        if (success)
        {
            success = m_scopes.finish();
        }

        const auto& scopeErrors = m_scopes.errors();
        m_errors.insert(m_errors.end(), scopeErrors.begin(), scopeErrors.end());
        return success && m_errors.empty();
    }

    const std::string& RenderWriter::output() const noexcept
    {
        return m_writer.str();
    }

    const std::vector<ir::Diagnostic>& RenderWriter::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const std::vector<ir::InternalError>& RenderWriter::errors() const noexcept
    {
        return m_errors;
    }

    ClosureHandle RenderWriter::beginChildContent(std::string_view outerTarget, std::string_view innerTarget)
    {
        m_writer.write(outerTarget).write(".addAttribute(");
        m_writer.writeStringLiteral("ChildContent");
        m_writer.write(", [&](RenderTreeBuilder& ").write(innerTarget).writeLine(") {");
        m_writer.indent();

        ClosureHandle handle;
        handle.id = m_nextClosureId++;
        handle.targetName = std::string{innerTarget};
        m_openClosures.push_back(handle.id);
        return handle;
    }

    void RenderWriter::endChildContent(const ClosureHandle& handle)
    {
        // Closures nest; only the innermost one may end.
        if (m_openClosures.empty() || m_openClosures.back() != handle.id)
        {
            reportError("STENCIL-I5304",
                        "child-content closure #" + std::to_string(handle.id) + " for '" + handle.targetName
                            + "' is not the innermost open closure.");
            return;
        }

        m_openClosures.pop_back();
        m_writer.dedent();
        m_writer.writeLine("});");
    }

    bool RenderWriter::writeChildren(const ir::Document& document, ir::NodeId id)
    {
        for (auto child : document.node(id).children)
        {
            if (!writeNode(document, child))
            {
                return false;
            }
        }
        return true;
    }

    bool RenderWriter::writeNode(const ir::Document& document, ir::NodeId id)
    {
        const ir::Node& node = document.node(id);
        switch (node.kind)
        {
        case ir::NodeKind::RawMarkup:
            if (!m_scopes.incrementChildCount(*this))
            {
                return false;
            }
            writeCall("addContent(");
            m_writer.writeStringLiteral(ir::markupText(node));
            m_writer.writeLine(");");
            return true;
        case ir::NodeKind::Element:
            return writeElement(document, id);
        case ir::NodeKind::StructuredConstruct:
            return writeComponent(document, id);
        case ir::NodeKind::Opaque:
            if (node.opaqueKind == ir::OpaqueKind::Directive)
            {
                return true;
            }
            if (!m_scopes.incrementChildCount(*this))
            {
                return false;
            }
            if (node.opaqueKind == ir::OpaqueKind::CodeBlock)
            {
                m_writer.writeLine(trimView(node.code));
                return true;
            }
            writeCall("addContent(");
            m_writer.write(node.code).writeLine(");");
            return true;
        default:
            reportError("STENCIL-I5301",
                        "node #" + std::to_string(id) + " of kind " + std::string{ir::toString(node.kind)}
                            + " cannot be written as content.");
            return false;
        }
    }

    bool RenderWriter::writeElement(const ir::Document& document, ir::NodeId id)
    {
        if (!m_scopes.incrementChildCount(*this))
        {
            return false;
        }

        const std::string& tagName = document.node(id).name;
        writeCall("openElement(");
        m_writer.writeStringLiteral(tagName).writeLine(");");
        if (!m_scopes.openScope(tagName, false))
        {
            return false;
        }

        for (auto child : document.node(id).children)
        {
            const bool written = document.node(child).kind == ir::NodeKind::Attribute ? writeAttribute(document, child)
                                                                                     : writeNode(document, child);
            if (!written)
            {
                return false;
            }
        }

        if (!m_scopes.closeScope(*this))
        {
            return false;
        }
        writeCall("closeElement();");
        m_writer.writeLine();
        return true;
    }

    bool RenderWriter::writeComponent(const ir::Document& document, ir::NodeId id)
    {
        if (!m_scopes.incrementChildCount(*this))
        {
            return false;
        }

        const std::string& tagName = document.node(id).name;
        writeCall("openComponent(");
        m_writer.writeStringLiteral(tagName).writeLine(");");
        if (!m_scopes.openScope(tagName, true))
        {
            return false;
        }

        // Parameters first: child content is itself written as the last attribute.
        for (auto child : document.node(id).children)
        {
            if (document.node(child).kind == ir::NodeKind::ConstructAttribute && !writeAttribute(document, child))
            {
                return false;
            }
        }

        const ir::NodeId body = ir::findConstructBody(document, id);
        if (body == ir::kInvalidNode)
        {
            reportError("STENCIL-I5302", "component #" + std::to_string(id) + " '<" + tagName + ">' has no body.");
            return false;
        }

        if (!writeChildren(document, body) || !m_scopes.closeScope(*this))
        {
            return false;
        }
        writeCall("closeComponent();");
        m_writer.writeLine();
        return true;
    }

    bool RenderWriter::writeAttribute(const ir::Document& document, ir::NodeId id)
    {
        const ir::Node& attribute = document.node(id);

        std::vector<ir::NodeId> parts;
        if (attribute.kind == ir::NodeKind::Attribute)
        {
            for (auto child : attribute.children)
            {
                const auto& valueParts = document.node(child).children;
                parts.insert(parts.end(), valueParts.begin(), valueParts.end());
            }
        }
        else
        {
            parts = attribute.children;
        }

        writeCall("addAttribute(");
        m_writer.writeStringLiteral(attribute.name).write(", ");
        if (!writeAttributeValue(document, id, parts))
        {
            return false;
        }
        m_writer.writeLine(");");
        return true;
    }

    bool RenderWriter::writeAttributeValue(const ir::Document& document,
                                           ir::NodeId attribute,
                                           const std::vector<ir::NodeId>& parts)
    {
        bool wrote = false;
        for (auto part : parts)
        {
            const ir::Node& node = document.node(part);
            if (node.kind == ir::NodeKind::Opaque && node.opaqueKind == ir::OpaqueKind::CodeBlock)
            {
                // Statements have no value to assign.
                ir::Diagnostic diagnostic;
                diagnostic.code = "STENCIL-E2002";
                diagnostic.message = "Code blocks are not supported in attribute values: '"
                    + std::string{trimView(node.code)} + "'. Use an expression instead.";
                diagnostic.span = node.span.has_value() ? node.span : document.node(attribute).span;
                m_diagnostics.emplace_back(std::move(diagnostic));
                continue;
            }

            if (wrote)
            {
                m_writer.write(" + ");
            }

            if (node.kind == ir::NodeKind::RawMarkup)
            {
                m_writer.writeStringLiteral(ir::markupText(node));
            }
            else if (node.kind == ir::NodeKind::Opaque)
            {
                m_writer.write("(").write(node.code).write(")");
            }
            else
            {
                reportError("STENCIL-I5303",
                            "attribute '" + document.node(attribute).name + "' holds a value part of kind "
                                + std::string{ir::toString(node.kind)} + ".");
                return false;
            }
            wrote = true;
        }

        // A bare attribute such as <input disabled> is a boolean flag.
        if (!wrote)
        {
            m_writer.write("true");
        }
        return true;
    }

    void RenderWriter::writeCall(std::string_view method)
    {
        m_writer.write(m_scopes.targetName()).write(".").write(method);
    }

    void RenderWriter::reportError(std::string_view code, std::string detail)
    {
        ir::InternalError error;
        error.code = std::string{code};
        error.stage = "render-writer";
        error.detail = std::move(detail);
        m_errors.emplace_back(std::move(error));
    }
} // namespace stencil::emit
