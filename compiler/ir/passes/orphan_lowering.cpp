#include "orphan_lowering.hpp"

#include "../builder.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

namespace stencil::passes
{
    namespace
    {
        constexpr std::string_view kPassName = "orphan-lowering";

        void reportError(std::vector<ir::InternalError>& errors, std::string_view code, std::string detail)
        {
            ir::InternalError error;
            error.code = std::string{code};
            error.stage = std::string{kPassName};
            error.detail = std::move(detail);
            errors.emplace_back(std::move(error));
        }

        void collect(const ir::Document& document,
                     ir::NodeId id,
                     const ComponentClassifier& classifier,
                     std::vector<ConstructReference>& references)
        {
            for (auto child : document.node(id).children)
            {
                collect(document, child, classifier, references);

                const ir::Node& node = document.node(child);
                if (node.kind == ir::NodeKind::StructuredConstruct && !classifier.isComponentLike(document, child))
                {
                    references.push_back({id, child});
                }
            }
        }

        ir::NodeId rewriteAttribute(ir::Document& document, ir::Builder& builder, ir::NodeId constructAttribute)
        {
            const ir::Node source = document.node(constructAttribute);

            const ir::NodeId attribute = builder.createAttribute(source.name);
            ir::Node& target = document.node(attribute);
            target.span = source.span;
            target.diagnostics = source.diagnostics;

            const ir::NodeId value = builder.valueOf(attribute);
            for (auto part : source.children)
            {
                document.appendChild(value, part);
            }
            return attribute;
        }

        bool lowerConstruct(ir::Document& document,
                            ir::Builder& builder,
                            const ConstructReference& reference,
                            std::vector<ir::InternalError>& errors)
        {
            const ir::Node construct = document.node(reference.node);

            const ir::NodeId body = ir::findConstructBody(document, reference.node);
            if (body == ir::kInvalidNode)
            {
                reportError(errors,
                            "STENCIL-I5101",
                            "structured construct #" + std::to_string(reference.node) + " '<" + construct.name
                                + ">' has no body.");
                return false;
            }

            const auto& siblings = document.node(reference.parent).children;
            const auto position = std::find(siblings.begin(), siblings.end(), reference.node);
            if (position == siblings.end())
            {
                reportError(errors,
                            "STENCIL-I5102",
                            "structured construct #" + std::to_string(reference.node) + " '<" + construct.name
                                + ">' is no longer a child of node #" + std::to_string(reference.parent) + ".");
                return false;
            }
            const auto index = static_cast<std::size_t>(position - siblings.begin());

            const ir::NodeId element = builder.createElement(construct.name);
            document.node(element).span = construct.span;
            document.node(element).diagnostics = construct.diagnostics;

            for (auto child : construct.children)
            {
                const ir::NodeKind kind = document.node(child).kind;
                if (kind == ir::NodeKind::ConstructBody)
                {
                    continue;
                }

                if (kind == ir::NodeKind::ConstructAttribute)
                {
                    document.appendChild(element, rewriteAttribute(document, builder, child));
                }
                else
                {
                    document.appendChild(element, child);
                }
            }

            const std::vector<ir::NodeId> bodyChildren = document.node(body).children;
            for (auto child : bodyChildren)
            {
                document.appendChild(element, child);
            }

            document.replaceChild(reference.parent, index, element);
            return true;
        }
    } // namespace

    std::vector<ConstructReference> collectOrphanConstructs(const ir::Document& document,
                                                            const ComponentClassifier& classifier)
    {
        std::vector<ConstructReference> references;
        collect(document, document.root(), classifier, references);
        return references;
    }

    bool lowerOrphanConstructs(ir::Document& document,
                               const ComponentClassifier& classifier,
                               std::vector<ir::InternalError>& errors)
    {
        const auto references = collectOrphanConstructs(document, classifier);

        std::unordered_set<ir::NodeId> seen;
        for (const auto& reference : references)
        {
            if (!seen.insert(reference.node).second)
            {
                reportError(errors,
                            "STENCIL-I5102",
                            "structured construct #" + std::to_string(reference.node)
                                + " is reachable from more than one parent.");
                return false;
            }
        }

        ir::Builder builder{document};
        for (const auto& reference : references)
        {
            if (!lowerConstruct(document, builder, reference, errors))
            {
                return false;
            }
        }

        return true;
    }
} // namespace stencil::passes
