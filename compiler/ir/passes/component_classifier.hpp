#pragma once

#include "../node.hpp"

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace stencil::passes
{
    // Answers whether a structured construct stands for a component or only decorates an element.
    class ComponentClassifier
    {
    public:
        virtual ~ComponentClassifier() = default;

        [[nodiscard]] virtual bool isComponentLike(const ir::Document& document, ir::NodeId construct) const = 0;
    };

    // Component-like when any descriptor bound to the construct is registered as a component.
    class DescriptorClassifier final : public ComponentClassifier
    {
    public:
        DescriptorClassifier() = default;
        explicit DescriptorClassifier(const std::vector<std::string>& componentDescriptors);

        void addComponent(std::string_view descriptor);

        [[nodiscard]] bool isComponentLike(const ir::Document& document, ir::NodeId construct) const override;

    private:
        std::unordered_set<std::string> m_components;
    };
} // namespace stencil::passes
