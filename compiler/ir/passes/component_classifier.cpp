#include "component_classifier.hpp"

#include <algorithm>

namespace stencil::passes
{
    DescriptorClassifier::DescriptorClassifier(const std::vector<std::string>& componentDescriptors)
        : m_components(componentDescriptors.begin(), componentDescriptors.end())
    {
    }

    void DescriptorClassifier::addComponent(std::string_view descriptor)
    {
        m_components.emplace(descriptor);
    }

    bool DescriptorClassifier::isComponentLike(const ir::Document& document, ir::NodeId construct) const
    {
        const auto& descriptors = document.node(construct).descriptors;
        return std::any_of(descriptors.begin(), descriptors.end(), [this](const std::string& descriptor) {
            return m_components.find(descriptor) != m_components.end();
        });
    }
} // namespace stencil::passes
