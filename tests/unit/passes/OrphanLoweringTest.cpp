#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "builder.hpp"
#include "passes/orphan_lowering.hpp"
#include "verifier.hpp"

namespace stencil::passes
{
namespace
{
    TEST(OrphanLoweringTest, RewritesDecoratedElementInPlace)
    {
        ir::Document document;
        ir::Builder builder{document};
        builder.appendMarkup(document.root(), "before");
        const ir::NodeId construct = builder.appendConstruct(document.root(), "input", {"BindDescriptor"});
        const ir::NodeId bind = builder.appendConstructAttribute(construct, "bind");
        const ir::NodeId expression = builder.appendOpaque(bind, ir::OpaqueKind::Expression, "Model.Name");
        const ir::NodeId body = builder.bodyOf(construct);
        const ir::NodeId text = builder.appendMarkup(body, "inner");
        builder.appendMarkup(document.root(), "after");

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{std::vector<std::string>{"CounterComponent"}};
        ASSERT_TRUE(lowerOrphanConstructs(document, classifier, errors));
        EXPECT_TRUE(errors.empty());

        const auto& top = document.node(document.root()).children;
        ASSERT_EQ(top.size(), 3u);

        const ir::Node& element = document.node(top[1]);
        EXPECT_EQ(element.kind, ir::NodeKind::Element);
        EXPECT_EQ(element.name, "input");
        ASSERT_EQ(element.children.size(), 2u);

        const ir::Node& attribute = document.node(element.children[0]);
        EXPECT_EQ(attribute.kind, ir::NodeKind::Attribute);
        EXPECT_EQ(attribute.name, "bind");
        ASSERT_EQ(attribute.children.size(), 1u);
        const ir::Node& value = document.node(attribute.children[0]);
        EXPECT_EQ(value.kind, ir::NodeKind::AttributeValue);
        ASSERT_EQ(value.children.size(), 1u);
        EXPECT_EQ(value.children[0], expression);

        EXPECT_EQ(element.children[1], text);
        EXPECT_TRUE(ir::verify(document));
    }

    TEST(OrphanLoweringTest, KeepsComponents)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId construct = builder.appendConstruct(document.root(), "Counter", {"CounterComponent"});
        builder.appendConstructAttribute(construct, "Start");

        std::vector<ir::InternalError> errors;
        DescriptorClassifier classifier;
        classifier.addComponent("CounterComponent");
        ASSERT_TRUE(lowerOrphanConstructs(document, classifier, errors));

        ASSERT_EQ(document.node(document.root()).children.size(), 1u);
        EXPECT_EQ(document.node(document.root()).children[0], construct);
        EXPECT_EQ(document.node(construct).kind, ir::NodeKind::StructuredConstruct);
    }

    TEST(OrphanLoweringTest, ReportsConstructsInnermostFirst)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId outer = builder.appendConstruct(document.root(), "form", {"FormDescriptor"});
        const ir::NodeId inner = builder.appendConstruct(builder.bodyOf(outer), "input", {"BindDescriptor"});

        const DescriptorClassifier classifier{};
        const auto references = collectOrphanConstructs(document, classifier);
        ASSERT_EQ(references.size(), 2u);
        EXPECT_EQ(references[0].node, inner);
        EXPECT_EQ(references[0].parent, builder.bodyOf(outer));
        EXPECT_EQ(references[1].node, outer);
        EXPECT_EQ(references[1].parent, document.root());
    }

    TEST(OrphanLoweringTest, LowersNestedConstructs)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId outer = builder.appendConstruct(document.root(), "form", {"FormDescriptor"});
        const ir::NodeId inner = builder.appendConstruct(builder.bodyOf(outer), "input", {"BindDescriptor"});
        builder.appendMarkup(builder.bodyOf(inner), "x");

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{};
        ASSERT_TRUE(lowerOrphanConstructs(document, classifier, errors));

        const ir::Node& form = document.node(document.node(document.root()).children.front());
        EXPECT_EQ(form.kind, ir::NodeKind::Element);
        EXPECT_EQ(form.name, "form");
        ASSERT_EQ(form.children.size(), 1u);

        const ir::Node& input = document.node(form.children.front());
        EXPECT_EQ(input.kind, ir::NodeKind::Element);
        EXPECT_EQ(input.name, "input");
        ASSERT_EQ(input.children.size(), 1u);
        EXPECT_EQ(ir::markupText(document.node(input.children.front())), "x");
        EXPECT_TRUE(ir::verify(document));
    }

    TEST(OrphanLoweringTest, LowersDecoratorInsideComponentBody)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId component = builder.appendConstruct(document.root(), "Card", {"CardComponent"});
        builder.appendConstruct(builder.bodyOf(component), "button", {"EventDescriptor"});

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{std::vector<std::string>{"CardComponent"}};
        ASSERT_TRUE(lowerOrphanConstructs(document, classifier, errors));

        EXPECT_EQ(document.node(component).kind, ir::NodeKind::StructuredConstruct);
        const auto& bodyChildren = document.node(builder.bodyOf(component)).children;
        ASSERT_EQ(bodyChildren.size(), 1u);
        EXPECT_EQ(document.node(bodyChildren[0]).kind, ir::NodeKind::Element);
        EXPECT_EQ(document.node(bodyChildren[0]).name, "button");
    }

    TEST(OrphanLoweringTest, CarriesDiagnosticsToElement)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId construct = builder.appendConstruct(document.root(), "div", {"RefDescriptor"});

        ir::Diagnostic diagnostic;
        diagnostic.code = "STENCIL-E2001";
        diagnostic.message = "Mismatched closing tag.";
        document.node(construct).diagnostics.push_back(diagnostic);

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{};
        ASSERT_TRUE(lowerOrphanConstructs(document, classifier, errors));

        const ir::Node& element = document.node(document.node(document.root()).children.front());
        ASSERT_EQ(element.diagnostics.size(), 1u);
        EXPECT_EQ(element.diagnostics[0].code, "STENCIL-E2001");
    }

    TEST(OrphanLoweringTest, FailsOnConstructWithoutBody)
    {
        ir::Document document;
        const ir::NodeId construct = document.create(ir::NodeKind::StructuredConstruct);
        document.node(construct).name = "broken";
        document.appendChild(document.root(), construct);

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{};
        EXPECT_FALSE(lowerOrphanConstructs(document, classifier, errors));
        ASSERT_EQ(errors.size(), 1u);
        EXPECT_EQ(errors[0].code, "STENCIL-I5101");
        EXPECT_EQ(errors[0].stage, "orphan-lowering");
    }

    TEST(OrphanLoweringTest, FailsOnSharedConstruct)
    {
        ir::Document document;
        ir::Builder builder{document};
        const ir::NodeId construct = builder.appendConstruct(document.root(), "span", {"RefDescriptor"});
        const ir::NodeId element = builder.appendElement(document.root(), "p");
        document.appendChild(element, construct);

        std::vector<ir::InternalError> errors;
        const DescriptorClassifier classifier{};
        EXPECT_FALSE(lowerOrphanConstructs(document, classifier, errors));
        ASSERT_EQ(errors.size(), 1u);
        EXPECT_EQ(errors[0].code, "STENCIL-I5102");
    }
} // namespace
} // namespace stencil::passes
