#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pipeline.hpp"
#include "render_writer.hpp"

namespace stencil
{
namespace
{
    TEST(PipelineTest, StructuresTemplateWithHoles)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<ul>\n  <li class=\"item-@index\">@name</li>\n</ul>\n", "List.stencil", classifier);

        ASSERT_TRUE(result.usable());
        EXPECT_FALSE(result.hasErrors());

        const ir::Document& document = result.document;
        const auto& top = document.node(document.root()).children;
        ASSERT_EQ(top.size(), 1u);

        const ir::NodeId list = top[0];
        EXPECT_EQ(document.node(list).name, "ul");

        const auto listBody = ir::bodyOf(document, list);
        ASSERT_EQ(listBody.size(), 3u);
        const ir::NodeId item = listBody[1];
        EXPECT_EQ(document.node(item).name, "li");

        const auto attributes = ir::attributesOf(document, item);
        ASSERT_EQ(attributes.size(), 1u);
        const auto& parts = document.node(document.node(attributes[0]).children.front()).children;
        ASSERT_EQ(parts.size(), 2u);
        EXPECT_EQ(ir::markupText(document.node(parts[0])), "item-");
        EXPECT_EQ(document.node(parts[1]).code, "index");

        const auto itemBody = ir::bodyOf(document, item);
        ASSERT_EQ(itemBody.size(), 1u);
        EXPECT_EQ(document.node(itemBody[0]).code, "name");
    }

    TEST(PipelineTest, CollectsMismatchDiagnostics)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<div><span></div></span>", "Broken.stencil", classifier);

        ASSERT_TRUE(result.usable());
        EXPECT_TRUE(result.hasErrors());
        ASSERT_FALSE(result.diagnostics.empty());
        EXPECT_EQ(result.diagnostics.size(), 2u);
        EXPECT_EQ(result.diagnostics[0].code, "STENCIL-E2001");
    }

    TEST(PipelineTest, StopsOnUnbalancedMarkup)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<div><p>open", "Open.stencil", classifier);

        EXPECT_FALSE(result.usable());
        EXPECT_TRUE(result.hasErrors());
        ASSERT_EQ(result.internalErrors.size(), 1u);
        EXPECT_EQ(result.internalErrors[0].code, "STENCIL-I5001");
    }

    TEST(PipelineTest, KeepsReaderDiagnostics)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<p>@(unclosed</p>", "Reader.stencil", classifier);

        ASSERT_FALSE(result.diagnostics.empty());
        EXPECT_EQ(result.diagnostics[0].code, "STENCIL-E0001");
    }

    TEST(PipelineTest, FeedsRenderWriter)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<p>Hello @name</p>", "Hello.stencil", classifier);
        ASSERT_TRUE(result.usable());

        emit::RenderWriter writer;
        ASSERT_TRUE(writer.write(result.document));

        const std::string expected = "builder.openElement(\"p\");\n"
                                     "builder.addContent(\"Hello \");\n"
                                     "builder.addContent(name);\n"
                                     "builder.closeElement();\n";
        EXPECT_EQ(writer.output(), expected);
    }

    TEST(PipelineTest, WritesHolesInsideVoidTagsAsSiblings)
    {
        const passes::DescriptorClassifier classifier{};
        const auto result = compileTemplate("<p><input @attrs /><br @x>after</p>", "Void.stencil", classifier);
        ASSERT_TRUE(result.usable());

        emit::RenderWriter writer;
        ASSERT_TRUE(writer.write(result.document));

        const std::string expected = "builder.openElement(\"p\");\n"
                                     "builder.addContent(attrs);\n"
                                     "builder.openElement(\"input\");\n"
                                     "builder.closeElement();\n"
                                     "builder.addContent(x);\n"
                                     "builder.openElement(\"br\");\n"
                                     "builder.closeElement();\n"
                                     "builder.addContent(\"after\");\n"
                                     "builder.closeElement();\n";
        EXPECT_EQ(writer.output(), expected);
    }
} // namespace
} // namespace stencil
