#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tokenizer.hpp"

namespace stencil::markup
{
namespace
{
    std::vector<Token> tokenizeAll(Tokenizer& tokenizer)
    {
        std::vector<Token> tokens;
        for (Token token = tokenizer.next(); token.kind != TokenKind::EndOfInput; token = tokenizer.next())
        {
            tokens.push_back(token);
        }
        return tokens;
    }

    TEST(TokenizerTest, SplitsTextAndTags)
    {
        const std::string input = "<p class=\"lead\">Hello</p>";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 3u);
        EXPECT_EQ(tokens[0].kind, TokenKind::StartTag);
        EXPECT_EQ(tokens[0].name, "p");
        ASSERT_EQ(tokens[0].attributes.size(), 1u);
        EXPECT_EQ(tokens[0].attributes[0].name, "class");
        EXPECT_EQ(tokens[0].attributes[0].value, "lead");
        EXPECT_EQ(tokens[1].kind, TokenKind::Text);
        EXPECT_EQ(tokens[1].data, "Hello");
        EXPECT_EQ(tokens[2].kind, TokenKind::EndTag);
        EXPECT_EQ(tokens[2].name, "p");
        EXPECT_FALSE(tokenizer.hasRemainder());
        EXPECT_EQ(tokenizer.stopOffset(), input.size());
    }

    TEST(TokenizerTest, FoldsTagNameButReportsOriginalSpelling)
    {
        const std::string input = "<DiV></dIv>";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 2u);
        EXPECT_EQ(tokens[0].name, "div");
        EXPECT_EQ(input.substr(tokens[0].nameOffset, tokens[0].nameLength), "DiV");
        EXPECT_EQ(tokens[1].name, "div");
        EXPECT_EQ(input.substr(tokens[1].nameOffset, tokens[1].nameLength), "dIv");
    }

    TEST(TokenizerTest, KeepsAttributesInWrittenOrder)
    {
        const std::string input = "<a z=\"1\" y='2' x=3 w>";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 1u);
        const auto& attributes = tokens[0].attributes;
        ASSERT_EQ(attributes.size(), 4u);
        EXPECT_EQ(attributes[0].name, "z");
        EXPECT_EQ(attributes[0].value, "1");
        EXPECT_EQ(attributes[1].name, "y");
        EXPECT_EQ(attributes[1].value, "2");
        EXPECT_EQ(attributes[2].name, "x");
        EXPECT_EQ(attributes[2].value, "3");
        EXPECT_EQ(attributes[3].name, "w");
        EXPECT_FALSE(attributes[3].hasValue);
        EXPECT_EQ(input.substr(attributes[0].valueBegin, attributes[0].valueEnd - attributes[0].valueBegin), "1");
    }

    TEST(TokenizerTest, RecognizesSelfClosingTags)
    {
        const std::string input = "<br/><hr />";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 2u);
        EXPECT_TRUE(tokens[0].selfClosing);
        EXPECT_TRUE(tokens[1].selfClosing);
    }

    TEST(TokenizerTest, PreservesTextByteForByte)
    {
        const std::string input = "  a &amp; b < c\n\t";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].kind, TokenKind::Text);
        EXPECT_EQ(tokens[0].data, input);
    }

    TEST(TokenizerTest, ReportsCommentsAndDeclarations)
    {
        const std::string input = "<!DOCTYPE html><!-- note -->text";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 3u);
        EXPECT_EQ(tokens[0].kind, TokenKind::Comment);
        EXPECT_EQ(tokens[0].data, "DOCTYPE html");
        EXPECT_EQ(tokens[1].kind, TokenKind::Comment);
        EXPECT_EQ(tokens[1].data, " note ");
        EXPECT_EQ(tokens[2].kind, TokenKind::Text);
    }

    TEST(TokenizerTest, StopsAtUnterminatedStartTag)
    {
        const std::string input = "before<foo bar=\"17\" baz=\"";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].data, "before");
        EXPECT_TRUE(tokenizer.hasRemainder());
        EXPECT_EQ(tokenizer.stopOffset(), 6u);
        EXPECT_EQ(input.substr(tokenizer.stopOffset()), "<foo bar=\"17\" baz=\"");
    }

    TEST(TokenizerTest, StopsAtTagMissingClosingBracket)
    {
        const std::string input = "<foo bar=\"17\"";

        Tokenizer tokenizer{input};
        EXPECT_EQ(tokenizer.next().kind, TokenKind::EndOfInput);
        EXPECT_EQ(tokenizer.stopOffset(), 0u);
        EXPECT_EQ(tokenizer.next().kind, TokenKind::EndOfInput);
    }

    TEST(TokenizerTest, StopsAtUnterminatedComment)
    {
        const std::string input = "x<!-- open";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokenizer.stopOffset(), 1u);
    }

    TEST(TokenizerTest, TreatsLessThanWithoutTagAsText)
    {
        const std::string input = "1 < 2 </ 3 <";

        Tokenizer tokenizer{input};
        const auto tokens = tokenizeAll(tokenizer);

        ASSERT_EQ(tokens.size(), 1u);
        EXPECT_EQ(tokens[0].data, input);
        EXPECT_FALSE(tokenizer.hasRemainder());
    }
} // namespace
} // namespace stencil::markup
