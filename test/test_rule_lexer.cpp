// -*- c++ -*-
// Unit tests for RuleLexer

#include <gtest/gtest.h>

#include <vector>

#include "../src/rule_lexer.hpp"

using Bn::RuleLexer;
using Bn::RuleToken;
using Kind = RuleToken::Kind;

static std::vector<Kind> kinds(const std::string& expression) {
    std::vector<Kind> result;
    RuleLexer lexer(expression);
    for (const auto& token : lexer.tokens()) {
        result.push_back(token.kind);
    }
    return result;
}

TEST(RuleLexerTest, SymbolOperators) {
    std::vector<Kind> expected = {Kind::Not,        Kind::LParen, Kind::Identifier, Kind::And,
                                  Kind::Identifier, Kind::RParen, Kind::Or,         Kind::Identifier,
                                  Kind::End};
    EXPECT_EQ(kinds("!(a && b) || c"), expected);
}

TEST(RuleLexerTest, WordOperatorsAreCaseInsensitive) {
    std::vector<Kind> expected = {Kind::Not, Kind::Identifier, Kind::And, Kind::Identifier,
                                  Kind::Or,  Kind::Identifier, Kind::Xor, Kind::Identifier,
                                  Kind::Nand, Kind::True,      Kind::Nor, Kind::False,
                                  Kind::End};
    EXPECT_EQ(kinds("not a AND b Or c xor d NAND TRUE nor false"), expected);
}

TEST(RuleLexerTest, IdentifiersKeepTheirSpelling) {
    RuleLexer lexer("Gene_1 && _x9");
    ASSERT_EQ(lexer.tokens().size(), 4u);
    EXPECT_EQ(lexer.tokens()[0].text, "Gene_1");
    EXPECT_EQ(lexer.tokens()[2].text, "_x9");
}

TEST(RuleLexerTest, ColumnsAreOneBased) {
    RuleLexer lexer("a && b");
    ASSERT_EQ(lexer.tokens().size(), 4u);
    EXPECT_EQ(lexer.tokens()[0].column, 1u);
    EXPECT_EQ(lexer.tokens()[1].column, 3u);
    EXPECT_EQ(lexer.tokens()[2].column, 6u);
    EXPECT_EQ(lexer.tokens()[3].column, 7u);  // End sits past the last character
}

TEST(RuleLexerTest, EmptyInputIsJustEnd) {
    EXPECT_EQ(kinds(""), std::vector<Kind>{Kind::End});
    EXPECT_EQ(kinds("   \t"), std::vector<Kind>{Kind::End});
}

TEST(RuleLexerTest, SingleAmpersandIsInvalid) {
    RuleLexer lexer("a & b");
    ASSERT_EQ(lexer.tokens().size(), 4u);
    EXPECT_EQ(lexer.tokens()[1].kind, Kind::Invalid);
    EXPECT_EQ(lexer.tokens()[1].text, "&");
    EXPECT_EQ(lexer.tokens()[2].kind, Kind::Identifier);
}

TEST(RuleLexerTest, LeadingDigitRunIsOneInvalidToken) {
    RuleLexer lexer("9lives || a");
    ASSERT_GE(lexer.tokens().size(), 1u);
    EXPECT_EQ(lexer.tokens()[0].kind, Kind::Invalid);
    EXPECT_EQ(lexer.tokens()[0].text, "9lives");
    EXPECT_EQ(lexer.tokens()[1].kind, Kind::Or);
}

TEST(RuleLexerTest, MathSymbolsAreInvalid) {
    RuleLexer lexer("a + b = c");
    EXPECT_EQ(lexer.tokens()[1].kind, Kind::Invalid);
    EXPECT_EQ(lexer.tokens()[3].kind, Kind::Invalid);
    EXPECT_EQ(lexer.tokens()[3].text, "=");
}
