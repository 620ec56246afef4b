//! # Scanner Tests
//!
//! Token kinds, comment handling, macro and qualified references, and the
//! lossless property the rewriters rely on.

#include "directive/scanner.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace smc::directive;

class ScannerTest : public ::testing::Test {
protected:
    std::vector<Token> significant(std::string_view source) {
        std::vector<Token> result;
        for (const auto& tok : tokenize(source)) {
            if (tok.is_significant()) {
                result.push_back(tok);
            }
        }
        return result;
    }
};

// ============================================================================
// Token Kinds
// ============================================================================

TEST_F(ScannerTest, IdentifiersNumbersAndPunctuation) {
    auto tokens = significant("let x = 12u;");

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[0].lexeme, "let");
    EXPECT_EQ(tokens[1].lexeme, "x");
    EXPECT_TRUE(tokens[2].is_punct('='));
    EXPECT_EQ(tokens[3].kind, TokenKind::Number);
    EXPECT_EQ(tokens[3].lexeme, "12u");
    EXPECT_TRUE(tokens[4].is_punct(';'));
}

TEST_F(ScannerTest, FloatLiteralIsOneToken) {
    auto tokens = significant("1.5");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Number);
    EXPECT_EQ(tokens[0].lexeme, "1.5");
}

TEST_F(ScannerTest, MacroReference) {
    auto tokens = significant("@group(#CAMERA_GROUP)");

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[3].kind, TokenKind::MacroRef);
    EXPECT_EQ(tokens[3].lexeme, "#CAMERA_GROUP");
    EXPECT_EQ(tokens[3].macro_name(), "CAMERA_GROUP");
}

TEST_F(ScannerTest, HashWithoutIdentifierIsPunct) {
    auto tokens = significant("# 1");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_TRUE(tokens[0].is_punct('#'));
}

TEST_F(ScannerTest, QualifiedReference) {
    auto tokens = significant("camera::CameraUniform");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Qualified);
    EXPECT_EQ(tokens[0].qualifier(), "camera");
    EXPECT_EQ(tokens[0].member(), "CameraUniform");
}

TEST_F(ScannerTest, SpacedColonsAreNotQualified) {
    auto tokens = significant("a :: b");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_TRUE(tokens[1].is_punct(':'));
}

// ============================================================================
// Comments and Lines
// ============================================================================

TEST_F(ScannerTest, CommentsHideReferences) {
    auto tokens = significant("// #NOT_A_MACRO\n/* a::b */ x");

    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].lexeme, "x");
}

TEST_F(ScannerTest, NestedBlockComments) {
    auto tokens = tokenize("/* outer /* inner */ still comment */ y");

    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[0].lexeme, "/* outer /* inner */ still comment */");
    EXPECT_EQ(tokens.back().lexeme, "y");
}

TEST_F(ScannerTest, TracksLines) {
    auto tokens = significant("a\n/* one\ntwo */\nb");

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].line, 1u);
    EXPECT_EQ(tokens[1].line, 4u);
}

TEST_F(ScannerTest, ConcatenatedLexemesReproduceSource) {
    std::string source = "struct A {\n  x: f32, // c\n}\n/* b */ @group(#G) var t: T;\r\n";
    std::string rebuilt;
    for (const auto& tok : tokenize(source)) {
        rebuilt += tok.lexeme;
    }
    EXPECT_EQ(rebuilt, source);
}

// ============================================================================
// Identifier Helpers
// ============================================================================

TEST(IdentifierTest, Classification) {
    EXPECT_TRUE(is_identifier("camera"));
    EXPECT_TRUE(is_identifier("_private2"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("2d"));
    EXPECT_FALSE(is_identifier("font-vertex"));
}
