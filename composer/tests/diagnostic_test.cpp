//! # Diagnostic Tests
//!
//! Error codes, names and rendering of `ResolutionError`.

#include "error/diagnostic.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace smc;

TEST(DiagnosticTest, CodesAreStable) {
    EXPECT_STREQ(error_code(ErrorKind::DirectiveSyntax), "R001");
    EXPECT_STREQ(error_code(ErrorKind::UnresolvedImport), "R002");
    EXPECT_STREQ(error_code(ErrorKind::CyclicImport), "R003");
    EXPECT_STREQ(error_code(ErrorKind::UndefinedMacro), "R004");
    EXPECT_STREQ(error_code(ErrorKind::UnsupportedMacroExpression), "R005");
    EXPECT_STREQ(error_code(ErrorKind::MacroSubstitution), "R006");
    EXPECT_STREQ(error_code(ErrorKind::UnresolvedReference), "R007");
    EXPECT_STREQ(error_code(ErrorKind::BindingSlotCollision), "R008");
    EXPECT_STREQ(error_code(ErrorKind::MacroShadowing), "R009");
    EXPECT_STREQ(error_code(ErrorKind::BindingLimit), "R010");
}

TEST(DiagnosticTest, KindNames) {
    EXPECT_STREQ(error_kind_name(ErrorKind::CyclicImport), "CyclicImportError");
    EXPECT_STREQ(error_kind_name(ErrorKind::BindingSlotCollision), "BindingSlotCollisionError");
}

TEST(DiagnosticTest, ToStringWithLocation) {
    auto error = make_error(ErrorKind::UndefinedMacro, "undefined macro '#X'", "a/b.wgsl", 7);
    EXPECT_EQ(error.code(), std::string("R004"));
    EXPECT_EQ(error.to_string(), "a/b.wgsl:7: error[R004]: undefined macro '#X'");
}

TEST(DiagnosticTest, ToStringWithoutLineOrFragment) {
    auto in_file = make_error(ErrorKind::UnresolvedImport, "gone", "main.wgsl");
    EXPECT_EQ(in_file.to_string(), "main.wgsl: error[R002]: gone");

    auto no_file = make_error(ErrorKind::UnresolvedImport, "gone");
    EXPECT_EQ(no_file.to_string(), "<root>: error[R002]: gone");
}

TEST(DiagnosticTest, FormatListsRelatedItems) {
    auto error = make_error(ErrorKind::CyclicImport, "import cycle: a -> b -> a", "b", 1);
    error.related = {"a", "b"};

    EXPECT_EQ(format_error(error, false), "b:1: error[R003]: import cycle: a -> b -> a\n"
                                          "  note: a\n"
                                          "  note: b");
}

TEST(DiagnosticTest, FormatWithColors) {
    auto error = make_error(ErrorKind::BindingLimit, "too many", "x.wgsl", 2);
    auto colored = format_error(error, true);

    EXPECT_NE(colored.find("\033["), std::string::npos);
    EXPECT_NE(colored.find("error[R010]"), std::string::npos);
    EXPECT_NE(colored.find("too many"), std::string::npos);
}
