#include "derive/variant_name.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace vnc;
using namespace vnc::derive;

class ExtractTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto parse_item(const std::string& code) -> parser::Item {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lex(*source_);
        parser::Parser parser(lex.tokenize());
        auto result = parser.parse_single_item();
        EXPECT_TRUE(is_ok(result));
        if (is_ok(result)) {
            return std::move(unwrap(result));
        }
        return parser::Item{};
    }
};

// ============================================================================
// Enums
// ============================================================================

TEST_F(ExtractTest, BranchesInDeclarationOrder) {
    auto item = parse_item("enum Basic { Unit, Tuple(i32, i32), Struct { field: u8, other: i8 } }");
    auto result = extract_sum_type(item, DirectiveMode::Attachment);
    ASSERT_TRUE(is_ok(result));

    const auto& sum = unwrap(result);
    EXPECT_EQ(sum.name, "Basic");
    ASSERT_EQ(sum.branches.size(), 3u);

    EXPECT_EQ(sum.branches[0].name, "Unit");
    EXPECT_EQ(sum.branches[0].shape, BranchShape::Empty);

    EXPECT_EQ(sum.branches[1].name, "Tuple");
    EXPECT_EQ(sum.branches[1].shape, BranchShape::Positional);
    EXPECT_EQ(sum.branches[1].arity, 2u);

    EXPECT_EQ(sum.branches[2].name, "Struct");
    EXPECT_EQ(sum.branches[2].shape, BranchShape::Named);
    EXPECT_EQ(sum.branches[2].fields, (std::vector<std::string>{"field", "other"}));
}

TEST_F(ExtractTest, GenericsAndWhereClause) {
    auto item = parse_item("enum G<'a, T: Clone, const N: usize> where T: Copy { A(&'a [T; N]) }");
    auto result = extract_sum_type(item, DirectiveMode::Annotation);
    ASSERT_TRUE(is_ok(result));

    const auto& sum = unwrap(result);
    ASSERT_EQ(sum.generics.size(), 3u);
    EXPECT_EQ(sum.generics[0].name, "'a");
    EXPECT_EQ(sum.generics[1].bounds, "Clone");
    EXPECT_EQ(sum.generics[2].const_type, "usize");
    EXPECT_EQ(sum.where_predicates, (std::vector<std::string>{"T: Copy"}));
}

TEST_F(ExtractTest, EmptyEnum) {
    auto item = parse_item("enum Never {}");
    auto result = extract_sum_type(item, DirectiveMode::Annotation);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).branches.empty());
}

TEST_F(ExtractTest, DiscriminantsAreIgnored) {
    auto item = parse_item("#[repr(u8)] enum Code { Ok = 0, Err = 1 }");
    auto result = extract_sum_type(item, DirectiveMode::Annotation);
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).branches.size(), 2u);
    EXPECT_EQ(unwrap(result).branches[1].shape, BranchShape::Empty);
}

TEST_F(ExtractTest, CfgPredicatesFollowTheBranch) {
    auto item = parse_item("enum Feat {\n"
                           "    #[allow(dead_code)]\n"
                           "    A,\n"
                           "    #[cfg(any())]\n"
                           "    #[cfg_attr(test, allow(unused))]\n"
                           "    #[cfg(all(unix, feature = \"pipes\"))]\n"
                           "    Gone(u8),\n"
                           "}");
    auto result = extract_sum_type(item, DirectiveMode::Attachment);
    ASSERT_TRUE(is_ok(result));

    const auto& branches = unwrap(result).branches;
    ASSERT_EQ(branches.size(), 2u);
    EXPECT_TRUE(branches[0].cfg_predicates.empty());
    EXPECT_EQ(branches[1].cfg_predicates,
              (std::vector<std::string>{"any()", "all(unix, feature = \"pipes\")"}));
}

// ============================================================================
// Invalid Targets
// ============================================================================

TEST_F(ExtractTest, StructIsRejected) {
    auto item = parse_item("#[derive(Debug, EnumVariantNameConst)]\nstruct Pair<T> { left: T }");
    auto result = extract_sum_type(item, DirectiveMode::Annotation);
    ASSERT_TRUE(is_err(result));

    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.code, DeriveErrorCodes::INVALID_TARGET);
    EXPECT_EQ(err.message,
              "`#[derive(EnumVariantNameConst)]` is only applicable to sum types (enums)");
    ASSERT_EQ(err.notes.size(), 1u);
    EXPECT_EQ(err.notes[0], "`Pair` is a `struct` item");

    // Anchored at the type's name
    EXPECT_EQ(err.span.start.line, 2u);
    EXPECT_EQ(err.span.start.column, 8u);
    EXPECT_EQ(source_->text(err.span), "Pair");
}

TEST_F(ExtractTest, AttachmentRejectsTheSameTargets) {
    auto item = parse_item("#[enum_variant_name_const]\nunion Bits { a: u32, b: f32 }");
    auto result = extract_sum_type(item, DirectiveMode::Attachment);
    ASSERT_TRUE(is_err(result));

    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.code, DeriveErrorCodes::INVALID_TARGET);
    EXPECT_EQ(err.message, "`#[enum_variant_name_const]` is only applicable to sum types (enums)");
    EXPECT_EQ(err.notes[0], "`Bits` is a `union` item");
    EXPECT_EQ(source_->text(err.span), "Bits");
}

TEST_F(ExtractTest, UnnamedItemIsAnchoredAtKeyword) {
    auto item = parse_item("#[enum_variant_name_const]\nimpl Foo {}");
    auto result = extract_sum_type(item, DirectiveMode::Attachment);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).notes[0], "found `impl` item");
    EXPECT_EQ(source_->text(unwrap_err(result).span), "impl");
}

TEST_F(ExtractTest, FunctionIsRejected) {
    auto item = parse_item("#[enum_variant_name_const]\nfn helper() {}");
    auto result = extract_sum_type(item, DirectiveMode::Attachment);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).notes[0], "`helper` is a `fn` item");
}
