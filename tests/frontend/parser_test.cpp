#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace vnc;
using namespace vnc::parser;

class ParserTest : public ::testing::Test {
protected:
    // Keep source alive so token lexemes stay valid while parsing
    std::unique_ptr<lexer::Source> source_;

    auto parse(const std::string& code) -> Module {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lex(*source_);
        auto tokens = lex.tokenize();
        Parser parser(std::move(tokens));
        auto result = parser.parse_module("test");
        EXPECT_TRUE(is_ok(result)) << first_error(result);
        if (is_ok(result)) {
            return std::move(unwrap(result));
        }
        return Module{};
    }

    auto parse_errors(const std::string& code) -> std::vector<ParseError> {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lex(*source_);
        auto tokens = lex.tokenize();
        Parser parser(std::move(tokens));
        auto result = parser.parse_module("test");
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }

    auto parse_one(const std::string& code) -> Result<Item, ParseError> {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lex(*source_);
        auto tokens = lex.tokenize();
        Parser parser(std::move(tokens));
        return parser.parse_single_item();
    }

    static auto first_error(const Result<Module, std::vector<ParseError>>& result)
        -> std::string {
        if (is_ok(result) || unwrap_err(result).empty()) {
            return "";
        }
        return unwrap_err(result).front().message;
    }
};

// ============================================================================
// Enums
// ============================================================================

TEST_F(ParserTest, EnumVariantShapes) {
    auto module = parse("enum Basic { Unit, Tuple(i32, i32), Struct { field: u8 } }");
    ASSERT_EQ(module.items.size(), 1u);

    const auto& item = module.items[0];
    EXPECT_EQ(item.kind, ItemKind::Enum);
    EXPECT_EQ(item.name, "Basic");
    ASSERT_EQ(item.variants.size(), 3u);

    EXPECT_EQ(item.variants[0].name, "Unit");
    EXPECT_EQ(item.variants[0].shape, VariantShape::Unit);

    EXPECT_EQ(item.variants[1].name, "Tuple");
    EXPECT_EQ(item.variants[1].shape, VariantShape::Tuple);
    EXPECT_EQ(item.variants[1].tuple_arity, 2u);

    EXPECT_EQ(item.variants[2].name, "Struct");
    EXPECT_EQ(item.variants[2].shape, VariantShape::Record);
    ASSERT_EQ(item.variants[2].record_fields.size(), 1u);
    EXPECT_EQ(item.variants[2].record_fields[0], "field");
}

TEST_F(ParserTest, EmptyFieldListsKeepTheirShape) {
    auto module = parse("enum E { A(), B {}, }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& variants = module.items[0].variants;
    ASSERT_EQ(variants.size(), 2u);
    EXPECT_EQ(variants[0].shape, VariantShape::Tuple);
    EXPECT_EQ(variants[0].tuple_arity, 0u);
    EXPECT_EQ(variants[1].shape, VariantShape::Record);
    EXPECT_TRUE(variants[1].record_fields.empty());
}

TEST_F(ParserTest, EnumWithoutVariants) {
    auto module = parse("pub enum Never {}");
    ASSERT_EQ(module.items.size(), 1u);
    EXPECT_EQ(module.items[0].visibility.kind, VisibilityKind::Public);
    EXPECT_TRUE(module.items[0].variants.empty());
}

TEST_F(ParserTest, TupleFieldsWithNestedTypes) {
    auto module = parse("enum E { A(HashMap<String, Vec<u8>>, [u8; 4], fn(u8) -> u8) }");
    ASSERT_EQ(module.items.size(), 1u);
    EXPECT_EQ(module.items[0].variants[0].tuple_arity, 3u);
}

TEST_F(ParserTest, Discriminants) {
    auto module = parse("#[repr(u8)] enum Flags { A = 1, B = 1 << 2, C }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& variants = module.items[0].variants;
    ASSERT_EQ(variants.size(), 3u);
    EXPECT_TRUE(variants[0].has_discriminant);
    EXPECT_TRUE(variants[1].has_discriminant);
    EXPECT_FALSE(variants[2].has_discriminant);
}

TEST_F(ParserTest, VariantAttributesAndRawNames) {
    auto module = parse("enum Keywords {\n"
                        "    /// The type keyword\n"
                        "    #[allow(non_camel_case_types)]\n"
                        "    r#type,\n"
                        "    #[cfg(test)] Other { pub(crate) r#ref: u8 },\n"
                        "}");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& variants = module.items[0].variants;
    ASSERT_EQ(variants.size(), 2u);
    EXPECT_EQ(variants[0].name, "r#type");
    EXPECT_EQ(variants[0].attributes.size(), 2u);
    EXPECT_TRUE(variants[0].attributes[0].is_doc);
    EXPECT_EQ(variants[1].record_fields[0], "r#ref");
}

TEST_F(ParserTest, NameSpanPointsAtIdentifier) {
    auto module = parse("#[derive(Debug)]\npub enum Color { Red }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& item = module.items[0];
    EXPECT_EQ(item.name_span.start.line, 2u);
    EXPECT_EQ(item.name_span.start.column, 10u);
    EXPECT_EQ(source_->text(item.name_span), "Color");
    EXPECT_EQ(source_->text(item.keyword_span), "enum");
    // The item span starts at its first attribute
    EXPECT_EQ(item.span.start.offset, 0u);
    EXPECT_EQ(item.span.end.offset, source_->length());
}

// ============================================================================
// Generics
// ============================================================================

TEST_F(ParserTest, GenericParameters) {
    auto module = parse("enum G<'a: 'b, 'b, T: Clone + 'a = u8, const N: usize = 4> { A }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& generics = module.items[0].generics;
    ASSERT_EQ(generics.size(), 4u);

    EXPECT_EQ(generics[0].kind, GenericParamKind::Lifetime);
    EXPECT_EQ(generics[0].name, "'a");
    EXPECT_EQ(generics[0].bounds, "'b");

    EXPECT_EQ(generics[1].name, "'b");
    EXPECT_TRUE(generics[1].bounds.empty());

    EXPECT_EQ(generics[2].kind, GenericParamKind::Type);
    EXPECT_EQ(generics[2].name, "T");
    EXPECT_EQ(generics[2].bounds, "Clone + 'a");
    EXPECT_EQ(generics[2].default_value, "u8");

    EXPECT_EQ(generics[3].kind, GenericParamKind::Const);
    EXPECT_EQ(generics[3].name, "N");
    EXPECT_EQ(generics[3].const_type, "usize");
    EXPECT_EQ(generics[3].default_value, "4");
}

TEST_F(ParserTest, NestedAnglesInBounds) {
    auto module = parse("enum E<T: Into<Vec<u8>>, U: Iterator<Item = u8>> { A(T, U) }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& generics = module.items[0].generics;
    ASSERT_EQ(generics.size(), 2u);
    EXPECT_EQ(generics[0].bounds, "Into<Vec<u8>>");
    EXPECT_EQ(generics[1].bounds, "Iterator<Item = u8>");
    EXPECT_TRUE(generics[1].default_value.empty());
}

TEST_F(ParserTest, WhereClause) {
    auto module = parse("enum W<T>\nwhere\n    T: Into<Vec<u8>>,\n    T:Copy,\n{ A(T) }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& where = module.items[0].where_clause;
    ASSERT_TRUE(where.has_value());
    ASSERT_EQ(where->predicates.size(), 2u);
    EXPECT_EQ(where->predicates[0], "T: Into<Vec<u8>>");
    EXPECT_EQ(where->predicates[1], "T:Copy");
}

TEST_F(ParserTest, HigherRankedWherePredicate) {
    auto module = parse("enum F<T> where for<'x> T: Fn(&'x u8) -> bool { A(T) }");
    ASSERT_EQ(module.items.size(), 1u);
    ASSERT_TRUE(module.items[0].where_clause.has_value());
    ASSERT_EQ(module.items[0].where_clause->predicates.size(), 1u);
    EXPECT_EQ(module.items[0].where_clause->predicates[0], "for<'x> T: Fn(&'x u8) -> bool");
}

// ============================================================================
// Attributes
// ============================================================================

TEST_F(ParserTest, DerivePaths) {
    auto module = parse("#[derive(Debug, crate::EnumVariantNameConst, Clone)]\nenum E { A }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& attrs = module.items[0].attributes;
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs[0].path, "derive");
    ASSERT_EQ(attrs[0].derive_paths.size(), 3u);
    EXPECT_EQ(attrs[0].derive_paths[0], "Debug");
    EXPECT_EQ(attrs[0].derive_paths[1], "crate::EnumVariantNameConst");
    EXPECT_EQ(attrs[0].derive_paths[2], "Clone");
}

TEST_F(ParserTest, AttributeForms) {
    auto module = parse("#[my_crate::marker]\n#[doc = \"text\"]\n#[cfg_attr(test, derive(Debug))]\n"
                        "enum E { A }");
    ASSERT_EQ(module.items.size(), 1u);
    const auto& attrs = module.items[0].attributes;
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[0].path, "my_crate::marker");
    EXPECT_TRUE(attrs[0].args.empty());
    EXPECT_EQ(attrs[1].path, "doc");
    EXPECT_EQ(attrs[1].args, "\"text\"");
    EXPECT_EQ(attrs[2].path, "cfg_attr");
    EXPECT_EQ(attrs[2].args, "test, derive(Debug)");
    EXPECT_TRUE(attrs[2].derive_paths.empty());
}

TEST_F(ParserTest, InnerAttributesBelongToModule) {
    auto module = parse("#![allow(dead_code)]\n//! Crate docs\nenum E { A }");
    ASSERT_EQ(module.inner_attributes.size(), 2u);
    EXPECT_TRUE(module.inner_attributes[0].is_inner);
    EXPECT_EQ(module.inner_attributes[0].path, "allow");
    EXPECT_TRUE(module.inner_attributes[1].is_doc);
    ASSERT_EQ(module.items.size(), 1u);
    EXPECT_TRUE(module.items[0].attributes.empty());
}

// ============================================================================
// Visibility
// ============================================================================

TEST_F(ParserTest, RestrictedVisibility) {
    auto module = parse("pub(crate) enum A { X }\npub(super) enum B { X }\n"
                        "pub(in crate::outer) enum C { X }\nenum D { X }");
    ASSERT_EQ(module.items.size(), 4u);
    EXPECT_EQ(module.items[0].visibility.kind, VisibilityKind::Crate);
    EXPECT_EQ(module.items[1].visibility.kind, VisibilityKind::Super);
    EXPECT_EQ(module.items[2].visibility.kind, VisibilityKind::InPath);
    EXPECT_EQ(module.items[2].visibility.path, "crate::outer");
    EXPECT_EQ(module.items[3].visibility.kind, VisibilityKind::Private);
}

// ============================================================================
// Other Items
// ============================================================================

TEST_F(ParserTest, StructForms) {
    auto module = parse("struct Unit;\nstruct Pair<T>(T, T) where T: Copy;\n"
                        "pub struct Named { a: u8, pub b: Vec<u8> }\n"
                        "union Bits { int: u32, float: f32 }");
    ASSERT_EQ(module.items.size(), 4u);
    EXPECT_EQ(module.items[0].kind, ItemKind::Struct);
    EXPECT_EQ(module.items[0].name, "Unit");
    EXPECT_EQ(module.items[1].name, "Pair");
    EXPECT_EQ(module.items[1].generics.size(), 1u);
    ASSERT_TRUE(module.items[1].where_clause.has_value());
    EXPECT_EQ(module.items[2].name, "Named");
    EXPECT_EQ(module.items[3].kind, ItemKind::Union);
    EXPECT_EQ(module.items[3].name, "Bits");
}

TEST_F(ParserTest, SkippedItems) {
    auto module = parse("use std::fmt::{self, Display};\n"
                        "extern crate alloc;\n"
                        "const NAME: &str = { \"x\" };\n"
                        "static mut COUNT: u32 = 0;\n"
                        "type Alias<T> = Vec<T>;\n"
                        "pub const fn make() -> u8 { 1 }\n"
                        "impl<T> Display for Wrapper<T> { fn fmt(&self) {} }\n"
                        "unsafe impl Send for Wrapper {}\n"
                        "trait Named { fn name(&self) -> &str; }\n"
                        "extern \"C\" { fn abs(x: i32) -> i32; }\n"
                        "macro_rules! square { ($x:expr) => { $x * $x }; }\n"
                        "thread_local! { static X: u8 = 0; }\n"
                        "std::println!(\"hi\");\n"
                        "enum After { A }");
    ASSERT_EQ(module.items.size(), 14u);

    EXPECT_EQ(module.items[0].kind, ItemKind::Use);
    EXPECT_EQ(module.items[1].kind, ItemKind::ExternCrate);
    EXPECT_EQ(module.items[2].kind, ItemKind::Const);
    EXPECT_EQ(module.items[2].name, "NAME");
    EXPECT_EQ(module.items[3].kind, ItemKind::Static);
    EXPECT_EQ(module.items[3].name, "COUNT");
    EXPECT_EQ(module.items[4].kind, ItemKind::TypeAlias);
    EXPECT_EQ(module.items[5].kind, ItemKind::Function);
    EXPECT_EQ(module.items[5].name, "make");
    EXPECT_EQ(module.items[6].kind, ItemKind::Impl);
    EXPECT_TRUE(module.items[6].name.empty());
    EXPECT_EQ(module.items[7].kind, ItemKind::Impl);
    EXPECT_EQ(module.items[8].kind, ItemKind::Trait);
    EXPECT_EQ(module.items[9].kind, ItemKind::ExternBlock);
    EXPECT_EQ(module.items[10].kind, ItemKind::MacroRules);
    EXPECT_EQ(module.items[10].name, "square");
    EXPECT_EQ(module.items[11].kind, ItemKind::MacroCall);
    EXPECT_EQ(module.items[11].name, "thread_local");
    EXPECT_EQ(module.items[12].kind, ItemKind::MacroCall);
    EXPECT_EQ(module.items[12].name, "std::println");
    EXPECT_EQ(module.items[13].kind, ItemKind::Enum);
    EXPECT_EQ(module.items[13].name, "After");
}

TEST_F(ParserTest, InlineModuleChildren) {
    auto module = parse("mod outer {\n"
                        "    use super::*;\n"
                        "    pub mod inner { enum Deep { A } }\n"
                        "    enum Shallow { B }\n"
                        "}\n"
                        "mod external;");
    ASSERT_EQ(module.items.size(), 2u);

    const auto& outer = module.items[0];
    EXPECT_EQ(outer.kind, ItemKind::Module);
    EXPECT_EQ(outer.name, "outer");
    ASSERT_EQ(outer.children.size(), 3u);
    EXPECT_EQ(outer.children[1].kind, ItemKind::Module);
    ASSERT_EQ(outer.children[1].children.size(), 1u);
    EXPECT_EQ(outer.children[1].children[0].name, "Deep");
    EXPECT_EQ(outer.children[2].name, "Shallow");

    EXPECT_EQ(module.items[1].name, "external");
    EXPECT_TRUE(module.items[1].children.empty());
}

TEST_F(ParserTest, ItemKindNames) {
    EXPECT_EQ(item_kind_name(ItemKind::Enum), "enum");
    EXPECT_EQ(item_kind_name(ItemKind::Struct), "struct");
    EXPECT_EQ(item_kind_name(ItemKind::Function), "fn");
    EXPECT_EQ(item_kind_name(ItemKind::Module), "mod");
}

// ============================================================================
// Single Items
// ============================================================================

TEST_F(ParserTest, SingleItem) {
    auto result = parse_one("/// Docs\n#[derive(Clone)]\nenum One { A, B }\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).name, "One");
    EXPECT_EQ(unwrap(result).attributes.size(), 2u);
}

TEST_F(ParserTest, SingleItemRejectsTrailingItems) {
    auto result = parse_one("enum One { A }\nenum Two { B }");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, ParseErrorCodes::NOT_SINGLE_ITEM);
    EXPECT_EQ(unwrap_err(result).span.start.line, 2u);
}

TEST_F(ParserTest, SingleItemReportsEmptyInput) {
    auto result = parse_one("   ");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, ParseErrorCodes::EXPECTED_ITEM);
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ParserTest, MissingEnumName) {
    auto errors = parse_errors("enum { A }");
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].code, ParseErrorCodes::EXPECTED_IDENTIFIER);
    EXPECT_EQ(errors[0].message, "expected enum name, found `{`");
}

TEST_F(ParserTest, MismatchedDelimiter) {
    auto errors = parse_errors("enum E { A(u8] }");
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].code, ParseErrorCodes::UNBALANCED_DELIMITER);
}

TEST_F(ParserTest, RecoversAtNextItem) {
    auto errors = parse_errors("enum 7 { A }\nenum Fine { C }\nstruct 42;");
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].span.start.line, 1u);
    EXPECT_EQ(errors[1].span.start.line, 3u);
}
