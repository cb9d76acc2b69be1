//! # Item Syntax Tree
//!
//! The parser keeps only what code generation and pass-through need from a
//! Rust item: its attributes, visibility, kind, name, generic header and,
//! for enums, the branch list with field shapes. Everything else (function
//! bodies, field types, discriminant expressions) is skipped over but still
//! covered by the item's span, so the original text can be reproduced
//! byte-for-byte from the `Source`.
//!
//! ## Rendered Text
//!
//! Bounds, types and where predicates are stored as rendered text: the
//! token lexemes joined with a single space wherever the source had any
//! whitespace or comment between them. `T:Clone` therefore renders its
//! bound as `Clone` and a bound split over lines comes out on one line.

#ifndef VNC_PARSER_AST_HPP
#define VNC_PARSER_AST_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace vnc::parser {

// ============================================================================
// Attributes
// ============================================================================

/// An outer (`#[...]`, `///`) or inner (`#![...]`, `//!`) attribute.
struct Attribute {
    /// Path text with segments joined by `::` (`derive`, `serde::rename`).
    /// Doc comments use the path `doc`.
    std::string path;

    /// Rendered tokens inside the delimiters or after `=`. For doc comments
    /// this is the comment lexeme.
    std::string args;

    /// For `derive(...)`: every listed path, segments joined by `::`.
    std::vector<std::string> derive_paths;

    bool is_inner = false;
    bool is_doc = false;

    /// From `#` (or the comment start) to the closing `]`.
    SourceSpan span;
};

// ============================================================================
// Visibility
// ============================================================================

enum class VisibilityKind {
    Private, ///< no modifier
    Public,  ///< `pub`
    Crate,   ///< `pub(crate)`
    Super,   ///< `pub(super)`
    SelfMod, ///< `pub(self)`
    InPath   ///< `pub(in path)`
};

struct Visibility {
    VisibilityKind kind = VisibilityKind::Private;
    std::string path; ///< Only for `InPath`.
};

// ============================================================================
// Generics
// ============================================================================

enum class GenericParamKind { Lifetime, Type, Const };

/// One parameter of a generic header, in declaration order.
struct GenericParam {
    GenericParamKind kind;

    /// Lifetimes keep the apostrophe: `'a`.
    std::string name;

    /// Rendered bounds after `:`, empty when unbounded.
    /// `'a: 'b + 'c` gives `'b + 'c`, `T: Clone + 'a` gives `Clone + 'a`.
    std::string bounds;

    /// Rendered type of a const parameter (`usize`).
    std::string const_type;

    /// Rendered default after `=`, empty when absent.
    std::string default_value;

    SourceSpan span;
};

/// A `where` clause: predicates in order, each rendered without the
/// separating commas.
struct WhereClause {
    std::vector<std::string> predicates;
    SourceSpan span;
};

// ============================================================================
// Enum Variants
// ============================================================================

enum class VariantShape {
    Unit,  ///< `A`
    Tuple, ///< `A(u8, u16)`, also `A()`
    Record ///< `A { x: u8 }`, also `A {}`
};

struct Variant {
    /// Identifier text exactly as written, including an `r#` prefix.
    std::string name;
    SourceSpan name_span;
    VariantShape shape = VariantShape::Unit;

    /// Number of tuple fields; zero for other shapes.
    size_t tuple_arity = 0;

    /// Record field names in order; empty for other shapes.
    std::vector<std::string> record_fields;

    /// True when written `A = expr`.
    bool has_discriminant = false;

    std::vector<Attribute> attributes;
    SourceSpan span;
};

// ============================================================================
// Items
// ============================================================================

enum class ItemKind {
    Enum,
    Struct,
    Union,
    Function,
    Impl,
    Trait,
    TypeAlias,
    Const,
    Static,
    Module,
    Use,
    ExternCrate,
    ExternBlock,
    MacroRules,
    MacroCall,
};

/// A top-level or module-level item.
struct Item {
    ItemKind kind;
    std::vector<Attribute> attributes;
    Visibility visibility;

    /// Empty for items without a name (`impl`, `use`, `extern` blocks,
    /// macro invocations).
    std::string name;

    /// Span of the name, or of the item keyword when there is no name.
    SourceSpan name_span;

    /// Span of the keyword that decides the kind (`enum`, `struct`, ...).
    SourceSpan keyword_span;

    std::vector<GenericParam> generics;
    std::optional<WhereClause> where_clause;

    /// Enum branches in declaration order.
    std::vector<Variant> variants;

    /// Items of an inline `mod name { ... }`.
    std::vector<Item> children;

    /// From the first attribute (or visibility/keyword when there is none)
    /// to the last token of the item.
    SourceSpan span;
};

/// A parsed file.
struct Module {
    std::string name;
    std::vector<Attribute> inner_attributes;
    std::vector<Item> items;
};

/// Lower-case keyword-style name of an item kind (`enum`, `fn`, `macro`).
[[nodiscard]] auto item_kind_name(ItemKind kind) -> std::string_view;

} // namespace vnc::parser

#endif // VNC_PARSER_AST_HPP
