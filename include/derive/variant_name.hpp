//! # Variant Name Derive
//!
//! Generates `variant_name()` for an enum:
//!
//! ```rust
//! impl<'a, T, const N: usize> Generic<'a, T, N> {
//!     /// Compile-time string with the variant's identifier.
//!     #[inline(always)]
//!     pub const fn variant_name(&self) -> &'static str {
//!         match self {
//!             Self::Empty => "Empty",
//!             Self::Ref(..) => "Ref",
//!             Self::Array { .. } => "Array",
//!         }
//!     }
//! }
//! ```
//!
//! ## Pipeline
//!
//! | Stage                 | Function              | Fails        |
//! |-----------------------|-----------------------|--------------|
//! | Extract declaration   | `extract_sum_type()`  | D001         |
//! | Synthesize patterns   | `synthesize_pattern()`| never        |
//! | Preserve generics     | `preserve_generics()` | never        |
//! | Emit the impl block   | `emit_dispatch()`     | never        |
//!
//! Every stage is a pure function of its input, so the same declaration
//! always produces the same bytes.

#ifndef VNC_DERIVE_VARIANT_NAME_HPP
#define VNC_DERIVE_VARIANT_NAME_HPP

#include "common.hpp"
#include "derive/registry.hpp"
#include "format/writer.hpp"
#include "parser/ast.hpp"

#include <string>
#include <vector>

namespace vnc::derive {

namespace DeriveErrorCodes {
constexpr const char* INVALID_TARGET = "D001";
} // namespace DeriveErrorCodes

/// Reported when a directive is placed on something other than an enum.
struct DeriveError {
    std::string message;

    /// The type's name, or the item keyword for unnamed items.
    SourceSpan span;

    std::vector<std::string> notes;
    std::string code;
};

// ============================================================================
// Sum Type Model
// ============================================================================

/// Payload shape of a branch. Field counts and names never reach the
/// generated patterns.
enum class BranchShape {
    Empty,      ///< `A`
    Positional, ///< `A(T, U)`
    Named       ///< `A { x: T }`
};

struct Branch {
    /// Identifier text exactly as declared.
    std::string name;
    BranchShape shape = BranchShape::Empty;

    /// Positional field count.
    size_t arity = 0;

    /// Named field names in order.
    std::vector<std::string> fields;

    /// Predicates of the variant's `#[cfg(...)]` attributes. The arm is
    /// gated the same way so it disappears together with the variant.
    std::vector<std::string> cfg_predicates;
};

/// An enum reduced to what the generator needs.
struct SumType {
    std::string name;
    SourceSpan name_span;
    std::vector<parser::GenericParam> generics;
    std::vector<std::string> where_predicates;

    /// Declaration order.
    std::vector<Branch> branches;
};

/// Checks that `item` is an enum and reduces it to a `SumType`.
///
/// Both directive modes apply the same check, so a struct under
/// `#[enum_variant_name_const]` is rejected exactly like one under
/// `#[derive(EnumVariantNameConst)]`.
[[nodiscard]] auto extract_sum_type(const parser::Item& item, DirectiveMode mode)
    -> Result<SumType, DeriveError>;

// ============================================================================
// Patterns
// ============================================================================

/// A match arm before rendering: `Self::A(..)` paired with `"A"`.
struct BranchPattern {
    std::string pattern;
    std::string literal;

    /// `#[cfg(...)]` lines printed above the arm.
    std::vector<std::string> attributes;
};

/// Builds the wildcard pattern and the name literal for one branch.
[[nodiscard]] auto synthesize_pattern(const Branch& branch) -> BranchPattern;

/// Patterns for every branch in declaration order.
[[nodiscard]] auto synthesize_patterns(const SumType& sum) -> std::vector<BranchPattern>;

// ============================================================================
// Generics
// ============================================================================

/// The three renderings of a type's generic header.
///
/// For `enum E<'a: 'b, T: Clone = u8, const N: usize = 4> where T: Copy`:
///
/// | Field              | Text                                    |
/// |--------------------|-----------------------------------------|
/// | `impl_params`      | `<'a: 'b, T: Clone, const N: usize>`    |
/// | `type_args`        | `<'a, T, N>`                            |
/// | `where_predicates` | `T: Copy`                               |
///
/// Both lists are empty strings when the type has no parameters.
struct GenericSignature {
    std::string impl_params;
    std::string type_args;
    std::vector<std::string> where_predicates;
};

[[nodiscard]] auto preserve_generics(const SumType& sum) -> GenericSignature;

// ============================================================================
// Emission
// ============================================================================

/// Name of the generated accessor.
constexpr const char* ACCESSOR_NAME = "variant_name";

/// Renders the impl block for `sum`, ending in a newline. Every line is
/// prefixed with `base_indent`.
[[nodiscard]] auto emit_dispatch(const SumType& sum, const format::FormatOptions& options = {},
                                 const std::string& base_indent = {}) -> std::string;

} // namespace vnc::derive

#endif // VNC_DERIVE_VARIANT_NAME_HPP
