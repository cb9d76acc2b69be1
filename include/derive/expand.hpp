//! # Expander
//!
//! Runs the variant-name derive over source text.
//!
//! | Entry point            | Input               | Output                              |
//! |------------------------|---------------------|-------------------------------------|
//! | `expand_declaration()` | one item, a mode    | declaration + impl, or impl only    |
//! | `expand_module()`      | a whole file        | the file with every directive expanded |
//!
//! Expansion is all-or-nothing: when any error is found, no text is
//! returned, only the errors. Lexer and parser errors abort before any
//! directive is looked at; derive errors are collected for every item.
//!
//! ## Splicing
//!
//! Output is built from the original bytes. Text outside directed items is
//! copied as-is, and each generated impl is inserted after its enum,
//! separated by a blank line and indented to the enum's line:
//!
//! ```rust
//! mod shapes {
//!     #[enum_variant_name_const]
//!     pub enum Shape { Dot, Line(u8) }
//! }
//! ```
//!
//! becomes
//!
//! ```rust
//! mod shapes {
//!     pub enum Shape { Dot, Line(u8) }
//!
//!     impl Shape {
//!         ...
//!     }
//! }
//! ```

#ifndef VNC_DERIVE_EXPAND_HPP
#define VNC_DERIVE_EXPAND_HPP

#include "common.hpp"
#include "derive/registry.hpp"
#include "format/writer.hpp"
#include "lexer/source.hpp"

#include <string>
#include <vector>

namespace vnc::derive {

/// Any error that stops an expansion: lexer (`L0xx`), parser (`P0xx`) or
/// derive (`D0xx`).
struct ExpandError {
    std::string code;
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;
};

struct ExpandOutput {
    std::string text;

    /// Number of impl blocks generated.
    size_t expanded = 0;
};

/// Expands a source holding exactly one item in the given mode.
///
/// Attachment mode returns the declaration followed by the impl block. When
/// the source still carries `#[enum_variant_name_const]` that attribute is
/// removed. Annotation mode returns only the impl block.
[[nodiscard]] auto expand_declaration(const lexer::Source& source, DirectiveMode mode,
                                      const format::FormatOptions& options = {})
    -> Result<ExpandOutput, std::vector<ExpandError>>;

/// Expands every directed item of a file, including items inside inline
/// modules. The mode of each item comes from its own directive.
[[nodiscard]] auto expand_module(const lexer::Source& source,
                                 const format::FormatOptions& options = {})
    -> Result<ExpandOutput, std::vector<ExpandError>>;

} // namespace vnc::derive

#endif // VNC_DERIVE_EXPAND_HPP
