//! # Directive Registry
//!
//! The two spellings that request a variant-name accessor and the lookup
//! that finds them among an item's attributes.
//!
//! | Spelling                                | Mode       | Output                   |
//! |-----------------------------------------|------------|--------------------------|
//! | `#[enum_variant_name_const]`            | Attachment | declaration + impl block |
//! | `#[derive(EnumVariantNameConst)]`       | Annotation | impl block only          |
//!
//! Both may be written with a path prefix (`#[my_crate::enum_variant_name_const]`);
//! only the last path segment is compared.

#pragma once

#include "parser/ast.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace vnc::derive {

/// How the generator was invoked on an item.
enum class DirectiveMode {
    Attachment, ///< Attribute wraps the declaration and re-emits it
    Annotation  ///< Derive observes the declaration and adds to it
};

/// Attribute name of the attachment directive.
constexpr std::string_view ATTACHMENT_NAME = "enum_variant_name_const";

/// Derive name of the annotation directive.
constexpr std::string_view ANNOTATION_NAME = "EnumVariantNameConst";

/// A directive found on an item.
struct Directive {
    DirectiveMode mode;

    /// Index into `Item::attributes` of the attribute carrying it.
    size_t attribute_index;
};

/// Last `::` segment of a path (`a::b::C` -> `C`).
inline std::string_view last_segment(std::string_view path) {
    auto sep = path.rfind("::");
    return sep == std::string_view::npos ? path : path.substr(sep + 2);
}

/// Source spelling of a directive, as used in messages.
inline std::string directive_display(DirectiveMode mode) {
    switch (mode) {
    case DirectiveMode::Attachment:
        return "#[" + std::string(ATTACHMENT_NAME) + "]";
    case DirectiveMode::Annotation:
        return "#[derive(" + std::string(ANNOTATION_NAME) + ")]";
    }
    return "";
}

/// Parses `attach` / `derive` as used on the command line.
inline std::optional<DirectiveMode> parse_mode_name(std::string_view name) {
    if (name == "attach" || name == "attachment")
        return DirectiveMode::Attachment;
    if (name == "derive" || name == "annotation")
        return DirectiveMode::Annotation;
    return std::nullopt;
}

/// Finds the directive on an item's outer attributes.
///
/// When both spellings are present the attachment directive wins; the
/// annotation entry is still consumed by `consume_directive()`.
[[nodiscard]] auto find_directive(const parser::Item& item) -> std::optional<Directive>;

/// What an attribute becomes once its directive has been expanded.
///
/// | Attribute                                   | Result              |
/// |---------------------------------------------|---------------------|
/// | `#[enum_variant_name_const]`                | `""`                |
/// | `#[derive(EnumVariantNameConst)]`           | `""`                |
/// | `#[derive(Clone, EnumVariantNameConst)]`    | `#[derive(Clone)]`  |
/// | anything else                               | `std::nullopt`      |
///
/// An empty string means the attribute is removed.
[[nodiscard]] auto consume_directive(const parser::Attribute& attr)
    -> std::optional<std::string>;

} // namespace vnc::derive
