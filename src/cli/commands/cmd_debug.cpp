//! # Debug Commands
//!
//! Implements `vnc lex` and `vnc parse` for inspecting how a file is seen
//! before expansion.
//!
//! ```text
//! $ vnc parse shapes.rs
//! 1:1 enum Shape<'a, T> #[enum_variant_name_const]
//!     Dot
//!     Line(..) x1
//!     Rect { .. } [w, h]
//! 8:1 mod inner
//!     9:5 struct Point
//! ```

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "derive/registry.hpp"
#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <iostream>
#include <optional>

namespace vnc::cli {

/// Loads a file and registers it with the emitter.
static std::optional<lexer::Source> load_source(const std::string& path) {
    auto& diag = get_diagnostic_emitter();
    auto loaded = lexer::Source::from_file(path);
    if (is_err(loaded)) {
        diag.error(ErrorCodes::FILE_READ, unwrap_err(loaded));
        return std::nullopt;
    }
    diag.set_source_content(path, std::string(unwrap(loaded).content()));
    return std::move(unwrap(loaded));
}

static void emit_all_lexer_errors(DiagnosticEmitter& emitter, const lexer::Lexer& lex) {
    for (const auto& error : lex.errors()) {
        emitter.error(error.code, error.message, error.span);
    }
}

int run_lex(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();
    VNC_LOG_DEBUG("lexer", path << ": " << tokens.size() << " tokens");

    for (const auto& token : tokens) {
        std::cout << token.span.start.line << ":" << token.span.start.column << " "
                  << lexer::token_kind_to_string(token.kind);
        if (!token.lexeme.empty() && !token.is_eof()) {
            std::cout << " `" << token.lexeme << "`";
        }
        std::cout << "\n";
    }

    if (lex.has_errors()) {
        emit_all_lexer_errors(get_diagnostic_emitter(), lex);
        return 1;
    }
    return 0;
}

static void print_generics(const std::vector<parser::GenericParam>& generics) {
    if (generics.empty()) {
        return;
    }
    std::cout << "<";
    for (size_t i = 0; i < generics.size(); ++i) {
        if (i > 0) {
            std::cout << ", ";
        }
        std::cout << generics[i].name;
    }
    std::cout << ">";
}

static void print_variant(const parser::Variant& variant, const std::string& indent) {
    std::cout << indent << variant.name;
    switch (variant.shape) {
    case parser::VariantShape::Unit:
        break;
    case parser::VariantShape::Tuple:
        std::cout << "(..) x" << variant.tuple_arity;
        break;
    case parser::VariantShape::Record:
        std::cout << " { .. } [";
        for (size_t i = 0; i < variant.record_fields.size(); ++i) {
            std::cout << (i > 0 ? ", " : "") << variant.record_fields[i];
        }
        std::cout << "]";
        break;
    }
    std::cout << "\n";
}

static void print_items(const std::vector<parser::Item>& items, const std::string& indent) {
    for (const auto& item : items) {
        std::cout << indent << item.span.start.line << ":" << item.span.start.column << " "
                  << parser::item_kind_name(item.kind);
        if (!item.name.empty()) {
            std::cout << " " << item.name;
        }
        print_generics(item.generics);
        if (auto directive = derive::find_directive(item)) {
            std::cout << " " << derive::directive_display(directive->mode);
        }
        std::cout << "\n";

        for (const auto& variant : item.variants) {
            print_variant(variant, indent + "    ");
        }
        print_items(item.children, indent + "    ");
    }
}

int run_parse(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }
    auto& diag = get_diagnostic_emitter();

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();
    if (lex.has_errors()) {
        emit_all_lexer_errors(diag, lex);
        return 1;
    }

    parser::Parser parser(std::move(tokens));
    auto module = parser.parse_module(path);
    if (is_err(module)) {
        for (const auto& error : unwrap_err(module)) {
            diag.error(error.code, error.message, error.span, error.notes);
        }
        return 1;
    }

    print_items(unwrap(module).items, "");
    return 0;
}

} // namespace vnc::cli
