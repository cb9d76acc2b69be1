//! # Parser - Items
//!
//! Attributes, visibility and item dispatch.
//!
//! ## Item Forms
//!
//! | Form                                  | Handling                       |
//! |---------------------------------------|--------------------------------|
//! | `enum Name<..> where .. { .. }`       | header and branches parsed     |
//! | `struct` / `union`                    | header parsed, fields skipped  |
//! | `mod name { .. }`                     | children parsed recursively    |
//! | `fn`, `impl`, `trait`, `extern {}`    | skipped through the body       |
//! | `use`, `const`, `static`, `type`      | skipped through the `;`        |
//! | `macro_rules! m { .. }`, `path!(..);` | skipped through the group      |

#include "parser/parser.hpp"

namespace vnc::parser {

using lexer::Token;
using lexer::TokenKind;

// ============================================================================
// Attributes
// ============================================================================

auto Parser::parse_inner_attributes(std::vector<Attribute>& out) -> Result<bool, ParseError> {
    while (true) {
        if (check(TokenKind::InnerDocComment)) {
            const auto& tok = advance();
            out.push_back(Attribute{.path = "doc",
                                    .args = std::string(tok.lexeme),
                                    .derive_paths = {},
                                    .is_inner = true,
                                    .is_doc = true,
                                    .span = tok.span});
            continue;
        }
        if (check(TokenKind::Pound) && peek_at(1).is(TokenKind::Bang) &&
            peek_at(2).is(TokenKind::LBracket)) {
            auto attr = parse_attribute();
            if (is_err(attr)) {
                return unwrap_err(attr);
            }
            out.push_back(std::move(unwrap(attr)));
            continue;
        }
        return true;
    }
}

auto Parser::parse_outer_attributes() -> Result<std::vector<Attribute>, ParseError> {
    std::vector<Attribute> attrs;
    while (true) {
        if (check(TokenKind::DocComment)) {
            const auto& tok = advance();
            attrs.push_back(Attribute{.path = "doc",
                                      .args = std::string(tok.lexeme),
                                      .derive_paths = {},
                                      .is_inner = false,
                                      .is_doc = true,
                                      .span = tok.span});
            continue;
        }
        if (check(TokenKind::Pound) && peek_at(1).is(TokenKind::LBracket)) {
            auto attr = parse_attribute();
            if (is_err(attr)) {
                return unwrap_err(attr);
            }
            attrs.push_back(std::move(unwrap(attr)));
            continue;
        }
        return attrs;
    }
}

auto Parser::parse_attribute() -> Result<Attribute, ParseError> {
    Attribute attr;
    attr.span.start = advance().span.start; // #
    attr.is_inner = match(TokenKind::Bang);

    auto open = expect(TokenKind::LBracket, "expected `[` to start attribute");
    if (is_err(open)) {
        return unwrap_err(open);
    }

    if (match(TokenKind::PathSep)) {
        attr.path = "::";
    }
    while (peek().is_word()) {
        attr.path += advance().lexeme;
        if (!check(TokenKind::PathSep) || !peek_at(1).is_word()) {
            break;
        }
        attr.path += advance().lexeme;
    }
    if (attr.path.empty() || attr.path == "::") {
        return make_error("expected attribute path, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_IDENTIFIER);
    }

    if (check(TokenKind::LParen) || check(TokenKind::LBracket) || check(TokenKind::LBrace)) {
        size_t group_start = pos_;
        auto skipped = skip_group();
        if (is_err(skipped)) {
            return unwrap_err(skipped);
        }
        attr.args = render(group_start + 1, pos_ - 1);

        if (attr.path == "derive") {
            std::string current;
            for (size_t i = group_start + 1; i + 1 < pos_; ++i) {
                const auto& tok = tokens_[i];
                if (tok.is(TokenKind::Comma)) {
                    if (!current.empty()) {
                        attr.derive_paths.push_back(std::move(current));
                    }
                    current.clear();
                } else if (tok.is_word() || tok.is(TokenKind::PathSep)) {
                    current += tok.lexeme;
                }
            }
            if (!current.empty()) {
                attr.derive_paths.push_back(std::move(current));
            }
        }
    } else if (match(TokenKind::Eq)) {
        auto begin = collect_until({TokenKind::RBracket}, false);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        attr.args = render(unwrap(begin), pos_);
    }

    auto close = expect(TokenKind::RBracket, "expected `]` to close attribute");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    attr.span.end = unwrap(close).span.end;
    return attr;
}

// ============================================================================
// Visibility
// ============================================================================

auto Parser::parse_visibility() -> Result<Visibility, ParseError> {
    Visibility vis;
    if (!match(TokenKind::KwPub)) {
        return vis;
    }
    vis.kind = VisibilityKind::Public;

    if (!check(TokenKind::LParen)) {
        return vis;
    }

    // `pub (u8, u8)` in a tuple field is a type, not a restriction
    const auto& inner = peek_at(1);
    bool simple = peek_at(2).is(TokenKind::RParen) &&
                  inner.is_one_of({TokenKind::KwCrate, TokenKind::KwSuper, TokenKind::KwSelfValue});
    if (simple) {
        advance(); // (
        switch (advance().kind) {
        case TokenKind::KwCrate:
            vis.kind = VisibilityKind::Crate;
            break;
        case TokenKind::KwSuper:
            vis.kind = VisibilityKind::Super;
            break;
        default:
            vis.kind = VisibilityKind::SelfMod;
            break;
        }
        advance(); // )
        return vis;
    }

    if (inner.is(TokenKind::KwIn)) {
        advance(); // (
        advance(); // in
        auto begin = collect_until({TokenKind::RParen}, false);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        vis.kind = VisibilityKind::InPath;
        vis.path = render(unwrap(begin), pos_);
        auto close = expect(TokenKind::RParen, "expected `)` after visibility path");
        if (is_err(close)) {
            return unwrap_err(close);
        }
    }
    return vis;
}

// ============================================================================
// Item Dispatch
// ============================================================================

auto Parser::parse_item() -> Result<Item, ParseError> {
    Item item{};
    item.span.start = peek().span.start;

    auto attrs = parse_outer_attributes();
    if (is_err(attrs)) {
        return unwrap_err(attrs);
    }
    item.attributes = std::move(unwrap(attrs));

    auto vis = parse_visibility();
    if (is_err(vis)) {
        return unwrap_err(vis);
    }
    item.visibility = std::move(unwrap(vis));

    Result<bool, ParseError> body = true;
    const auto& next = peek_at(1);

    switch (peek().kind) {
    case TokenKind::KwEnum:
        item.kind = ItemKind::Enum;
        body = parse_enum(item);
        break;
    case TokenKind::KwStruct:
        item.kind = ItemKind::Struct;
        body = parse_struct(item);
        break;
    case TokenKind::KwMod:
        item.kind = ItemKind::Module;
        body = parse_module_item(item);
        break;
    case TokenKind::KwFn:
    case TokenKind::KwAsync:
        item.kind = ItemKind::Function;
        body = parse_other(item);
        break;
    case TokenKind::KwConst:
        item.kind = next.is_one_of({TokenKind::KwFn, TokenKind::KwAsync, TokenKind::KwUnsafe,
                                    TokenKind::KwExtern})
                        ? ItemKind::Function
                        : ItemKind::Const;
        body = parse_other(item);
        break;
    case TokenKind::KwStatic:
        item.kind = ItemKind::Static;
        body = parse_other(item);
        break;
    case TokenKind::KwType:
        item.kind = ItemKind::TypeAlias;
        body = parse_other(item);
        break;
    case TokenKind::KwUse:
        item.kind = ItemKind::Use;
        body = parse_other(item);
        break;
    case TokenKind::KwImpl:
        item.kind = ItemKind::Impl;
        body = parse_other(item);
        break;
    case TokenKind::KwTrait:
        item.kind = ItemKind::Trait;
        body = parse_other(item);
        break;
    case TokenKind::KwUnsafe:
        if (next.is(TokenKind::KwImpl)) {
            item.kind = ItemKind::Impl;
        } else if (next.is(TokenKind::KwTrait) ||
                   (next.is(TokenKind::Identifier) && next.lexeme == "auto")) {
            item.kind = ItemKind::Trait;
        } else if (next.is(TokenKind::KwExtern) && !peek_at(2).is(TokenKind::KwFn) &&
                   !peek_at(3).is(TokenKind::KwFn)) {
            item.kind = ItemKind::ExternBlock;
        } else {
            item.kind = ItemKind::Function;
        }
        body = parse_other(item);
        break;
    case TokenKind::KwExtern:
        if (next.is(TokenKind::KwCrate)) {
            item.kind = ItemKind::ExternCrate;
        } else if (next.is(TokenKind::LBrace) ||
                   (next.is(TokenKind::StringLiteral) && peek_at(2).is(TokenKind::LBrace))) {
            item.kind = ItemKind::ExternBlock;
        } else {
            item.kind = ItemKind::Function;
        }
        body = parse_other(item);
        break;
    case TokenKind::Identifier:
        if (check_word("union") && next.is(TokenKind::Identifier)) {
            item.kind = ItemKind::Union;
            body = parse_union(item);
        } else if (check_word("auto") && next.is(TokenKind::KwTrait)) {
            item.kind = ItemKind::Trait;
            body = parse_other(item);
        } else {
            body = parse_macro(item);
        }
        break;
    case TokenKind::PathSep:
    case TokenKind::KwCrate:
    case TokenKind::KwSelfValue:
    case TokenKind::KwSuper:
        body = parse_macro(item);
        break;
    default:
        return make_error("expected item, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_ITEM);
    }

    if (is_err(body)) {
        return unwrap_err(body);
    }

    item.span.end = previous().span.end;
    return item;
}

// ============================================================================
// Type Declarations
// ============================================================================

auto Parser::parse_enum(Item& item) -> Result<bool, ParseError> {
    item.keyword_span = advance().span;

    auto name = expect_identifier("enum name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    item.name = std::string(unwrap(name).lexeme);
    item.name_span = unwrap(name).span;

    if (check(TokenKind::Lt)) {
        auto generics = parse_generic_params();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
        item.generics = std::move(unwrap(generics));
    }

    auto where = parse_where_clause();
    if (is_err(where)) {
        return unwrap_err(where);
    }
    item.where_clause = std::move(unwrap(where));

    auto open = expect(TokenKind::LBrace, "expected `{` after enum header");
    if (is_err(open)) {
        return unwrap_err(open);
    }

    auto variants = parse_variants();
    if (is_err(variants)) {
        return unwrap_err(variants);
    }
    item.variants = std::move(unwrap(variants));
    return true;
}

auto Parser::parse_variants() -> Result<std::vector<Variant>, ParseError> {
    std::vector<Variant> variants;

    while (!check(TokenKind::RBrace) && !is_at_end()) {
        auto variant = parse_variant();
        if (is_err(variant)) {
            return unwrap_err(variant);
        }
        variants.push_back(std::move(unwrap(variant)));
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RBrace, "expected `,` or `}` after enum variant");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return variants;
}

auto Parser::parse_variant() -> Result<Variant, ParseError> {
    Variant variant;
    variant.span.start = peek().span.start;

    auto attrs = parse_outer_attributes();
    if (is_err(attrs)) {
        return unwrap_err(attrs);
    }
    variant.attributes = std::move(unwrap(attrs));

    // Accepted by the grammar, rejected later by rustc
    auto vis = parse_visibility();
    if (is_err(vis)) {
        return unwrap_err(vis);
    }

    auto name = expect_identifier("variant name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    variant.name = std::string(unwrap(name).lexeme);
    variant.name_span = unwrap(name).span;

    if (check(TokenKind::LParen)) {
        auto arity = parse_tuple_fields();
        if (is_err(arity)) {
            return unwrap_err(arity);
        }
        variant.shape = VariantShape::Tuple;
        variant.tuple_arity = unwrap(arity);
    } else if (check(TokenKind::LBrace)) {
        auto fields = parse_record_fields();
        if (is_err(fields)) {
            return unwrap_err(fields);
        }
        variant.shape = VariantShape::Record;
        variant.record_fields = std::move(unwrap(fields));
    }

    if (match(TokenKind::Eq)) {
        auto begin = collect_until({TokenKind::Comma, TokenKind::RBrace}, false);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        if (unwrap(begin) == pos_) {
            return make_error("expected discriminant expression, found " + describe(peek()),
                              ParseErrorCodes::EXPECTED_TOKEN);
        }
        variant.has_discriminant = true;
    }

    variant.span.end = previous().span.end;
    return variant;
}

auto Parser::parse_tuple_fields() -> Result<size_t, ParseError> {
    advance(); // (
    size_t arity = 0;

    while (!check(TokenKind::RParen)) {
        auto attrs = parse_outer_attributes();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }
        auto vis = parse_visibility();
        if (is_err(vis)) {
            return unwrap_err(vis);
        }

        auto begin = collect_until({TokenKind::Comma, TokenKind::RParen}, true);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        if (unwrap(begin) == pos_) {
            return make_error("expected field type, found " + describe(peek()),
                              ParseErrorCodes::EXPECTED_TOKEN);
        }
        ++arity;

        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RParen, "expected `,` or `)` after tuple field");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return arity;
}

auto Parser::parse_record_fields() -> Result<std::vector<std::string>, ParseError> {
    advance(); // {
    std::vector<std::string> fields;

    while (!check(TokenKind::RBrace)) {
        auto attrs = parse_outer_attributes();
        if (is_err(attrs)) {
            return unwrap_err(attrs);
        }
        auto vis = parse_visibility();
        if (is_err(vis)) {
            return unwrap_err(vis);
        }

        auto name = expect_identifier("field name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        auto colon = expect(TokenKind::Colon, "expected `:` after field name");
        if (is_err(colon)) {
            return unwrap_err(colon);
        }

        auto begin = collect_until({TokenKind::Comma, TokenKind::RBrace}, true);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        if (unwrap(begin) == pos_) {
            return make_error("expected field type, found " + describe(peek()),
                              ParseErrorCodes::EXPECTED_TOKEN);
        }
        fields.emplace_back(unwrap(name).lexeme);

        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RBrace, "expected `,` or `}` after field");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return fields;
}

auto Parser::parse_struct(Item& item) -> Result<bool, ParseError> {
    item.keyword_span = advance().span;

    auto name = expect_identifier("struct name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    item.name = std::string(unwrap(name).lexeme);
    item.name_span = unwrap(name).span;

    if (check(TokenKind::Lt)) {
        auto generics = parse_generic_params();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
        item.generics = std::move(unwrap(generics));
    }

    // struct S<T>(T) where T: Copy;
    if (check(TokenKind::LParen)) {
        auto arity = parse_tuple_fields();
        if (is_err(arity)) {
            return unwrap_err(arity);
        }
        auto where = parse_where_clause();
        if (is_err(where)) {
            return unwrap_err(where);
        }
        item.where_clause = std::move(unwrap(where));
        auto semi = expect(TokenKind::Semi, "expected `;` after tuple struct");
        if (is_err(semi)) {
            return unwrap_err(semi);
        }
        return true;
    }

    auto where = parse_where_clause();
    if (is_err(where)) {
        return unwrap_err(where);
    }
    item.where_clause = std::move(unwrap(where));

    if (match(TokenKind::Semi)) {
        return true;
    }
    if (!check(TokenKind::LBrace)) {
        return make_error("expected `{`, `(` or `;` after struct header, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_TOKEN);
    }
    auto fields = parse_record_fields();
    if (is_err(fields)) {
        return unwrap_err(fields);
    }
    return true;
}

auto Parser::parse_union(Item& item) -> Result<bool, ParseError> {
    item.keyword_span = advance().span; // contextual `union`

    const auto& name = advance();
    item.name = std::string(name.lexeme);
    item.name_span = name.span;

    if (check(TokenKind::Lt)) {
        auto generics = parse_generic_params();
        if (is_err(generics)) {
            return unwrap_err(generics);
        }
        item.generics = std::move(unwrap(generics));
    }

    auto where = parse_where_clause();
    if (is_err(where)) {
        return unwrap_err(where);
    }
    item.where_clause = std::move(unwrap(where));

    if (!check(TokenKind::LBrace)) {
        return make_error("expected `{` after union header, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_TOKEN);
    }
    auto fields = parse_record_fields();
    if (is_err(fields)) {
        return unwrap_err(fields);
    }
    return true;
}

// ============================================================================
// Modules and Macros
// ============================================================================

auto Parser::parse_module_item(Item& item) -> Result<bool, ParseError> {
    item.keyword_span = advance().span;

    auto name = expect_identifier("module name");
    if (is_err(name)) {
        return unwrap_err(name);
    }
    item.name = std::string(unwrap(name).lexeme);
    item.name_span = unwrap(name).span;

    if (match(TokenKind::Semi)) {
        return true;
    }

    auto open = expect(TokenKind::LBrace, "expected `{` or `;` after module name");
    if (is_err(open)) {
        return unwrap_err(open);
    }

    // Errors inside the body are recorded directly; the module item itself
    // still closes normally so recovery continues after it
    std::vector<Attribute> inner;
    parse_items_until(TokenKind::RBrace, inner, item.children);

    auto close = expect(TokenKind::RBrace, "expected `}` to close module `" + item.name + "`");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return true;
}

auto Parser::parse_macro(Item& item) -> Result<bool, ParseError> {
    item.keyword_span = peek().span;

    if (check_word("macro_rules") && peek_at(1).is(TokenKind::Bang)) {
        item.kind = ItemKind::MacroRules;
        advance(); // macro_rules
        advance(); // !
        auto name = expect_identifier("macro name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        item.name = std::string(unwrap(name).lexeme);
        item.name_span = unwrap(name).span;
    } else {
        item.kind = ItemKind::MacroCall;
        size_t path_start = pos_;
        match(TokenKind::PathSep);
        while (peek().is_word()) {
            advance();
            if (!match(TokenKind::PathSep)) {
                break;
            }
        }
        if (pos_ == path_start || !check(TokenKind::Bang)) {
            pos_ = path_start;
            return make_error("expected item, found " + describe(peek()),
                              ParseErrorCodes::EXPECTED_ITEM);
        }
        item.name = render(path_start, pos_);
        item.name_span = SourceSpan::merge(tokens_[path_start].span, previous().span);
        advance(); // !
    }

    bool braced = check(TokenKind::LBrace);
    auto group = skip_group();
    if (is_err(group)) {
        return unwrap_err(group);
    }

    if (braced) {
        match(TokenKind::Semi);
        return true;
    }
    auto semi = expect(TokenKind::Semi, "expected `;` after macro invocation");
    if (is_err(semi)) {
        return unwrap_err(semi);
    }
    return true;
}

// ============================================================================
// Skipped Items
// ============================================================================

auto Parser::parse_other(Item& item) -> Result<bool, ParseError> {
    TokenKind keyword = TokenKind::KwFn;
    bool ends_with_body = true;

    switch (item.kind) {
    case ItemKind::Function:
        keyword = TokenKind::KwFn;
        break;
    case ItemKind::Impl:
        keyword = TokenKind::KwImpl;
        break;
    case ItemKind::Trait:
        keyword = TokenKind::KwTrait;
        break;
    case ItemKind::ExternBlock:
        keyword = TokenKind::KwExtern;
        break;
    case ItemKind::TypeAlias:
        keyword = TokenKind::KwType;
        ends_with_body = false;
        break;
    case ItemKind::Const:
        keyword = TokenKind::KwConst;
        ends_with_body = false;
        break;
    case ItemKind::Static:
        keyword = TokenKind::KwStatic;
        ends_with_body = false;
        break;
    case ItemKind::Use:
        keyword = TokenKind::KwUse;
        ends_with_body = false;
        break;
    case ItemKind::ExternCrate:
        keyword = TokenKind::KwCrate;
        ends_with_body = false;
        break;
    default:
        break;
    }

    // Qualifiers before the keyword: `const unsafe extern "C" fn`, `unsafe impl`
    while (!check(keyword) && !is_at_end() && !check(TokenKind::LBrace) &&
           !check(TokenKind::Semi)) {
        advance();
    }
    if (!check(keyword)) {
        return make_error("expected `" + std::string(lexer::token_kind_to_string(keyword)) +
                              "`, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_TOKEN);
    }
    item.keyword_span = advance().span;
    item.name_span = item.keyword_span;

    match(TokenKind::KwMut); // static mut
    if (check(TokenKind::Identifier) && item.kind != ItemKind::Impl &&
        item.kind != ItemKind::Use && item.kind != ItemKind::ExternBlock) {
        item.name = std::string(peek().lexeme);
        item.name_span = peek().span;
    }

    // Walk to the end: a `;` at depth 0, or the first `{ }` group at depth 0
    // for items that end with a body
    while (!is_at_end()) {
        if (check(TokenKind::Semi)) {
            advance();
            return true;
        }
        if (check(TokenKind::LBrace) && ends_with_body) {
            auto body = skip_group();
            if (is_err(body)) {
                return unwrap_err(body);
            }
            return true;
        }
        if (check(TokenKind::LParen) || check(TokenKind::LBracket) || check(TokenKind::LBrace)) {
            auto group = skip_group();
            if (is_err(group)) {
                return unwrap_err(group);
            }
            continue;
        }
        if (check(TokenKind::RParen) || check(TokenKind::RBracket) || check(TokenKind::RBrace)) {
            return make_error("unexpected closing delimiter " + describe(peek()),
                              ParseErrorCodes::UNBALANCED_DELIMITER);
        }
        advance();
    }

    return make_error(std::string("expected `;` or `{` to end ") +
                          std::string(item_kind_name(item.kind)) + ", found end of file",
                      ParseErrorCodes::EXPECTED_TOKEN);
}

} // namespace vnc::parser
