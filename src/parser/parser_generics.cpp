//! # Parser - Generics
//!
//! Generic parameter lists and `where` clauses.
//!
//! ```text
//! <'a: 'b, T: Clone + 'a = u8, const N: usize = 4>
//!  ^^^^^^  ^^^^^^^^^^^^^^^^^^  ^^^^^^^^^^^^^^^^^^^
//!  lifetime     type                 const
//! ```
//!
//! Bounds, const types and defaults are rendered text. Angle brackets are
//! tracked while collecting them, so `T: Into<Vec<u8>>` stops at the
//! outer `>` and `Iterator<Item = u8>` does not end at its `=`.

#include "parser/parser.hpp"

namespace vnc::parser {

using lexer::TokenKind;

auto Parser::parse_generic_params() -> Result<std::vector<GenericParam>, ParseError> {
    advance(); // <
    std::vector<GenericParam> params;

    while (!check(TokenKind::Gt) && !is_at_end()) {
        auto param = parse_generic_param();
        if (is_err(param)) {
            return unwrap_err(param);
        }
        params.push_back(std::move(unwrap(param)));
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::Gt, "expected `,` or `>` in generic parameters");
    if (is_err(close)) {
        return unwrap_err(close);
    }
    return params;
}

auto Parser::parse_generic_param() -> Result<GenericParam, ParseError> {
    // `#[may_dangle]` and similar are dropped
    auto attrs = parse_outer_attributes();
    if (is_err(attrs)) {
        return unwrap_err(attrs);
    }

    GenericParam param{};
    param.span.start = peek().span.start;

    if (check(TokenKind::Lifetime)) {
        param.kind = GenericParamKind::Lifetime;
        param.name = std::string(advance().lexeme);
        if (match(TokenKind::Colon)) {
            auto begin = collect_until({TokenKind::Comma, TokenKind::Gt}, true);
            if (is_err(begin)) {
                return unwrap_err(begin);
            }
            param.bounds = render(unwrap(begin), pos_);
        }
    } else if (match(TokenKind::KwConst)) {
        param.kind = GenericParamKind::Const;
        auto name = expect_identifier("const parameter name");
        if (is_err(name)) {
            return unwrap_err(name);
        }
        param.name = std::string(unwrap(name).lexeme);

        auto colon = expect(TokenKind::Colon, "expected `:` after const parameter name");
        if (is_err(colon)) {
            return unwrap_err(colon);
        }
        auto begin = collect_until({TokenKind::Comma, TokenKind::Gt, TokenKind::Eq}, true);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        if (unwrap(begin) == pos_) {
            return make_error("expected type of const parameter, found " + describe(peek()),
                              ParseErrorCodes::EXPECTED_TOKEN);
        }
        param.const_type = render(unwrap(begin), pos_);
    } else if (check(TokenKind::Identifier)) {
        param.kind = GenericParamKind::Type;
        param.name = std::string(advance().lexeme);
        if (match(TokenKind::Colon)) {
            auto begin = collect_until({TokenKind::Comma, TokenKind::Gt, TokenKind::Eq}, true);
            if (is_err(begin)) {
                return unwrap_err(begin);
            }
            param.bounds = render(unwrap(begin), pos_);
        }
    } else {
        return make_error("expected generic parameter, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_IDENTIFIER);
    }

    if (param.kind != GenericParamKind::Lifetime && match(TokenKind::Eq)) {
        auto begin = collect_until({TokenKind::Comma, TokenKind::Gt}, true);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        param.default_value = render(unwrap(begin), pos_);
    }

    param.span.end = previous().span.end;
    return param;
}

auto Parser::parse_where_clause() -> Result<std::optional<WhereClause>, ParseError> {
    if (!check(TokenKind::KwWhere)) {
        return std::optional<WhereClause>{};
    }

    WhereClause clause;
    clause.span.start = advance().span.start;

    while (!check(TokenKind::LBrace) && !check(TokenKind::Semi) && !is_at_end()) {
        auto begin = collect_until({TokenKind::Comma, TokenKind::LBrace, TokenKind::Semi}, true);
        if (is_err(begin)) {
            return unwrap_err(begin);
        }
        if (unwrap(begin) < pos_) {
            clause.predicates.push_back(render(unwrap(begin), pos_));
        }
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    clause.span.end = previous().span.end;
    return std::optional<WhereClause>{std::move(clause)};
}

} // namespace vnc::parser
