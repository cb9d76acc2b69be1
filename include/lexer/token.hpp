//! # Token Definitions
//!
//! Tokens produced by the lexer for Rust item declarations.
//!
//! ## Overview
//!
//! - **Literals**: integers, floats, strings (plain, raw, byte, C), chars
//! - **Names**: identifiers (including raw `r#ident`) and lifetimes (`'a`)
//! - **Keywords**: the strict keywords that can start or shape an item
//! - **Punctuation**: delimiters and operators
//! - **Doc comments**: `///`, `//!`, `/** */` and `/*! */` are kept as
//!   tokens because they are attributes of the item that follows
//!
//! `<` and `>` are always single-character tokens. Compound comparison and
//! shift operators never appear inside an item header, and keeping the
//! angle brackets apart lets `Vec<Vec<T>>` close one level at a time.

#ifndef VNC_LEXER_TOKEN_HPP
#define VNC_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string_view>

namespace vnc::lexer {

enum class TokenKind : uint8_t {
    Eof,
    Error,

    // Names
    Identifier, ///< `Foo`, `r#type`, `_`
    Lifetime,   ///< `'a`, `'static`

    // Literals
    IntLiteral,    ///< `42`, `0xff_u8`
    FloatLiteral,  ///< `1.5`, `2e10f64`
    StringLiteral, ///< `"s"`, `r#"s"#`, `b"s"`, `c"s"`
    CharLiteral,   ///< `'c'`, `b'c'`, `'\n'`
    BoolLiteral,   ///< `true`, `false`

    // Doc comments
    DocComment,      ///< `/// text` or `/** text */`
    InnerDocComment, ///< `//! text` or `/*! text */`

    // Keywords
    KwAs,
    KwAsync,
    KwConst,
    KwCrate,
    KwDyn,
    KwEnum,
    KwExtern,
    KwFn,
    KwFor,
    KwImpl,
    KwIn,
    KwLet,
    KwMod,
    KwMut,
    KwPub,
    KwSelfValue, ///< `self`
    KwSelfType,  ///< `Self`
    KwStatic,
    KwStruct,
    KwSuper,
    KwTrait,
    KwType,
    KwUnsafe,
    KwUse,
    KwWhere,

    // Delimiters
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    Lt, ///< `<`
    Gt, ///< `>`

    // Punctuation
    Comma,
    Semi,
    Colon,
    PathSep,   ///< `::`
    Arrow,     ///< `->`
    FatArrow,  ///< `=>`
    Dot,       ///< `.`
    DotDot,    ///< `..`
    DotDotEq,  ///< `..=`
    DotDotDot, ///< `...`
    Eq,        ///< `=`
    EqEq,      ///< `==`
    Ne,        ///< `!=`
    Pound,     ///< `#`
    Bang,      ///< `!`
    Question,
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    Caret,
    Amp,
    AndAnd,
    Pipe,
    OrOr,
    At,
    Dollar,
    Tilde,
};

/// One lexical element. `lexeme` views the `Source` the token came from.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// True for identifiers and keywords, which are both valid path segments
    /// inside attributes (`#[r#type]`, `#[crate::x]`).
    [[nodiscard]] auto is_word() const -> bool;

    /// True for `///`, `//!`, `/** */` and `/*! */`.
    [[nodiscard]] auto is_doc() const -> bool {
        return kind == TokenKind::DocComment || kind == TokenKind::InnerDocComment;
    }
};

/// Human-readable name of a token kind, used in parser errors and `vnc lex`.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

} // namespace vnc::lexer

#endif // VNC_LEXER_TOKEN_HPP
