//! # Lexer - Names
//!
//! Identifiers, raw identifiers and lifetimes.
//!
//! ## Apostrophe Disambiguation
//!
//! After `'` the lexer reads an identifier if one starts there. A closing
//! `'` right after a single-character name makes a char literal (`'a'`);
//! anything else is a lifetime (`'a`, `'static`, `'_`).

#include "lexer/lexer.hpp"

namespace vnc::lexer {

// Defined in lexer_core.cpp
extern auto lookup_keyword(std::string_view text) -> TokenKind;

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    return make_token(lookup_keyword(source_.slice(token_start_, pos_)));
}

auto Lexer::lex_raw_identifier() -> Token {
    advance(); // r
    advance(); // #
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_char_or_lifetime() -> Token {
    if (!is_identifier_start(peek_next())) {
        return lex_char_body();
    }

    size_t name_start = pos_ + 1;
    size_t name_end = name_start;
    while (is_identifier_continue(source_.at(name_end))) {
        ++name_end;
    }

    // `'a'` is a char; a multi-byte UTF-8 char also lands here
    if (source_.at(name_end) == '\'') {
        return lex_char_body();
    }

    pos_ = name_end;
    return make_token(TokenKind::Lifetime);
}

} // namespace vnc::lexer
