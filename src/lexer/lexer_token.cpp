//! # Lexer - Token Dispatch
//!
//! 1. Skip whitespace and ordinary comments
//! 2. `Eof` at end of input
//! 3. Doc comments
//! 4. Prefixed literals and raw identifiers (`r#`, `r"`, `b"`, `b'`, `br"`, `c"`)
//! 5. Identifiers and keywords
//! 6. Numbers, strings, chars and lifetimes
//! 7. Operators and delimiters

#include "lexer/lexer.hpp"

namespace vnc::lexer {

auto Lexer::next_token() -> Token {
    skip_whitespace();
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (c == '/' && at_line_doc_comment()) {
        return lex_line_doc_comment();
    }
    if (c == '/' && at_block_doc_comment()) {
        return lex_block_doc_comment();
    }

    if (c == 'r') {
        if (peek_next() == '#' && is_identifier_start(peek_n(2))) {
            return lex_raw_identifier();
        }
        if (peek_next() == '"' || (peek_next() == '#' && (peek_n(2) == '#' || peek_n(2) == '"'))) {
            advance(); // r
            return lex_raw_string();
        }
    }

    if (c == 'b' || c == 'c') {
        if (peek_next() == '"') {
            advance(); // prefix
            return lex_string();
        }
        if (c == 'b' && peek_next() == '\'') {
            advance(); // b
            return lex_char_body();
        }
        if (peek_next() == 'r' && (peek_n(2) == '"' || peek_n(2) == '#')) {
            advance(); // prefix
            advance(); // r
            return lex_raw_string();
        }
    }

    if (is_identifier_start(c)) {
        return lex_identifier();
    }

    if (is_digit(c)) {
        return lex_number();
    }

    if (c == '"') {
        return lex_string();
    }

    if (c == '\'') {
        return lex_char_or_lifetime();
    }

    return lex_operator();
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        auto token = next_token();
        tokens.push_back(token);
        if (token.is_eof()) {
            break;
        }
    }
    return tokens;
}

} // namespace vnc::lexer
