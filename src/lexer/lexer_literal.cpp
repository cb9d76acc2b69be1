//! # Lexer - Literals
//!
//! Numbers, strings and chars. Literal values are never decoded: item
//! headers only need to skip literals (discriminants, array lengths,
//! attribute arguments) and reproduce their text.

#include "lexer/lexer.hpp"

namespace vnc::lexer {

auto Lexer::lex_number() -> Token {
    bool is_float = false;

    if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'o' || peek_next() == 'b')) {
        advance();
        advance();
        // Hex digits and the type suffix are both identifier characters
        while (!is_at_end() && is_identifier_continue(peek())) {
            advance();
        }
        return make_token(TokenKind::IntLiteral);
    }

    while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
        advance();
    }

    // `1.5` and `1.` are floats; `1..2`, `1.foo()` and tuple fields are not
    if (peek() == '.' && peek_next() != '.' && !is_identifier_start(peek_next())) {
        is_float = true;
        advance();
        while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        char after = peek_next();
        bool signed_exp = (after == '+' || after == '-') && is_digit(peek_n(2));
        if (is_digit(after) || signed_exp) {
            is_float = true;
            advance();
            if (signed_exp) {
                advance();
            }
            while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
                advance();
            }
        }
    }

    // Suffix: `u8`, `usize`, `f64`
    if (is_identifier_start(peek())) {
        if (peek() == 'f') {
            is_float = true;
        }
        while (!is_at_end() && is_identifier_continue(peek())) {
            advance();
        }
    }

    return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral);
}

auto Lexer::lex_string() -> Token {
    advance(); // opening "

    while (!is_at_end()) {
        char c = advance();
        if (c == '\\') {
            if (!is_at_end()) {
                advance();
            }
        } else if (c == '"') {
            return make_token(TokenKind::StringLiteral);
        }
    }

    return make_error_token("unterminated string literal", LexErrorCodes::UNTERMINATED_STRING);
}

auto Lexer::lex_raw_string() -> Token {
    size_t hashes = 0;
    while (peek() == '#') {
        advance();
        ++hashes;
    }

    if (peek() != '"') {
        return make_error_token("expected `\"` after raw string prefix",
                                LexErrorCodes::UNEXPECTED_CHAR);
    }
    advance();

    while (!is_at_end()) {
        if (advance() != '"') {
            continue;
        }
        size_t closing = 0;
        while (closing < hashes && peek() == '#') {
            advance();
            ++closing;
        }
        if (closing == hashes) {
            return make_token(TokenKind::StringLiteral);
        }
    }

    return make_error_token("unterminated raw string literal",
                            LexErrorCodes::UNTERMINATED_STRING);
}

auto Lexer::lex_char_body() -> Token {
    advance(); // opening '

    if (peek() == '\\') {
        advance();
        if (peek() == 'u' && peek_next() == '{') {
            while (!is_at_end() && peek() != '}' && peek() != '\n') {
                advance();
            }
        }
        if (!is_at_end() && peek() != '\n') {
            advance();
        }
    } else if (!is_at_end() && peek() != '\'' && peek() != '\n') {
        // One UTF-8 encoded code point: lead byte plus continuation bytes
        advance();
        while ((static_cast<unsigned char>(peek()) & 0xC0) == 0x80) {
            advance();
        }
    }

    if (peek() != '\'') {
        return make_error_token("unterminated character literal",
                                LexErrorCodes::UNTERMINATED_CHAR);
    }
    advance();
    return make_token(TokenKind::CharLiteral);
}

} // namespace vnc::lexer
