//! # Lexer - Operators and Delimiters
//!
//! Multi-character punctuation is matched longest-first. `<` and `>` never
//! combine with a following character.

#include "lexer/lexer.hpp"

#include <string>

namespace vnc::lexer {

auto Lexer::lex_operator() -> Token {
    char c = advance();

    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case '<':
        return make_token(TokenKind::Lt);
    case '>':
        return make_token(TokenKind::Gt);
    case ',':
        return make_token(TokenKind::Comma);
    case ';':
        return make_token(TokenKind::Semi);
    case '#':
        return make_token(TokenKind::Pound);
    case '?':
        return make_token(TokenKind::Question);
    case '+':
        return make_token(TokenKind::Plus);
    case '*':
        return make_token(TokenKind::Star);
    case '/':
        return make_token(TokenKind::Slash);
    case '%':
        return make_token(TokenKind::Percent);
    case '^':
        return make_token(TokenKind::Caret);
    case '@':
        return make_token(TokenKind::At);
    case '$':
        return make_token(TokenKind::Dollar);
    case '~':
        return make_token(TokenKind::Tilde);

    case ':':
        if (peek() == ':') {
            advance();
            return make_token(TokenKind::PathSep);
        }
        return make_token(TokenKind::Colon);

    case '-':
        if (peek() == '>') {
            advance();
            return make_token(TokenKind::Arrow);
        }
        return make_token(TokenKind::Minus);

    case '=':
        if (peek() == '>') {
            advance();
            return make_token(TokenKind::FatArrow);
        }
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::EqEq);
        }
        return make_token(TokenKind::Eq);

    case '!':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Ne);
        }
        return make_token(TokenKind::Bang);

    case '.':
        if (peek() == '.') {
            advance();
            if (peek() == '=') {
                advance();
                return make_token(TokenKind::DotDotEq);
            }
            if (peek() == '.') {
                advance();
                return make_token(TokenKind::DotDotDot);
            }
            return make_token(TokenKind::DotDot);
        }
        return make_token(TokenKind::Dot);

    case '&':
        if (peek() == '&') {
            advance();
            return make_token(TokenKind::AndAnd);
        }
        return make_token(TokenKind::Amp);

    case '|':
        if (peek() == '|') {
            advance();
            return make_token(TokenKind::OrOr);
        }
        return make_token(TokenKind::Pipe);

    default:
        break;
    }

    return make_error_token("unexpected character `" +
                                std::string(source_.slice(token_start_, pos_)) + "`",
                            LexErrorCodes::UNEXPECTED_CHAR);
}

} // namespace vnc::lexer
