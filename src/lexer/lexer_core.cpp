//! # Lexer Core
//!
//! - **Keyword table**: maps identifier text to keyword kinds
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Comments**: line, nested block, and doc comments
//!
//! Weak keywords (`union`, `auto`, `macro_rules`, `default`) are lexed as
//! identifiers; the parser recognizes them by context.

#include "lexer/lexer.hpp"

#include <unordered_map>

namespace vnc::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"as", TokenKind::KwAs},         {"async", TokenKind::KwAsync},
    {"const", TokenKind::KwConst},   {"crate", TokenKind::KwCrate},
    {"dyn", TokenKind::KwDyn},       {"enum", TokenKind::KwEnum},
    {"extern", TokenKind::KwExtern}, {"fn", TokenKind::KwFn},
    {"for", TokenKind::KwFor},       {"impl", TokenKind::KwImpl},
    {"in", TokenKind::KwIn},         {"let", TokenKind::KwLet},
    {"mod", TokenKind::KwMod},       {"mut", TokenKind::KwMut},
    {"pub", TokenKind::KwPub},       {"self", TokenKind::KwSelfValue},
    {"Self", TokenKind::KwSelfType}, {"static", TokenKind::KwStatic},
    {"struct", TokenKind::KwStruct}, {"super", TokenKind::KwSuper},
    {"trait", TokenKind::KwTrait},   {"type", TokenKind::KwType},
    {"unsafe", TokenKind::KwUnsafe}, {"use", TokenKind::KwUse},
    {"where", TokenKind::KwWhere},   {"true", TokenKind::BoolLiteral},
    {"false", TokenKind::BoolLiteral},
};

} // namespace

auto lookup_keyword(std::string_view text) -> TokenKind {
    auto it = KEYWORDS.find(text);
    return it != KEYWORDS.end() ? it->second : TokenKind::Identifier;
}

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    return Token{.kind = kind,
                 .span = {source_.location(token_start_), source_.location(pos_)},
                 .lexeme = source_.slice(token_start_, pos_)};
}

auto Lexer::make_error_token(const std::string& message, const std::string& code) -> Token {
    report_error(message, code);
    return make_token(TokenKind::Error);
}

void Lexer::report_error(const std::string& message, const std::string& code) {
    errors_.push_back(LexerError{.message = message,
                                 .span = {source_.location(token_start_), source_.location(pos_)},
                                 .code = code});
}

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        switch (peek()) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
        case '\f':
        case '\v':
            advance();
            break;
        case '/':
            if (peek_next() == '/') {
                if (at_line_doc_comment()) {
                    return;
                }
                skip_line_comment();
            } else if (peek_next() == '*') {
                if (at_block_doc_comment()) {
                    return;
                }
                skip_block_comment();
            } else {
                return;
            }
            break;
        default:
            return;
        }
    }
}

auto Lexer::at_line_doc_comment() const -> bool {
    // `///` and `//!` are doc comments, `////` is not
    if (peek() != '/' || peek_next() != '/') {
        return false;
    }
    char third = peek_n(2);
    if (third == '!') {
        return true;
    }
    return third == '/' && peek_n(3) != '/';
}

auto Lexer::at_block_doc_comment() const -> bool {
    // `/**` and `/*!` are doc comments, `/***` and `/**/` are not
    if (peek() != '/' || peek_next() != '*') {
        return false;
    }
    char third = peek_n(2);
    if (third == '!') {
        return true;
    }
    return third == '*' && peek_n(3) != '*' && peek_n(3) != '/';
}

auto Lexer::lex_line_doc_comment() -> Token {
    advance(); // /
    advance(); // /
    TokenKind kind = advance() == '!' ? TokenKind::InnerDocComment : TokenKind::DocComment;

    while (!is_at_end() && peek() != '\n') {
        advance();
    }

    // The `\r` of a CRLF line ending is not part of the comment
    size_t end = pos_;
    if (source_.at(end - 1) == '\r') {
        --end;
    }
    return Token{.kind = kind,
                 .span = {source_.location(token_start_), source_.location(end)},
                 .lexeme = source_.slice(token_start_, end)};
}

auto Lexer::lex_block_doc_comment() -> Token {
    TokenKind kind = peek_n(2) == '!' ? TokenKind::InnerDocComment : TokenKind::DocComment;
    skip_block_comment();
    return make_token(kind);
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

void Lexer::skip_block_comment() {
    size_t start = pos_;
    advance(); // /
    advance(); // *

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        size_t saved = token_start_;
        token_start_ = start;
        report_error("unterminated block comment", LexErrorCodes::UNTERMINATED_COMMENT);
        token_start_ = saved;
    }
}

auto Lexer::is_identifier_start(char c) -> bool {
    // Bytes >= 0x80 belong to UTF-8 encoded XID characters
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || is_digit(c);
}

auto Lexer::is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

} // namespace vnc::lexer
