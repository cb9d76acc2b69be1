//! # Lexer
//!
//! Converts Rust declaration text into tokens with exact source spans.
//!
//! ## Features
//!
//! - **Raw identifiers**: `r#type` is one identifier token
//! - **Lifetimes vs chars**: `'a` is a lifetime, `'a'` a char literal
//! - **String forms**: `"..."`, `r#"..."#`, `b"..."`, `br"..."`, `c"..."`
//! - **Nested block comments**: `/* /* */ */`
//! - **Doc comments**: one token per `///` line or `/** */` block
//!
//! ## Error Recovery
//!
//! The lexer keeps going after an error and produces a `TokenKind::Error`
//! token. Errors are collected and can be read through `errors()`.
//!
//! ```cpp
//! Source source = Source::from_string("enum E<'a> { A(&'a str) }");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize();
//! if (lexer.has_errors()) {
//!     report(lexer.errors());
//! }
//! ```

#ifndef VNC_LEXER_LEXER_HPP
#define VNC_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace vnc::lexer {

/// Error codes reported by the lexer.
namespace LexErrorCodes {
constexpr const char* UNEXPECTED_CHAR = "L001";
constexpr const char* UNTERMINATED_STRING = "L002";
constexpr const char* UNTERMINATED_COMMENT = "L003";
constexpr const char* UNTERMINATED_CHAR = "L004";
} // namespace LexErrorCodes

struct LexerError {
    std::string message;
    SourceSpan span;
    std::string code;
};

class Lexer {
public:
    /// The source must outlive the lexer and every token it returns.
    explicit Lexer(const Source& source);

    /// Returns the next token, `Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Lexes the whole source. The last token is always `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    // Character access
    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // Token creation
    [[nodiscard]] auto make_token(TokenKind kind) -> Token;
    [[nodiscard]] auto make_error_token(const std::string& message, const std::string& code)
        -> Token;
    void report_error(const std::string& message, const std::string& code);

    // Whitespace and comments
    void skip_whitespace();
    void skip_line_comment();
    void skip_block_comment();
    [[nodiscard]] auto at_line_doc_comment() const -> bool;
    [[nodiscard]] auto at_block_doc_comment() const -> bool;
    [[nodiscard]] auto lex_line_doc_comment() -> Token;
    [[nodiscard]] auto lex_block_doc_comment() -> Token;

    // Names
    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_raw_identifier() -> Token;
    [[nodiscard]] auto lex_char_or_lifetime() -> Token;

    // Literals
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_raw_string() -> Token;
    [[nodiscard]] auto lex_char_body() -> Token;

    // Operators and delimiters
    [[nodiscard]] auto lex_operator() -> Token;

    // Character classification
    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
    [[nodiscard]] static auto is_digit(char c) -> bool;
};

} // namespace vnc::lexer

#endif // VNC_LEXER_LEXER_HPP
