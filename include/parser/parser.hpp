//! # Item Parser
//!
//! Recursive-descent parser over the token stream that recognizes Rust
//! items. Enum, struct and union headers are parsed in full; other items
//! are delimited and skipped so the file can be passed through untouched.
//!
//! ```cpp
//! Lexer lexer(source);
//! Parser parser(lexer.tokenize());
//! auto result = parser.parse_module("lib");
//! if (is_err(result)) {
//!     for (const auto& err : unwrap_err(result)) { ... }
//! }
//! ```

#ifndef VNC_PARSER_PARSER_HPP
#define VNC_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/token.hpp"
#include "parser/ast.hpp"

#include <string>
#include <vector>

namespace vnc::parser {

namespace ParseErrorCodes {
constexpr const char* EXPECTED_ITEM = "P001";
constexpr const char* EXPECTED_IDENTIFIER = "P002";
constexpr const char* UNBALANCED_DELIMITER = "P003";
constexpr const char* EXPECTED_TOKEN = "P004";
constexpr const char* NOT_SINGLE_ITEM = "P005";
} // namespace ParseErrorCodes

struct ParseError {
    std::string message;
    SourceSpan span;
    std::vector<std::string> notes;
    std::string code;
};

class Parser {
public:
    /// `tokens` must end with `Eof`, as produced by `Lexer::tokenize()`.
    explicit Parser(std::vector<lexer::Token> tokens);

    /// Parses every item of a file. Errors are collected; after an error
    /// the parser resynchronizes at the next item boundary.
    [[nodiscard]] auto parse_module(const std::string& name)
        -> Result<Module, std::vector<ParseError>>;

    /// Parses exactly one item followed by end of input.
    [[nodiscard]] auto parse_single_item() -> Result<Item, ParseError>;

    [[nodiscard]] auto errors() const -> const std::vector<ParseError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    std::vector<ParseError> errors_;

    // Token navigation
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_at(size_t offset) const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_word(std::string_view word) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& message)
        -> Result<lexer::Token, ParseError>;
    auto expect_identifier(const std::string& what) -> Result<lexer::Token, ParseError>;

    // Errors
    [[nodiscard]] auto make_error(const std::string& message, const std::string& code) const
        -> ParseError;
    [[nodiscard]] auto describe(const lexer::Token& token) const -> std::string;
    void synchronize();

    // Items
    auto parse_items_until(lexer::TokenKind terminator, std::vector<Attribute>& inner,
                           std::vector<Item>& items) -> bool;
    auto parse_item() -> Result<Item, ParseError>;
    auto parse_inner_attributes(std::vector<Attribute>& out) -> Result<bool, ParseError>;
    auto parse_outer_attributes() -> Result<std::vector<Attribute>, ParseError>;
    auto parse_attribute() -> Result<Attribute, ParseError>;
    auto parse_visibility() -> Result<Visibility, ParseError>;
    auto parse_enum(Item& item) -> Result<bool, ParseError>;
    auto parse_struct(Item& item) -> Result<bool, ParseError>;
    auto parse_union(Item& item) -> Result<bool, ParseError>;
    auto parse_module_item(Item& item) -> Result<bool, ParseError>;
    auto parse_macro(Item& item) -> Result<bool, ParseError>;
    auto parse_other(Item& item) -> Result<bool, ParseError>;

    // Enum bodies
    auto parse_variants() -> Result<std::vector<Variant>, ParseError>;
    auto parse_variant() -> Result<Variant, ParseError>;
    auto parse_tuple_fields() -> Result<size_t, ParseError>;
    auto parse_record_fields() -> Result<std::vector<std::string>, ParseError>;

    // Generics
    auto parse_generic_params() -> Result<std::vector<GenericParam>, ParseError>;
    auto parse_generic_param() -> Result<GenericParam, ParseError>;
    auto parse_where_clause() -> Result<std::optional<WhereClause>, ParseError>;

    // Token runs
    auto skip_group() -> Result<bool, ParseError>;
    auto collect_until(std::initializer_list<lexer::TokenKind> stops, bool track_angles)
        -> Result<size_t, ParseError>;
    [[nodiscard]] auto render(size_t begin, size_t end) const -> std::string;
};

} // namespace vnc::parser

#endif // VNC_PARSER_PARSER_HPP
