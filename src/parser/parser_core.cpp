//! # Parser Core
//!
//! Token navigation, error construction, recovery and the two entry points.
//!
//! ## Token Runs
//!
//! Types, bounds and expressions inside an item header are not parsed into
//! trees. `collect_until()` walks a balanced run of tokens up to one of a
//! set of stop tokens, and `render()` turns the run back into text.

#include "log/log.hpp"
#include "parser/parser.hpp"

#include <algorithm>

namespace vnc::parser {

using lexer::Token;
using lexer::TokenKind;

namespace {

auto is_opener(TokenKind kind) -> bool {
    return kind == TokenKind::LParen || kind == TokenKind::LBracket || kind == TokenKind::LBrace;
}

auto is_closer(TokenKind kind) -> bool {
    return kind == TokenKind::RParen || kind == TokenKind::RBracket || kind == TokenKind::RBrace;
}

auto closer_for(TokenKind opener) -> TokenKind {
    switch (opener) {
    case TokenKind::LParen:
        return TokenKind::RParen;
    case TokenKind::LBracket:
        return TokenKind::RBracket;
    default:
        return TokenKind::RBrace;
    }
}

auto starts_item(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::Pound:
    case TokenKind::DocComment:
    case TokenKind::KwPub:
    case TokenKind::KwEnum:
    case TokenKind::KwStruct:
    case TokenKind::KwFn:
    case TokenKind::KwMod:
    case TokenKind::KwUse:
    case TokenKind::KwImpl:
    case TokenKind::KwTrait:
    case TokenKind::KwConst:
    case TokenKind::KwStatic:
    case TokenKind::KwType:
    case TokenKind::KwExtern:
        return true;
    default:
        return false;
    }
}

} // namespace

auto item_kind_name(ItemKind kind) -> std::string_view {
    switch (kind) {
    case ItemKind::Enum:
        return "enum";
    case ItemKind::Struct:
        return "struct";
    case ItemKind::Union:
        return "union";
    case ItemKind::Function:
        return "fn";
    case ItemKind::Impl:
        return "impl";
    case ItemKind::Trait:
        return "trait";
    case ItemKind::TypeAlias:
        return "type";
    case ItemKind::Const:
        return "const";
    case ItemKind::Static:
        return "static";
    case ItemKind::Module:
        return "mod";
    case ItemKind::Use:
        return "use";
    case ItemKind::ExternCrate:
        return "extern crate";
    case ItemKind::ExternBlock:
        return "extern block";
    case ItemKind::MacroRules:
        return "macro_rules";
    case ItemKind::MacroCall:
        return "macro invocation";
    }
    return "item";
}

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        tokens_.push_back(Token{.kind = TokenKind::Eof, .span = {}, .lexeme = {}});
    }
}

// ============================================================================
// Navigation
// ============================================================================

auto Parser::peek() const -> const Token& {
    return tokens_[pos_];
}

auto Parser::peek_at(size_t offset) const -> const Token& {
    return tokens_[std::min(pos_ + offset, tokens_.size() - 1)];
}

auto Parser::previous() const -> const Token& {
    return tokens_[pos_ > 0 ? pos_ - 1 : 0];
}

auto Parser::advance() -> const Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().is(kind);
}

auto Parser::check_word(std::string_view word) const -> bool {
    return peek().is(TokenKind::Identifier) && peek().lexeme == word;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const std::string& message) -> Result<Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    auto code = is_closer(kind) ? ParseErrorCodes::UNBALANCED_DELIMITER
                                : ParseErrorCodes::EXPECTED_TOKEN;
    return make_error(message + ", found " + describe(peek()), code);
}

auto Parser::expect_identifier(const std::string& what) -> Result<Token, ParseError> {
    if (check(TokenKind::Identifier)) {
        return advance();
    }
    return make_error("expected " + what + ", found " + describe(peek()),
                      ParseErrorCodes::EXPECTED_IDENTIFIER);
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::make_error(const std::string& message, const std::string& code) const
    -> ParseError {
    return ParseError{.message = message, .span = peek().span, .notes = {}, .code = code};
}

auto Parser::describe(const Token& token) const -> std::string {
    if (token.is_eof()) {
        return "end of file";
    }
    if (token.is(TokenKind::Identifier)) {
        return "identifier `" + std::string(token.lexeme) + "`";
    }
    return "`" + std::string(token.lexeme) + "`";
}

void Parser::synchronize() {
    int depth = 0;
    bool first = true;

    while (!is_at_end()) {
        const auto& tok = peek();
        if (!first && depth == 0) {
            if (starts_item(tok.kind)) {
                return;
            }
            // Leave the closing brace of an enclosing module to its owner
            if (tok.is(TokenKind::RBrace)) {
                return;
            }
        }
        first = false;

        advance();
        if (is_opener(tok.kind)) {
            ++depth;
        } else if (is_closer(tok.kind)) {
            if (--depth <= 0) {
                if (tok.is(TokenKind::RBrace)) {
                    return;
                }
                depth = 0;
            }
        } else if (depth == 0 && tok.is(TokenKind::Semi)) {
            return;
        }
    }
}

// ============================================================================
// Entry Points
// ============================================================================

auto Parser::parse_module(const std::string& name) -> Result<Module, std::vector<ParseError>> {
    Module module;
    module.name = name;

    parse_items_until(TokenKind::Eof, module.inner_attributes, module.items);

    if (has_errors()) {
        return errors_;
    }
    VNC_LOG_DEBUG("parser", "module " << name << ": " << module.items.size() << " items");
    return module;
}

auto Parser::parse_single_item() -> Result<Item, ParseError> {
    std::vector<Attribute> inner;
    auto inner_result = parse_inner_attributes(inner);
    if (is_err(inner_result)) {
        return unwrap_err(inner_result);
    }

    auto item = parse_item();
    if (is_err(item)) {
        return item;
    }
    // Errors inside an inline module body are recorded, not returned
    if (has_errors()) {
        return errors_.front();
    }

    if (!is_at_end()) {
        return make_error("expected a single item, found " + describe(peek()),
                          ParseErrorCodes::NOT_SINGLE_ITEM);
    }
    return item;
}

auto Parser::parse_items_until(TokenKind terminator, std::vector<Attribute>& inner,
                               std::vector<Item>& items) -> bool {
    auto inner_result = parse_inner_attributes(inner);
    if (is_err(inner_result)) {
        errors_.push_back(unwrap_err(inner_result));
        synchronize();
    }

    while (!check(terminator) && !is_at_end()) {
        auto item = parse_item();
        if (is_ok(item)) {
            items.push_back(std::move(unwrap(item)));
            continue;
        }
        errors_.push_back(std::move(unwrap_err(item)));
        // The loop condition excludes the terminator, so a module body that
        // ends right at the error still makes progress without recovery
        if (!check(terminator)) {
            synchronize();
        }
    }
    return !has_errors();
}

// ============================================================================
// Token Runs
// ============================================================================

auto Parser::skip_group() -> Result<bool, ParseError> {
    if (!is_opener(peek().kind)) {
        return make_error("expected `(`, `[` or `{`, found " + describe(peek()),
                          ParseErrorCodes::EXPECTED_TOKEN);
    }

    std::vector<TokenKind> open;
    std::vector<SourceSpan> open_spans;
    do {
        const auto& tok = advance();
        if (is_opener(tok.kind)) {
            open.push_back(closer_for(tok.kind));
            open_spans.push_back(tok.span);
        } else if (is_closer(tok.kind)) {
            if (tok.kind != open.back()) {
                return ParseError{.message = "mismatched closing delimiter `" +
                                             std::string(tok.lexeme) + "`",
                                  .span = tok.span,
                                  .notes = {"expected `" +
                                            std::string(lexer::token_kind_to_string(open.back())) +
                                            "`"},
                                  .code = ParseErrorCodes::UNBALANCED_DELIMITER};
            }
            open.pop_back();
            open_spans.pop_back();
        }
    } while (!open.empty() && !is_at_end());

    if (!open.empty()) {
        return ParseError{.message = "unclosed delimiter",
                          .span = open_spans.back(),
                          .notes = {},
                          .code = ParseErrorCodes::UNBALANCED_DELIMITER};
    }
    return true;
}

auto Parser::collect_until(std::initializer_list<TokenKind> stops, bool track_angles)
    -> Result<size_t, ParseError> {
    size_t begin = pos_;
    int angles = 0;

    while (!is_at_end()) {
        const auto& tok = peek();

        if (angles == 0) {
            bool is_stop = false;
            for (auto stop : stops) {
                is_stop = is_stop || tok.is(stop);
            }
            if (is_stop) {
                break;
            }
        }

        if (is_opener(tok.kind)) {
            auto skipped = skip_group();
            if (is_err(skipped)) {
                return unwrap_err(skipped);
            }
            continue;
        }
        if (is_closer(tok.kind)) {
            return make_error("unexpected closing delimiter `" + std::string(tok.lexeme) + "`",
                              ParseErrorCodes::UNBALANCED_DELIMITER);
        }

        if (track_angles && tok.is(TokenKind::Lt)) {
            ++angles;
        } else if (track_angles && tok.is(TokenKind::Gt) && angles > 0) {
            --angles;
        }
        advance();
    }

    return begin;
}

auto Parser::render(size_t begin, size_t end) const -> std::string {
    std::string text;
    for (size_t i = begin; i < end && i < tokens_.size(); ++i) {
        if (i > begin && tokens_[i].span.start.offset > tokens_[i - 1].span.end.offset) {
            text += ' ';
        }
        text += tokens_[i].lexeme;
    }
    return text;
}

} // namespace vnc::parser
