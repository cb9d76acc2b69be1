#include "derive/expand.hpp"

#include "derive/variant_name.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

namespace vnc::derive {

namespace {

/// One planned change to the source text: bytes `[start, end)` are
/// replaced by `text`. An insertion has `start == end`.
struct Edit {
    size_t start = 0;
    size_t end = 0;
    std::string text;
};

auto from_lexer(const lexer::LexerError& err) -> ExpandError {
    return ExpandError{.code = err.code, .message = err.message, .span = err.span, .notes = {}};
}

auto from_parser(const parser::ParseError& err) -> ExpandError {
    return ExpandError{
        .code = err.code, .message = err.message, .span = err.span, .notes = err.notes};
}

auto from_derive(const DeriveError& err) -> ExpandError {
    return ExpandError{
        .code = err.code, .message = err.message, .span = err.span, .notes = err.notes};
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/// Leading whitespace of the line the item starts on.
auto indentation_of(const lexer::Source& source, size_t offset) -> std::string {
    size_t begin = source.line_start(offset);
    size_t end = begin;
    while (end < offset && (source.at(end) == ' ' || source.at(end) == '\t')) {
        ++end;
    }
    return std::string(source.slice(begin, end));
}

auto tokenize(const lexer::Source& source, std::vector<ExpandError>& errors)
    -> std::vector<lexer::Token> {
    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();
    for (const auto& err : lex.errors()) {
        errors.push_back(from_lexer(err));
    }
    return tokens;
}

/// Plans the edits for one directed item, or records why it cannot be
/// expanded. Every attribute carrying a directive is consumed, then the
/// impl is inserted after the item.
void plan_item(const lexer::Source& source, const parser::Item& item, DirectiveMode mode,
               const format::FormatOptions& options, std::vector<Edit>& edits,
               std::vector<ExpandError>& errors) {
    auto sum = extract_sum_type(item, mode);
    if (is_err(sum)) {
        errors.push_back(from_derive(unwrap_err(sum)));
        return;
    }

    for (const auto& attr : item.attributes) {
        auto replacement = consume_directive(attr);
        if (!replacement) {
            continue;
        }
        Edit edit{
            .start = attr.span.start.offset, .end = attr.span.end.offset, .text = *replacement};
        if (edit.text.empty()) {
            // A removed attribute takes the whitespace after it along
            while (edit.end < source.length() && is_space(source.at(edit.end))) {
                ++edit.end;
            }
        }
        edits.push_back(std::move(edit));
    }

    // The impl ends with a newline; the text after the item supplies its own
    auto impl = emit_dispatch(unwrap(sum), options, indentation_of(source, item.span.start.offset));
    size_t insert_at = item.span.end.offset;
    if (!impl.empty() && impl.back() == '\n' && insert_at < source.length()) {
        impl.pop_back();
    }
    edits.push_back(Edit{.start = insert_at, .end = insert_at, .text = "\n\n" + impl});
}

/// Returns the number of items expanded.
auto plan_items(const lexer::Source& source, const std::vector<parser::Item>& items,
                const format::FormatOptions& options, std::vector<Edit>& edits,
                std::vector<ExpandError>& errors) -> size_t {
    size_t planned = 0;
    for (const auto& item : items) {
        if (auto directive = find_directive(item)) {
            VNC_LOG_DEBUG("expand", directive_display(directive->mode) << " on `" << item.name
                                                                       << "`");
            plan_item(source, item, directive->mode, options, edits, errors);
            ++planned;
        }
        if (item.kind == parser::ItemKind::Module) {
            planned += plan_items(source, item.children, options, edits, errors);
        }
    }
    return planned;
}

/// Applies edits in source order. `plan_items` visits items in order and
/// a directed module is rejected, so edits never overlap.
auto apply(const lexer::Source& source, const std::vector<Edit>& edits) -> std::string {
    std::string out;
    out.reserve(source.length() + edits.size() * 128);

    size_t cursor = 0;
    for (const auto& edit : edits) {
        out.append(source.slice(cursor, edit.start));
        out += edit.text;
        cursor = edit.end;
    }
    out.append(source.slice(cursor, source.length()));
    return out;
}

} // namespace

auto expand_declaration(const lexer::Source& source, DirectiveMode mode,
                        const format::FormatOptions& options)
    -> Result<ExpandOutput, std::vector<ExpandError>> {
    std::vector<ExpandError> errors;
    auto tokens = tokenize(source, errors);
    if (!errors.empty()) {
        return errors;
    }

    parser::Parser parser(std::move(tokens));
    auto item = parser.parse_single_item();
    if (is_err(item)) {
        errors.push_back(from_parser(unwrap_err(item)));
        return errors;
    }
    const auto& decl = unwrap(item);

    if (mode == DirectiveMode::Annotation) {
        auto sum = extract_sum_type(decl, mode);
        if (is_err(sum)) {
            errors.push_back(from_derive(unwrap_err(sum)));
            return errors;
        }
        return ExpandOutput{.text = emit_dispatch(unwrap(sum), options), .expanded = 1};
    }

    // The attachment attribute may or may not still be on the input; it is
    // consumed when it is.
    std::vector<Edit> edits;
    plan_item(source, decl, mode, options, edits, errors);
    if (!errors.empty()) {
        return errors;
    }
    return ExpandOutput{.text = derive::apply(source, edits), .expanded = 1};
}

auto expand_module(const lexer::Source& source, const format::FormatOptions& options)
    -> Result<ExpandOutput, std::vector<ExpandError>> {
    std::vector<ExpandError> errors;
    auto tokens = tokenize(source, errors);
    if (!errors.empty()) {
        return errors;
    }

    parser::Parser parser(std::move(tokens));
    auto module = parser.parse_module(std::string(source.filename()));
    if (is_err(module)) {
        for (const auto& err : unwrap_err(module)) {
            errors.push_back(from_parser(err));
        }
        return errors;
    }

    std::vector<Edit> edits;
    size_t expanded = plan_items(source, unwrap(module).items, options, edits, errors);
    if (!errors.empty()) {
        VNC_LOG_DEBUG("expand", source.filename() << ": " << errors.size() << " errors");
        return errors;
    }

    VNC_LOG_INFO("expand", source.filename() << ": expanded " << expanded << " items");
    return ExpandOutput{.text = derive::apply(source, edits), .expanded = expanded};
}

} // namespace vnc::derive
