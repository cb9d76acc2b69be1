#include "format/writer.hpp"

namespace vnc::format {

SourceWriter::SourceWriter(FormatOptions options, std::string base_indent)
    : options_(options), base_indent_(std::move(base_indent)) {}

void SourceWriter::emit(const std::string& text) {
    output_ << text;
}

void SourceWriter::emit_line(const std::string& text) {
    if (!text.empty()) {
        output_ << indent_str();
    }
    output_ << text << "\n";
}

void SourceWriter::emit_newline() {
    output_ << "\n";
}

void SourceWriter::push_indent() {
    ++indent_level_;
}

void SourceWriter::pop_indent() {
    if (indent_level_ > 0)
        --indent_level_;
}

auto SourceWriter::indent_str() const -> std::string {
    if (options_.use_tabs) {
        return base_indent_ + std::string(indent_level_, '\t');
    }
    return base_indent_ + std::string(static_cast<size_t>(indent_level_ * options_.indent_width), ' ');
}

} // namespace vnc::format
