//! # Source Writer
//!
//! Indentation-aware text buffer used to print generated Rust code.
//!
//! | Method          | Description                              |
//! |-----------------|------------------------------------------|
//! | `emit()`        | Append text as-is                        |
//! | `emit_line()`   | Append an indented line with newline     |
//! | `emit_newline()`| Append a bare newline                    |
//! | `push_indent()` | Increase indentation level               |
//! | `pop_indent()`  | Decrease indentation level               |
//! | `indent_str()`  | Current indentation string               |

#ifndef VNC_FORMAT_WRITER_HPP
#define VNC_FORMAT_WRITER_HPP

#include <sstream>
#include <string>

namespace vnc::format {

/// Layout of generated code.
struct FormatOptions {
    /// Spaces per indentation level when `use_tabs` is false.
    int indent_width = 4;

    /// Indent with one tab per level.
    bool use_tabs = false;

    /// Emit the `///` line above the generated accessor.
    bool doc_comment = true;
};

class SourceWriter {
public:
    /// `base_indent` prefixes every non-empty line, so generated code can
    /// sit at the indentation of the item it follows.
    explicit SourceWriter(FormatOptions options = {}, std::string base_indent = {});

    void emit(const std::string& text);
    void emit_line(const std::string& text);
    void emit_newline();
    void push_indent();
    void pop_indent();

    [[nodiscard]] auto indent_str() const -> std::string;

    [[nodiscard]] auto options() const -> const FormatOptions& {
        return options_;
    }

    [[nodiscard]] auto str() const -> std::string {
        return output_.str();
    }

private:
    FormatOptions options_;
    std::string base_indent_;
    std::ostringstream output_;
    int indent_level_ = 0;
};

} // namespace vnc::format

#endif // VNC_FORMAT_WRITER_HPP
