//! # Source File Management
//!
//! A source file held in memory with a line index, so byte offsets can be
//! turned into line/column locations for spans and diagnostics.
//!
//! ```cpp
//! Source source = Source::from_string("enum E { A, B }", "<test>");
//! SourceLocation loc = source.location(5); // line 1, column 6
//! std::string_view line = source.line(1);  // "enum E { A, B }"
//! ```

#ifndef VNC_LEXER_SOURCE_HPP
#define VNC_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace vnc::lexer {

/// Owns the text of one input and answers location queries about it.
///
/// Views returned by `content()`, `slice()` and `line()` and the `file`
/// field of every `SourceLocation` stay valid while the `Source` lives.
/// A `Source` is therefore not copyable; move it only before lexing.
class Source {
public:
    Source(std::string filename, std::string content);

    Source(const Source&) = delete;
    auto operator=(const Source&) -> Source& = delete;
    Source(Source&&) noexcept = default;
    auto operator=(Source&&) noexcept -> Source& = default;

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return *filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Bytes in `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Text covered by a span of this source.
    [[nodiscard]] auto text(const SourceSpan& span) const -> std::string_view {
        return slice(span.start.offset, span.end.offset);
    }

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Content of a 1-based line without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Offset of the first byte of the line containing `offset`.
    [[nodiscard]] auto line_start(size_t offset) const -> size_t;

    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    // Heap-allocated so views into the name survive moves of the Source.
    Box<std::string> filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace vnc::lexer

#endif // VNC_LEXER_SOURCE_HPP
