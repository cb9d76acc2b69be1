//! # Diagnostic System Interface
//!
//! Formats errors for the terminal or for tools.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category | Example                              |
//! |--------|----------|--------------------------------------|
//! | L      | Lexer    | L001 - Unexpected character          |
//! | P      | Parser   | P003 - Unbalanced delimiter          |
//! | D      | Derive   | D001 - Directive on a non-enum       |
//! | E      | General  | E001 - Cannot read input             |
//!
//! ## Text Output
//!
//! ```text
//! error[D001]: `#[derive(EnumVariantNameConst)]` is only applicable to sum types (enums)
//!   --> src/lib.rs:2:8
//!      |
//!    2 | struct Point { x: u8 }
//!      |        ^^^^^
//!      |
//!   = note: `Point` is a `struct` item
//! ```
//!
//! With `DiagnosticFormat::JSON` each diagnostic is one JSON object per line.

#pragma once

#include "common.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace vnc::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Error Codes
// ============================================================================
//
// Lexer, parser and derive codes are defined next to the code that raises
// them (`LexErrorCodes`, `ParseErrorCodes`, `DeriveErrorCodes`). The driver
// owns the general ones.
//
namespace ErrorCodes {
constexpr const char* FILE_READ = "E001";
constexpr const char* FILE_WRITE = "E002";
constexpr const char* CONFIG = "E003";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic Message
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;
    std::string message;
    SourceSpan primary_span;
    std::vector<std::string> notes;
    std::vector<std::string> help;
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    /// Registers file content so snippets can be printed for spans in `path`.
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const Diagnostic& diag);

    void error(const std::string& code, const std::string& message, const SourceSpan& span,
               const std::vector<std::string>& notes = {});

    /// An error without a source location (I/O, configuration).
    void error(const std::string& code, const std::string& message);

    [[nodiscard]] size_t error_count() const {
        return error_count_;
    }
    [[nodiscard]] size_t warning_count() const {
        return warning_count_;
    }
    void reset_counts() {
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    std::unordered_map<std::string, std::string> source_files_; // path -> content
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const SourceSpan& span);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);

    void emit_json(const Diagnostic& diag);
    static std::string escape_json_string(const std::string& s);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    std::string severity_string(DiagnosticSeverity sev) const;
    const char* severity_color(DiagnosticSeverity sev) const;
};

// ============================================================================
// Global Diagnostic Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter();

bool terminal_supports_colors();

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/// Case-insensitive edit distance between two strings.
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/// Closest candidate within `max_distance` edits, or an empty string.
std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance = 3);

} // namespace vnc::cli
