#include "diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace vnc::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = Options::colors && terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end())
        return "";

    const std::string& content = it->second;
    size_t line_start = 0;
    for (uint32_t current = 1; current < line; ++current) {
        line_start = content.find('\n', line_start);
        if (line_start == std::string::npos)
            return "";
        ++line_start;
    }

    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos)
        line_end = content.size();
    if (line_end > line_start && content[line_end - 1] == '\r')
        --line_end;
    return content.substr(line_start, line_end - line_start);
}

std::string DiagnosticEmitter::severity_string(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    }
    return "unknown";
}

const char* DiagnosticEmitter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::BrightRed;
    case DiagnosticSeverity::Warning:
        return Colors::BrightYellow;
    case DiagnosticSeverity::Note:
        return Colors::BrightCyan;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[D001]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const SourceSpan& span) {
    std::string file_path(span.start.file);
    if (file_path.empty()) {
        return;
    }

    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << file_path << ":"
         << span.start.line << ":" << span.start.column << "\n";

    std::string source_line = get_source_line(file_path, span.start.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = static_cast<int>(std::to_string(span.start.line).length());
    line_width = std::max(line_width, 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    // Span ends are exclusive; a span running past this line is underlined
    // to the end of the line.
    uint32_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    uint32_t end_col = span.end.line == span.start.line && span.end.column > span.start.column
                           ? span.end.column - 1
                           : static_cast<uint32_t>(source_line.length());
    if (end_col <= start_col) {
        end_col = start_col + 1;
    }

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    for (uint32_t i = 0; i < start_col; ++i) {
        out_ << (i < source_line.size() && source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(Colors::BrightRed);
    for (uint32_t i = start_col; i < end_col; ++i) {
        out_ << '^';
    }
    out_ << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        warning_count_++;
    }

    if (Options::diagnostic_format == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag.primary_span);
    emit_notes(diag.notes);
    emit_help(diag.help);
}

std::string DiagnosticEmitter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    out_ << "{";
    out_ << "\"severity\":\"" << severity_string(diag.severity) << "\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";

    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(std::string(diag.primary_span.start.file)) << "\",";
    out_ << "\"start\":{\"line\":" << diag.primary_span.start.line
         << ",\"column\":" << diag.primary_span.start.column << "},";
    out_ << "\"end\":{\"line\":" << diag.primary_span.end.line
         << ",\"column\":" << diag.primary_span.end.column << "}";
    out_ << "},";

    out_ << "\"notes\":[";
    bool first = true;
    for (const auto& note : diag.notes) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "\"" << escape_json_string(note) << "\"";
    }
    out_ << "],";

    out_ << "\"help\":[";
    first = true;
    for (const auto& h : diag.help) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "\"" << escape_json_string(h) << "\"";
    }
    out_ << "]";

    out_ << "}\n";
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message,
                              const SourceSpan& span, const std::vector<std::string>& notes) {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Error;
    diag.code = code;
    diag.message = message;
    diag.primary_span = span;
    diag.notes = notes;
    emit(diag);
}

void DiagnosticEmitter::error(const std::string& code, const std::string& message) {
    error(code, message, SourceSpan{});
}

// ============================================================================
// "Did You Mean?" Suggestions Implementation
// ============================================================================

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Two rows are enough
    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

} // namespace vnc::cli
