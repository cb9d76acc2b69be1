//! # Common Definitions
//!
//! Shared types used by every stage of the variant-name generator: version
//! constants, global options, source locations and the `Result` type.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership
//! - **Views into Sources**: spans and lexemes borrow from a `Source` that
//!   outlives them

#ifndef VNC_COMMON_HPP
#define VNC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace vnc {

// ============================================================================
// Version Information
// ============================================================================

/// The generator version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Global Configuration
// ============================================================================

/// Output format for diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text with source snippets (default)
    JSON  ///< One JSON object per line for editor integration
};

/// Process-wide options set by the driver before any expansion starts.
///
/// ```cpp
/// Options::diagnostic_format = DiagnosticFormat::JSON;
/// Options::colors = false;
/// ```
struct Options {
    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Allow ANSI colors in diagnostics (still requires a terminal).
    static inline bool colors = true;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in a source file.
///
/// `line` and `column` are 1-based, `offset` is a 0-based byte offset.
struct SourceLocation {
    std::string_view file;
    uint32_t line = 1;
    uint32_t column = 1;
    uint32_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A contiguous region of source text.
///
/// `end` points one past the last byte of the region, so
/// `end.offset - start.offset` is the region's length.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Returns the number of bytes covered by the span.
    [[nodiscard]] auto length() const -> uint32_t {
        return end.offset >= start.offset ? end.offset - start.offset : 0;
    }

    /// Returns a span from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto result = Source::from_file(path);
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace vnc

#endif // VNC_COMMON_HPP
