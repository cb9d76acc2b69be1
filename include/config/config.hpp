//! # Project Configuration
//!
//! Optional `vnc.toml` read by the driver before expansion.
//!
//! ```toml
//! [format]
//! indent_width = 4
//! use_tabs = false
//! doc_comment = true
//!
//! [log]
//! level = "warn"
//! filter = "expand=debug"
//! ```
//!
//! | Section    | Struct          | Description                 |
//! |------------|-----------------|-----------------------------|
//! | `[format]` | `FormatOptions` | Layout of generated code    |
//! | `[log]`    | `LogSettings`   | Defaults for the logger     |
//!
//! Command-line flags override values from the file. Unknown keys and
//! sections are logged and ignored; a value of the wrong type is an error.
//!
//! ## TOML Parser
//!
//! `ConfigParser` handles the subset of TOML used here: `[section]`
//! headers, `key = value` pairs with string, integer or boolean values,
//! and `#` comments.

#ifndef VNC_CONFIG_CONFIG_HPP
#define VNC_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "format/writer.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace vnc::config {

/// Name of the project configuration file.
constexpr const char* CONFIG_FILE_NAME = "vnc.toml";

/// Logger defaults from `[log]`. Empty means unset.
struct LogSettings {
    std::string level;
    std::string filter;
};

struct Config {
    format::FormatOptions format;
    LogSettings log;
};

class ConfigParser {
public:
    explicit ConfigParser(std::string content);

    /// Parses the whole content. Errors carry the 1-based line number.
    [[nodiscard]] auto parse() -> Result<Config, std::string>;

private:
    std::string content_;
    size_t pos_ = 0;
    int line_ = 1;
    std::string section_;

    void skip_whitespace();
    void skip_comment();
    void skip_to_line_end();
    [[nodiscard]] bool is_eof() const {
        return pos_ >= content_.size();
    }
    [[nodiscard]] char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    auto parse_identifier() -> std::string;
    auto parse_string() -> std::optional<std::string>;
    auto parse_integer() -> std::optional<int>;
    auto parse_boolean() -> std::optional<bool>;
    auto parse_section_header() -> std::optional<std::string>;

    /// Parses one `key = value` line into `config`. Returns false on error.
    bool parse_entry(Config& config);

    /// Records the first error, prefixed with the current line.
    void set_error(const std::string& message);
    std::string error_message_;
};

/// Parses configuration text.
[[nodiscard]] auto parse_config(const std::string& content) -> Result<Config, std::string>;

/// Reads and parses a configuration file.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config, std::string>;

/// Finds `vnc.toml` next to `input`, then in the working directory.
[[nodiscard]] auto find_config(const std::filesystem::path& input)
    -> std::optional<std::filesystem::path>;

} // namespace vnc::config

#endif // VNC_CONFIG_CONFIG_HPP
