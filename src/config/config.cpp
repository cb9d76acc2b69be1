#include "config/config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <fstream>
#include <sstream>

namespace vnc::config {

namespace fs = std::filesystem;

constexpr int MAX_INDENT_WIDTH = 16;

ConfigParser::ConfigParser(std::string content) : content_(std::move(content)) {}

char ConfigParser::advance() {
    char c = content_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void ConfigParser::skip_whitespace() {
    while (!is_eof()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '#') {
            skip_comment();
        } else {
            break;
        }
    }
}

void ConfigParser::skip_comment() {
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

void ConfigParser::skip_to_line_end() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
    if (peek() == '#') {
        skip_comment();
    }
}

void ConfigParser::set_error(const std::string& message) {
    if (error_message_.empty()) {
        error_message_ = std::string(CONFIG_FILE_NAME) + ":" + std::to_string(line_) + ": " + message;
    }
}

auto ConfigParser::parse_identifier() -> std::string {
    std::string ident;
    while (!is_eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            ident += advance();
        } else {
            break;
        }
    }
    return ident;
}

auto ConfigParser::parse_string() -> std::optional<std::string> {
    if (peek() != '"') {
        set_error("expected a string");
        return std::nullopt;
    }
    advance();

    std::string value;
    while (!is_eof() && peek() != '"') {
        if (peek() == '\n') {
            set_error("unterminated string");
            return std::nullopt;
        }
        char c = advance();
        if (c == '\\' && !is_eof()) {
            char esc = advance();
            switch (esc) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            case '"':
            case '\\':
                value += esc;
                break;
            default:
                set_error(std::string("unknown escape `\\") + esc + "`");
                return std::nullopt;
            }
            continue;
        }
        value += c;
    }
    if (is_eof()) {
        set_error("unterminated string");
        return std::nullopt;
    }
    advance(); // closing quote
    return value;
}

auto ConfigParser::parse_integer() -> std::optional<int> {
    std::string digits;
    if (peek() == '-' || peek() == '+') {
        digits += advance();
    }
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_') {
            digits += c;
        }
    }
    if (digits.empty() || digits == "-" || digits == "+") {
        set_error("expected an integer");
        return std::nullopt;
    }
    if (digits.size() > 9) {
        set_error("integer out of range");
        return std::nullopt;
    }
    return std::stoi(digits);
}

auto ConfigParser::parse_boolean() -> std::optional<bool> {
    auto word = parse_identifier();
    if (word == "true") {
        return true;
    }
    if (word == "false") {
        return false;
    }
    return std::nullopt;
}

auto ConfigParser::parse_section_header() -> std::optional<std::string> {
    advance(); // [
    auto name = parse_identifier();
    while (peek() == '.') {
        name += advance();
        name += parse_identifier();
    }
    if (name.empty()) {
        set_error("expected section name");
        return std::nullopt;
    }
    if (peek() != ']') {
        set_error("expected `]` after section name");
        return std::nullopt;
    }
    advance();
    return name;
}

bool ConfigParser::parse_entry(Config& config) {
    auto key = parse_identifier();
    if (key.empty()) {
        set_error(std::string("unexpected character `") + peek() + "`");
        return false;
    }
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }
    if (peek() != '=') {
        set_error("expected `=` after `" + key + "`");
        return false;
    }
    advance();
    while (peek() == ' ' || peek() == '\t') {
        advance();
    }

    if (section_ == "format" && key == "indent_width") {
        auto width = parse_integer();
        if (!width) {
            return false;
        }
        if (*width < 1 || *width > MAX_INDENT_WIDTH) {
            set_error("`indent_width` must be between 1 and " + std::to_string(MAX_INDENT_WIDTH));
            return false;
        }
        config.format.indent_width = *width;
        return true;
    }
    if (section_ == "format" && (key == "use_tabs" || key == "doc_comment")) {
        auto value = parse_boolean();
        if (!value) {
            set_error("`" + key + "` expects `true` or `false`");
            return false;
        }
        if (key == "use_tabs") {
            config.format.use_tabs = *value;
        } else {
            config.format.doc_comment = *value;
        }
        return true;
    }
    if (section_ == "log" && (key == "level" || key == "filter")) {
        auto value = parse_string();
        if (!value) {
            return false;
        }
        if (key == "level") {
            config.log.level = std::move(*value);
        } else {
            config.log.filter = std::move(*value);
        }
        return true;
    }

    VNC_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_ << ": ignoring unknown key `"
                                            << (section_.empty() ? key : section_ + "." + key)
                                            << "`");
    skip_comment();
    return true;
}

auto ConfigParser::parse() -> Result<Config, std::string> {
    Config config;

    while (true) {
        skip_whitespace();
        if (is_eof()) {
            break;
        }

        if (peek() == '[') {
            auto header = parse_section_header();
            if (!header) {
                return error_message_;
            }
            section_ = std::move(*header);
            if (section_ != "format" && section_ != "log") {
                VNC_LOG_WARN("config", CONFIG_FILE_NAME << ":" << line_
                                                        << ": ignoring unknown section `["
                                                        << section_ << "]`");
            }
        } else if (!parse_entry(config)) {
            return error_message_;
        }

        skip_to_line_end();
        if (!is_eof() && peek() != '\n') {
            set_error("expected end of line");
            return error_message_;
        }
    }

    return config;
}

auto parse_config(const std::string& content) -> Result<Config, std::string> {
    ConfigParser parser(content);
    return parser.parse();
}

auto load_config(const fs::path& path) -> Result<Config, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot open config file: " + path.string();
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return "cannot read config file: " + path.string();
    }

    VNC_LOG_DEBUG("config", "loading " << path.string());
    return parse_config(buffer.str());
}

auto find_config(const fs::path& input) -> std::optional<fs::path> {
    std::error_code ec;
    auto beside = input.parent_path() / CONFIG_FILE_NAME;
    if (fs::is_regular_file(beside, ec)) {
        return beside;
    }
    auto cwd = fs::current_path(ec);
    if (!ec) {
        auto local = cwd / CONFIG_FILE_NAME;
        if (fs::is_regular_file(local, ec)) {
            return local;
        }
    }
    return std::nullopt;
}

} // namespace vnc::config
