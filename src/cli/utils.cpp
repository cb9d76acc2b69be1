#include "utils.hpp"

#include "common.hpp"

#include <fstream>

namespace vnc::cli {

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return false;
    }
    file << content;
    file.flush();
    return static_cast<bool>(file);
}

void print_usage(std::ostream& out) {
    out << "vnc " << VERSION << " - variant name generator for Rust enums\n\n";
    out << "Usage: vnc <command> [options] <input.rs>\n\n";
    out << "Commands:\n";
    out << "  expand    Expand directives and print the result\n";
    out << "  check     Report diagnostics without writing output\n";
    out << "  lex       Tokenize a file (debug)\n";
    out << "  parse     Parse a file and list its items (debug)\n";
    out << "\nExpand options:\n";
    out << "  -o, --output=<file>         Write to <file> instead of stdout\n";
    out << "  --mode=auto|attach|derive   auto: use the directives in the file;\n";
    out << "                              attach/derive: expand a single declaration\n";
    out << "\nOptions:\n";
    out << "  --config=<file>             Use <file> instead of looking for vnc.toml\n";
    out << "  --diagnostic-format=<fmt>   text (default) or json\n";
    out << "  --no-color                  Disable colored diagnostics\n";
    out << "  --log-level=<level>         trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>         Per-module levels, e.g. expand=debug,*=warn\n";
    out << "  --log-file=<file>           Also write log messages to <file>\n";
    out << "  --log-format=text|json      Log message format\n";
    out << "  -v, -vv, -vvv               Info, debug, trace logging\n";
    out << "  -q, --quiet                 Only log errors\n";
    out << "  --help, -h                  Show this help\n";
    out << "  --version, -V               Show version\n";
}

void print_version() {
    std::cout << "vnc " << VERSION << "\n";
}

} // namespace vnc::cli
