//! # CLI Command Dispatcher
//!
//! Parses command-line arguments, sets up logging, diagnostics and the
//! project configuration, then routes to a command handler.
//!
//! ```text
//! vnc_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ expand         → run_expand()
//!   ├─ check          → run_expand() (check only)
//!   ├─ lex            → run_lex()
//!   └─ parse          → run_parse()
//! ```
//!
//! ## Return Codes
//!
//! | Code | Meaning                                  |
//! |------|------------------------------------------|
//! | 0    | Success                                  |
//! | 1    | Diagnostics, I/O or configuration error  |
//! | 2    | Invalid command line                     |

#include "cli/diagnostic.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "commands/cmd_debug.hpp"
#include "commands/cmd_expand.hpp"
#include "common.hpp"
#include "config/config.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace vnc::cli {

constexpr int EXIT_USAGE = 2;

static const std::vector<std::string> COMMANDS = {"expand", "check", "lex", "parse"};

struct CommandLine {
    std::string command;
    std::string input;
    std::string output;
    std::string mode = "auto";
    std::string config_path;
};

static int usage_error(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Run `vnc --help` for usage.\n";
    return EXIT_USAGE;
}

/// True when logging was configured on the command line or through
/// `VNC_LOG`, in which case `[log]` from the config file is ignored.
static bool log_configured_externally(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (log::is_log_option(argv[i])) {
            return true;
        }
    }
    const char* env = std::getenv("VNC_LOG");
    return env != nullptr && *env != '\0';
}

/// Applies the config file. Returns false after reporting an error.
static bool apply_config(const CommandLine& cmd, log::LogConfig log_config, bool log_from_cli,
                         format::FormatOptions& format) {
    std::optional<fs::path> path;
    if (!cmd.config_path.empty()) {
        path = fs::path(cmd.config_path);
    } else {
        path = config::find_config(cmd.input);
    }
    if (!path) {
        return true;
    }

    auto loaded = config::load_config(*path);
    if (is_err(loaded)) {
        get_diagnostic_emitter().error(ErrorCodes::CONFIG, unwrap_err(loaded));
        return false;
    }
    const auto& cfg = unwrap(loaded);
    format = cfg.format;

    if (log_from_cli || (cfg.log.level.empty() && cfg.log.filter.empty())) {
        return true;
    }
    if (!cfg.log.level.empty()) {
        bool ok = false;
        log_config.level = log::parse_level(cfg.log.level, &ok);
        if (!ok) {
            get_diagnostic_emitter().error(ErrorCodes::CONFIG, path->string() +
                                                                   ": unknown log level `" +
                                                                   cfg.log.level + "`");
            return false;
        }
    }
    log_config.filter_spec = cfg.log.filter;
    log::Logger::init(log_config);
    VNC_LOG_DEBUG("config", "logging configured from " << path->string());
    return true;
}

static int dispatch(int argc, char* argv[]) {
    auto log_config = log::parse_log_options(argc, argv);
    log::Logger::init(log_config);

    if (argc < 2) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    CommandLine cmd;
    cmd.command = argv[1];

    if (cmd.command == "--help" || cmd.command == "-h") {
        print_usage();
        return 0;
    }
    if (cmd.command == "--version" || cmd.command == "-V") {
        print_version();
        return 0;
    }

    if (std::find(COMMANDS.begin(), COMMANDS.end(), cmd.command) == COMMANDS.end()) {
        std::string message = "unknown command `" + cmd.command + "`";
        auto suggestion = find_similar(cmd.command, COMMANDS, 2);
        if (!suggestion.empty()) {
            message += "; did you mean `" + suggestion + "`?";
        }
        return usage_error(message);
    }

    bool has_output = false;
    bool has_mode = false;
    std::vector<std::string> positional;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }

        if (arg == "-o" || arg == "--output") {
            if (i + 1 >= argc) {
                return usage_error("`" + arg + "` requires a file name");
            }
            cmd.output = argv[++i];
            has_output = true;
        } else if (arg.starts_with("--output=")) {
            cmd.output = arg.substr(9);
            has_output = true;
        } else if (arg.starts_with("--mode=")) {
            cmd.mode = arg.substr(7);
            has_mode = true;
        } else if (arg.starts_with("--config=")) {
            cmd.config_path = arg.substr(9);
        } else if (arg.starts_with("--diagnostic-format=")) {
            auto fmt = arg.substr(20);
            if (fmt == "json") {
                Options::diagnostic_format = DiagnosticFormat::JSON;
            } else if (fmt == "text") {
                Options::diagnostic_format = DiagnosticFormat::Text;
            } else {
                return usage_error("unknown diagnostic format `" + fmt + "`");
            }
        } else if (arg == "--no-color") {
            Options::colors = false;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return usage_error("unknown option `" + arg + "`");
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 1) {
        return usage_error(positional.empty() ? "`" + cmd.command + "` needs an input file"
                                              : "`" + cmd.command + "` takes one input file");
    }
    cmd.input = positional.front();

    if (has_output && cmd.command != "expand") {
        return usage_error("`--output` is only accepted by `expand`");
    }
    if (has_mode && cmd.command != "expand" && cmd.command != "check") {
        return usage_error("`--mode` is only accepted by `expand` and `check`");
    }

    std::optional<derive::DirectiveMode> mode;
    if (cmd.mode != "auto") {
        mode = derive::parse_mode_name(cmd.mode);
        if (!mode) {
            return usage_error("unknown mode `" + cmd.mode + "` (expected auto, attach or derive)");
        }
    }

    get_diagnostic_emitter().set_color_enabled(Options::colors && terminal_supports_colors());

    if (cmd.command == "lex") {
        return run_lex(cmd.input);
    }
    if (cmd.command == "parse") {
        return run_parse(cmd.input);
    }

    ExpandCommandOptions opts;
    opts.input = cmd.input;
    opts.output = cmd.output;
    opts.mode = mode;
    opts.check_only = cmd.command == "check";
    if (!apply_config(cmd, log_config, log_configured_externally(argc, argv), opts.format)) {
        return 1;
    }
    return run_expand(opts);
}

} // namespace vnc::cli

int vnc_main(int argc, char* argv[]) {
    int code = vnc::cli::dispatch(argc, argv);
    vnc::log::Logger::instance().flush();
    return code;
}
