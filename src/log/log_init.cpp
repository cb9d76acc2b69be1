//! # Log Initialization from CLI
//!
//! Turns logging flags and the `VNC_LOG` environment variable into a
//! `LogConfig`.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace vnc::log {

namespace {

auto is_verbosity_flag(std::string_view arg) -> bool {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    return arg.find_first_not_of('v', 1) == std::string_view::npos;
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || is_verbosity_flag(arg);
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;

    bool has_level = false;
    bool has_filter = false;
    size_t verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_level = true;
        } else if (arg == "--verbose") {
            verbosity = std::max<size_t>(verbosity, 1);
        } else if (is_verbosity_flag(arg)) {
            verbosity = std::max(verbosity, arg.size() - 1);
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace; an explicit level wins
    if (!has_level && verbosity > 0) {
        config.level = verbosity >= 3   ? LogLevel::Trace
                       : verbosity == 2 ? LogLevel::Debug
                                        : LogLevel::Info;
        has_level = true;
    }

    if (!has_level && !has_filter) {
        const char* env = std::getenv("VNC_LOG");
        std::string_view env_str = env ? env : "";
        if (!env_str.empty()) {
            if (env_str.find('=') != std::string_view::npos ||
                env_str.find(',') != std::string_view::npos) {
                config.filter_spec = std::string(env_str);
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace vnc::log
