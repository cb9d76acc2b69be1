//! # Expand Command
//!
//! Implements `vnc expand` and `vnc check`.
//!
//! ```bash
//! vnc expand src/shapes.rs -o src/shapes.expanded.rs
//! vnc expand decl.rs --mode=derive       # impl block only
//! vnc check src/shapes.rs
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                |
//! |------|----------------------------------------|
//! | 0    | Expanded (or checked) without errors   |
//! | 1    | Diagnostics reported or I/O failure    |

#include "cmd_expand.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "derive/expand.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"

#include <iostream>

namespace vnc::cli {

static void emit_expand_errors(DiagnosticEmitter& emitter,
                               const std::vector<derive::ExpandError>& errors) {
    for (const auto& err : errors) {
        emitter.error(err.code, err.message, err.span, err.notes);
    }
}

int run_expand(const ExpandCommandOptions& opts) {
    auto& diag = get_diagnostic_emitter();

    auto loaded = lexer::Source::from_file(opts.input);
    if (is_err(loaded)) {
        diag.error(ErrorCodes::FILE_READ, unwrap_err(loaded));
        return 1;
    }
    auto source = std::move(unwrap(loaded));
    diag.set_source_content(opts.input, std::string(source.content()));

    VNC_LOG_INFO("cli", (opts.check_only ? "checking " : "expanding ")
                            << opts.input << " (mode: "
                            << (opts.mode ? derive::directive_display(*opts.mode) : "auto")
                            << ")");

    auto result = opts.mode ? derive::expand_declaration(source, *opts.mode, opts.format)
                            : derive::expand_module(source, opts.format);
    if (is_err(result)) {
        emit_expand_errors(diag, unwrap_err(result));
        VNC_LOG_DEBUG("cli", opts.input << ": " << diag.error_count() << " error(s)");
        return 1;
    }

    const auto& output = unwrap(result);
    if (opts.check_only) {
        VNC_LOG_INFO("cli", opts.input << ": ok, " << output.expanded << " item(s) to expand");
        return 0;
    }

    if (opts.output.empty()) {
        std::cout << output.text;
        std::cout.flush();
        if (!std::cout) {
            diag.error(ErrorCodes::FILE_WRITE, "cannot write to standard output");
            return 1;
        }
        return 0;
    }

    if (!write_file(opts.output, output.text)) {
        diag.error(ErrorCodes::FILE_WRITE, "cannot write file: " + opts.output);
        return 1;
    }
    VNC_LOG_INFO("cli", "wrote " << opts.output);
    return 0;
}

} // namespace vnc::cli
