//! # Expand Command Interface
//!
//! | Command             | Description                              |
//! |---------------------|------------------------------------------|
//! | `vnc expand <file>` | Print or write the expanded source       |
//! | `vnc check <file>`  | Expand in memory, report diagnostics     |

#pragma once

#include "derive/registry.hpp"
#include "format/writer.hpp"

#include <optional>
#include <string>

namespace vnc::cli {

struct ExpandCommandOptions {
    std::string input;

    /// Empty writes to stdout.
    std::string output;

    /// Unset expands the directives found in the file; set expands the
    /// whole input as one declaration in that mode.
    std::optional<derive::DirectiveMode> mode;

    format::FormatOptions format;

    /// Report diagnostics only.
    bool check_only = false;
};

int run_expand(const ExpandCommandOptions& opts);

} // namespace vnc::cli
