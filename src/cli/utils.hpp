//! # CLI Utilities Interface
//!
//! | Function          | Description                        |
//! |-------------------|------------------------------------|
//! | `write_file()`    | Write a string to a file           |
//! | `print_usage()`   | Print CLI help text                |
//! | `print_version()` | Print generator version            |

#pragma once

#include <iostream>
#include <string>

namespace vnc::cli {

// File I/O
bool write_file(const std::string& path, const std::string& content);

// Help text
void print_usage(std::ostream& out = std::cout);
void print_version();

} // namespace vnc::cli
