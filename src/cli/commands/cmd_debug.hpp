//! # Debug Commands Interface
//!
//! | Command           | Output                     |
//! |-------------------|----------------------------|
//! | `vnc lex <file>`  | Token stream               |
//! | `vnc parse <file>`| Item tree with directives  |

#pragma once

#include <string>

namespace vnc::cli {

int run_lex(const std::string& path);
int run_parse(const std::string& path);

} // namespace vnc::cli
