//! # vnc Entry Point
//!
//! ```bash
//! vnc expand src/shapes.rs              # expand every directive in a file
//! vnc expand decl.rs --mode=derive      # impl block for one declaration
//! vnc check src/shapes.rs               # diagnostics only
//! ```
//!
//! All work is done by the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return vnc_main(argc, argv);
}
