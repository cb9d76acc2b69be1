//! # Driver Interface
//!
//! `vnc_main()` dispatches to a command handler based on argv[1].

#pragma once

int vnc_main(int argc, char* argv[]);
