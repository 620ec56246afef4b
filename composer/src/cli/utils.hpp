//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `read_file()`     | Read entire file to string           |
//! | `write_file()`    | Write a string, creating directories |
//! | `parse_define()`  | Parse a `-D NAME=VALUE` argument     |
//! | `print_error()`   | Print a resolution error to stderr   |
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print composer version               |

#pragma once

#include "common.hpp"
#include "error/diagnostic.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace smc::cli {

// File I/O
std::optional<std::string> read_file(const std::string& path);
bool write_file(const std::string& path, const std::string& content);

// Arguments
Result<std::pair<std::string, int64_t>, std::string> parse_define(const std::string& arg);

// Output
void print_error(const ResolutionError& error);

// Help text
void print_usage();
void print_version();

} // namespace smc::cli
