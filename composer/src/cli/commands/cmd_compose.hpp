//! # Compose Command Interface
//!
//! `smc compose <root.wgsl>` composes one root fragment and writes the WGSL
//! text to stdout or a file.
//!
//! ## Exit Codes
//!
//! - `0`: Success
//! - `1`: Bad arguments, I/O failure or resolution error

#pragma once

#include "compose/composer.hpp"
#include "macro/macro_expander.hpp"

#include <optional>
#include <string>
#include <vector>

namespace smc::cli {

struct ComposeCommandOptions {
    std::string root;
    std::string include_dir = ".";
    std::string output; ///< Empty means stdout
    macro::MacroEnvironment defines;
    compose::BindingLimits limits;
    bool markers = true;
    bool reflect = false;
};

/// Parses the arguments following `compose`. Returns nullopt after printing
/// the problem.
std::optional<ComposeCommandOptions> parse_compose_args(const std::vector<std::string>& args);

/// Human-readable reflection summary of a composed shader.
std::string format_reflection(const compose::ComposedShader& shader);

int run_compose(const ComposeCommandOptions& options);

} // namespace smc::cli
