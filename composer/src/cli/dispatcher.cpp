//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the `smc` CLI. It sets up
//! logging, then routes to the command handler named by the first argument.
//!
//! ## Architecture
//!
//! ```text
//! smc_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ compose        → run_compose()
//!   └─ build          → run_build()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags are accepted anywhere on the command line and removed
//! before the command sees its arguments:
//! - `-v`, `-vv`, `-vvv`, `--verbose`: More log output
//! - `-q`, `--quiet`: Errors only
//! - `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`

#include "cli/builder/parallel_build.hpp"
#include "cli/commands/cmd_compose.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

/// Main entry point for the `smc` CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                   |
/// |------|-------------------------------------------|
/// | 0    | Success                                   |
/// | 1    | Bad arguments, I/O or resolution failure  |
///
/// ## Examples
///
/// ```bash
/// smc compose unlit_diffuse.wgsl -I shaders -D CAMERA_GROUP=0 -D MODEL_GROUP=1
/// smc build shaders.toml -j 4
/// ```
int smc_main(int argc, char* argv[]) {
    using namespace smc;
    using namespace smc::cli;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        print_usage();
        return 0;
    }

    std::string command = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    int code = 1;
    if (command == "compose") {
        auto options = parse_compose_args(rest);
        if (options) {
            code = run_compose(*options);
        }
    } else if (command == "build") {
        code = run_build(rest);
    } else {
        std::cerr << "error: unknown command '" << command << "'\n";
        std::cerr << "Run 'smc --help' for usage.\n";
    }

    log::Logger::instance().flush();
    return code;
}
