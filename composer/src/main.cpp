//! # Shader Module Composer Entry Point
//!
//! The compiled binary is named `smc`. `main()` only delegates to the CLI
//! driver.
//!
//! ## Usage
//!
//! ```bash
//! smc compose unlit_diffuse.wgsl -I shaders -D TEXTURE_GROUP=2   # One shader
//! smc build shaders.toml                                          # Every variant
//! ```
//!
//! ## See Also
//!
//! - `cli/dispatcher.cpp` - Command dispatching logic

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return smc_main(argc, argv);
}
