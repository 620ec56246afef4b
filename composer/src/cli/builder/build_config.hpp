//! # Shader Manifest
//!
//! This header defines `shaders.toml` manifest parsing.
//!
//! ## Manifest Sections
//!
//! | Section      | Type               | Description                        |
//! |--------------|--------------------|------------------------------------|
//! | `[composer]` | `ComposerSettings` | Shader root, output, limits        |
//! | `[[shader]]` | `ShaderVariant`    | One pipeline variant to compose    |
//!
//! ## Example
//!
//! ```toml
//! [composer]
//! shader-root = "shaders"
//! out-dir = "build/shaders"
//! max-bind-groups = 4
//!
//! [[shader]]
//! name = "unlit_diffuse"
//! root = "unlit_diffuse.wgsl"
//! defines = { CAMERA_GROUP = 0, MODEL_GROUP = 1, TEXTURE_GROUP = 2 }
//! ```
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML the manifest needs.

#ifndef SMC_CLI_BUILD_CONFIG_HPP
#define SMC_CLI_BUILD_CONFIG_HPP

#include "common.hpp"
#include "compose/composer.hpp"
#include "macro/macro_expander.hpp"
#include "resolver/resolver.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace smc::cli {

/**
 * Settings from the [composer] section
 */
struct ComposerSettings {
    std::string shader_root = ".";
    std::string out_dir = "build/shaders";
    compose::BindingLimits limits;
    bool markers = true;
};

/**
 * One pipeline variant from a [[shader]] section
 */
struct ShaderVariant {
    std::string name;
    std::string root;
    macro::MacroEnvironment defines;
    size_t line = 0; ///< Line of the section header
};

/**
 * Complete manifest structure
 */
struct Manifest {
    ComposerSettings composer;
    std::vector<ShaderVariant> shaders;
    fs::path base_dir; ///< Directory relative paths are resolved against

    /**
     * Load and validate a manifest file
     * @param path Path to shaders.toml
     * @return Manifest, or an error message prefixed with the file name
     */
    static Result<Manifest, std::string> load(const fs::path& path);

    /**
     * Parse and validate manifest text
     */
    static Result<Manifest, std::string> parse(const std::string& content);

    /**
     * Validate the whole manifest
     * @return Error message, or nullopt if valid
     */
    std::optional<std::string> validate() const;

    const ShaderVariant* find_shader(const std::string& name) const;

    fs::path shader_root_path() const;
    fs::path out_dir_path() const;

    ResolverOptions resolver_options() const;
};

/**
 * Simple TOML parser (subset of TOML spec)
 * Handles:
 * - Sections: [section]
 * - Array sections: [[array]]
 * - Key-value pairs: key = "value"
 * - Integers: key = 123, key = -1, key = 0x10
 * - Booleans: key = true
 * - Inline tables of integers: key = { A = 0, B = 1 }
 * - Comments: # ...
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into a manifest (not yet validated)
     */
    std::optional<Manifest> parse();

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    // Helper methods
    void skip_whitespace();
    void skip_comment();
    void skip_trivia();
    void skip_inline_whitespace();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();
    bool expect_line_end();

    std::string parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int64_t> parse_integer();
    std::optional<bool> parse_boolean();
    std::optional<macro::MacroEnvironment> parse_integer_table();
    void skip_value();

    bool parse_composer_section(ComposerSettings& settings);
    std::optional<ShaderVariant> parse_shader_section();
    std::optional<std::string> parse_key();

    void set_error(const std::string& message);
};

/**
 * Validate a shader variant name: letters, digits, '_' and '-'
 */
bool is_valid_shader_name(const std::string& name);

} // namespace smc::cli

#endif // SMC_CLI_BUILD_CONFIG_HPP
