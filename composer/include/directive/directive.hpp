//! # Directive Parser
//!
//! Extracts the composition directives of one shader fragment and records its
//! top-level declarations.
//!
//! ## Supported Directives
//!
//! | Directive                   | Description                              |
//! |-----------------------------|------------------------------------------|
//! | `#import path [as alias]`   | Import a fragment relative to this one   |
//! | `#import "path" [as alias]` | Quoted form of the same                  |
//! | `#define NAME expr`         | Define an integer macro                  |
//! | `@export`                   | Export the next top-level declaration    |
//!
//! Directive lines are blanked in the residual source so that residual line
//! numbers equal source line numbers. `#NAME` references and `alias::symbol`
//! references stay in the residual text for the later passes.
//!
//! ## Example
//!
//! ```cpp
//! auto parsed = parse_fragment(source, "include/camera.wgsl");
//! if (is_err(parsed)) {
//!     return unwrap_err(parsed);
//! }
//! for (const auto& imp : unwrap(parsed).imports) { ... }
//! ```

#ifndef SMC_DIRECTIVE_DIRECTIVE_HPP
#define SMC_DIRECTIVE_DIRECTIVE_HPP

#include "common.hpp"
#include "error/diagnostic.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace smc::directive {

// ============================================================================
// Directives
// ============================================================================

/// `#import <path> [as <alias>]`
struct ImportDirective {
    std::string path;            ///< Path as written, relative to the importer
    std::string alias;           ///< Explicit alias or the path's stem
    bool explicit_alias = false; ///< True when written with `as`
    size_t line = 0;
};

/// `#define <NAME> <expr>`
struct DefineDirective {
    std::string name;
    std::string expr; ///< Expression text, evaluated by the macro expander
    size_t line = 0;
};

// ============================================================================
// Declarations
// ============================================================================

/// Kind of a top-level WGSL declaration.
enum class DeclKind {
    Struct,
    Function,
    Var,
    Const,
    Override,
    Alias,
};

/// Pipeline stage of an entry-point function.
enum class ShaderStage {
    None,
    Vertex,
    Fragment,
    Compute,
};

/// An attribute such as `@group(0)`; `args` is the text inside the parens
/// without comments.
struct Attribute {
    std::string name;
    std::string args;
};

/// A top-level declaration with its attributes.
struct Declaration {
    DeclKind kind = DeclKind::Struct;
    std::string name;
    size_t line = 0; ///< Line of the declaring keyword
    std::vector<Attribute> attributes;
    bool exported = false;
    ShaderStage stage = ShaderStage::None;

    [[nodiscard]] const Attribute* find_attribute(std::string_view attr) const;

    /// A `var` carrying both `@group` and `@binding`.
    [[nodiscard]] bool is_binding() const;

    [[nodiscard]] bool is_entry_point() const {
        return stage != ShaderStage::None;
    }
};

/// Result of parsing one fragment.
struct ParsedFragment {
    std::vector<ImportDirective> imports;
    std::vector<DefineDirective> defines;
    std::vector<size_t> export_lines; ///< Lines of `@export` markers
    std::vector<Declaration> declarations;
    std::string residual;

    /// Finds a declaration by name.
    [[nodiscard]] const Declaration* find_declaration(std::string_view name) const;

    /// Finds an import by alias.
    [[nodiscard]] const ImportDirective* find_import(std::string_view alias) const;
};

// ============================================================================
// Parsing
// ============================================================================

/// Parses the directives and declarations of one fragment. `path` only names
/// the fragment in errors.
[[nodiscard]] Result<ParsedFragment, ResolutionError> parse_fragment(std::string_view source,
                                                                     const std::string& path);

/// Collects the top-level declarations of WGSL text (no directive handling).
[[nodiscard]] std::vector<Declaration> collect_declarations(std::string_view text);

/// Default import alias: the base name without extension, or nullopt when the
/// stem is not an identifier (`include/camera.wgsl` gives `camera`).
[[nodiscard]] std::optional<std::string> default_alias(std::string_view path);

[[nodiscard]] const char* decl_kind_name(DeclKind kind);

[[nodiscard]] const char* stage_name(ShaderStage stage);

} // namespace smc::directive

#endif // SMC_DIRECTIVE_DIRECTIVE_HPP
