//! # Resolution Diagnostics
//!
//! Every failure of a composition is reported as a `ResolutionError` value.
//! Errors are deterministic: resolving the same inputs again reproduces them.
//!
//! ## Error Codes
//!
//! | Code | Kind                         | Raised by          |
//! |------|------------------------------|--------------------|
//! | R001 | DirectiveSyntax              | Directive parser   |
//! | R002 | UnresolvedImport             | Module graph       |
//! | R003 | CyclicImport                 | Module graph       |
//! | R004 | UndefinedMacro               | Macro expander     |
//! | R005 | UnsupportedMacroExpression   | Macro expander     |
//! | R006 | MacroSubstitution            | Macro expander     |
//! | R007 | UnresolvedReference          | Namespacer         |
//! | R008 | BindingSlotCollision         | Composer           |
//! | R009 | MacroShadowing               | Macro expander     |
//! | R010 | BindingLimit                 | Composer           |

#ifndef SMC_ERROR_DIAGNOSTIC_HPP
#define SMC_ERROR_DIAGNOSTIC_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace smc {

/// The category of a resolution failure.
enum class ErrorKind {
    DirectiveSyntax,
    UnresolvedImport,
    CyclicImport,
    UndefinedMacro,
    UnsupportedMacroExpression,
    MacroSubstitution,
    UnresolvedReference,
    BindingSlotCollision,
    MacroShadowing,
    BindingLimit,
};

/// Returns the stable error code ("R001".."R010") for a kind.
[[nodiscard]] const char* error_code(ErrorKind kind);

/// Returns the error name, e.g. "CyclicImportError".
[[nodiscard]] const char* error_kind_name(ErrorKind kind);

/// A structured resolution failure.
struct ResolutionError {
    ErrorKind kind = ErrorKind::DirectiveSyntax;
    std::string message;              ///< Human-readable description
    std::string fragment;             ///< Offending fragment path (may be empty)
    size_t line = 0;                  ///< 1-based line, 0 when not applicable
    std::string symbol;               ///< Offending symbol or macro name
    std::vector<std::string> related; ///< Cycle members, contending symbols

    [[nodiscard]] const char* code() const {
        return error_code(kind);
    }

    /// Renders `path:line: error[R00x]: message` without colors.
    [[nodiscard]] std::string to_string() const;
};

/// Builds an error at the given site.
[[nodiscard]] ResolutionError make_error(ErrorKind kind, std::string message,
                                         std::string fragment = {}, size_t line = 0);

/// Renders an error for a terminal, optionally with ANSI colors. Related items
/// are listed on `note:` lines below the main line.
[[nodiscard]] std::string format_error(const ResolutionError& error, bool use_colors);

} // namespace smc

#endif // SMC_ERROR_DIAGNOSTIC_HPP
