//! # Macro Expressions
//!
//! `#define` values are parsed into a small typed tree and evaluated to 64-bit
//! integers before any text is substituted.
//!
//! ## Grammar
//!
//! ```text
//! sum     = product ('+' product)*
//! product = primary ('*' primary)*
//! primary = INTEGER | NAME | '#' NAME | '(' sum ')'
//! ```
//!
//! Integers are decimal or `0x` hexadecimal, optionally suffixed with `i` or
//! `u`. Subtraction, division, unary operators and anything else are rejected.

#ifndef SMC_MACRO_MACRO_EXPR_HPP
#define SMC_MACRO_MACRO_EXPR_HPP

#include "common.hpp"
#include "error/diagnostic.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace smc::macro {

struct MacroExpr;

/// Owned pointer to a macro expression node.
using MacroExprPtr = Box<MacroExpr>;

enum class BinaryOp {
    Add,
    Mul,
};

/// Integer literal.
struct LiteralExpr {
    int64_t value;
};

/// Reference to another macro.
struct RefExpr {
    std::string name;
};

/// `lhs + rhs` or `lhs * rhs`.
struct BinaryExpr {
    BinaryOp op;
    MacroExprPtr lhs;
    MacroExprPtr rhs;
};

/// A macro expression node.
struct MacroExpr {
    std::variant<LiteralExpr, RefExpr, BinaryExpr> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

/// Parses expression text. The error is a message for an
/// `UnsupportedMacroExpression` diagnostic.
[[nodiscard]] Result<MacroExprPtr, std::string> parse_macro_expr(std::string_view text);

/// Resolves a referenced macro name to its value.
using MacroLookup = std::function<Result<int64_t, ResolutionError>(const std::string& name)>;

/// Evaluates an expression. Overflow fails with `UnsupportedMacroExpression`
/// (without a site); lookup failures are propagated unchanged.
[[nodiscard]] Result<int64_t, ResolutionError> evaluate(const MacroExpr& expr,
                                                        const MacroLookup& lookup);

/// Renders an expression fully parenthesized, e.g. `((T * 2) + 1)`.
[[nodiscard]] std::string to_string(const MacroExpr& expr);

/// Parses a complete integer literal; nullopt if `text` is anything else or
/// does not fit in 64 bits.
[[nodiscard]] std::optional<int64_t> parse_int_literal(std::string_view text);

} // namespace smc::macro

#endif // SMC_MACRO_MACRO_EXPR_HPP
