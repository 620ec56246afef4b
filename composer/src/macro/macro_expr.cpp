//! # Macro Expression Parser and Evaluator
//!
//! Recursive descent over a `std::string_view` cursor.

#include "macro/macro_expr.hpp"

#include "directive/scanner.hpp"

#include <cctype>
#include <limits>

namespace smc::macro {

namespace {

constexpr int64_t MAX = std::numeric_limits<int64_t>::max();
constexpr int64_t MIN = std::numeric_limits<int64_t>::min();

void skip_whitespace(std::string_view& sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
}

MacroExprPtr make_expr(decltype(MacroExpr::kind) kind) {
    auto expr = make_box<MacroExpr>();
    expr->kind = std::move(kind);
    return expr;
}

class ExprParser {
public:
    explicit ExprParser(std::string_view text) : rest_(text) {}

    Result<MacroExprPtr, std::string> parse() {
        auto expr = parse_sum();
        if (is_err(expr)) {
            return expr;
        }
        skip_whitespace(rest_);
        if (!rest_.empty()) {
            return unexpected();
        }
        return expr;
    }

private:
    std::string_view rest_;

    std::string unexpected() const {
        if (rest_.empty()) {
            return "unexpected end of macro expression";
        }
        char c = rest_.front();
        if (c == '-' || c == '/' || c == '%' || c == '<' || c == '>' || c == '&' || c == '|' ||
            c == '^' || c == '~' || c == '!') {
            return std::string("unsupported operator '") + c + "' in macro expression";
        }
        return std::string("unexpected '") + c + "' in macro expression";
    }

    Result<MacroExprPtr, std::string> parse_sum() {
        auto lhs = parse_product();
        if (is_err(lhs)) {
            return lhs;
        }
        while (true) {
            skip_whitespace(rest_);
            if (rest_.empty() || rest_.front() != '+') {
                return lhs;
            }
            rest_.remove_prefix(1);
            auto rhs = parse_product();
            if (is_err(rhs)) {
                return rhs;
            }
            lhs = make_expr(
                BinaryExpr{BinaryOp::Add, std::move(unwrap(lhs)), std::move(unwrap(rhs))});
        }
    }

    Result<MacroExprPtr, std::string> parse_product() {
        auto lhs = parse_primary();
        if (is_err(lhs)) {
            return lhs;
        }
        while (true) {
            skip_whitespace(rest_);
            if (rest_.empty() || rest_.front() != '*') {
                return lhs;
            }
            rest_.remove_prefix(1);
            auto rhs = parse_primary();
            if (is_err(rhs)) {
                return rhs;
            }
            lhs = make_expr(
                BinaryExpr{BinaryOp::Mul, std::move(unwrap(lhs)), std::move(unwrap(rhs))});
        }
    }

    Result<MacroExprPtr, std::string> parse_primary() {
        skip_whitespace(rest_);
        if (rest_.empty()) {
            return unexpected();
        }

        char c = rest_.front();
        if (c == '(') {
            rest_.remove_prefix(1);
            auto inner = parse_sum();
            if (is_err(inner)) {
                return inner;
            }
            skip_whitespace(rest_);
            if (rest_.empty() || rest_.front() != ')') {
                return std::string("missing ')' in macro expression");
            }
            rest_.remove_prefix(1);
            return inner;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t end = 0;
            while (end < rest_.size() && directive::is_ident_char(rest_[end])) {
                ++end;
            }
            auto literal = rest_.substr(0, end);
            auto value = parse_int_literal(literal);
            if (!value) {
                return "invalid integer literal '" + std::string(literal) + "'";
            }
            rest_.remove_prefix(end);
            return make_expr(LiteralExpr{*value});
        }

        std::string_view name = rest_;
        if (c == '#') {
            name.remove_prefix(1);
        }
        if (!name.empty() && directive::is_ident_start(name.front())) {
            size_t end = 1;
            while (end < name.size() && directive::is_ident_char(name[end])) {
                ++end;
            }
            rest_ = name.substr(end);
            return make_expr(RefExpr{std::string(name.substr(0, end))});
        }

        return unexpected();
    }
};

bool checked_add(int64_t a, int64_t b, int64_t& out) {
    if ((b > 0 && a > MAX - b) || (b < 0 && a < MIN - b)) {
        return false;
    }
    out = a + b;
    return true;
}

bool checked_mul(int64_t a, int64_t b, int64_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > 0) {
        if (b > 0 ? a > MAX / b : b < MIN / a) {
            return false;
        }
    } else {
        if (b > 0 ? a < MIN / b : b < MAX / a) {
            return false;
        }
    }
    out = a * b;
    return true;
}

} // namespace

Result<MacroExprPtr, std::string> parse_macro_expr(std::string_view text) {
    return ExprParser(text).parse();
}

Result<int64_t, ResolutionError> evaluate(const MacroExpr& expr, const MacroLookup& lookup) {
    if (expr.is<LiteralExpr>()) {
        return expr.as<LiteralExpr>().value;
    }
    if (expr.is<RefExpr>()) {
        return lookup(expr.as<RefExpr>().name);
    }

    const auto& bin = expr.as<BinaryExpr>();
    auto lhs = evaluate(*bin.lhs, lookup);
    if (is_err(lhs)) {
        return lhs;
    }
    auto rhs = evaluate(*bin.rhs, lookup);
    if (is_err(rhs)) {
        return rhs;
    }

    int64_t value = 0;
    bool ok = bin.op == BinaryOp::Add ? checked_add(unwrap(lhs), unwrap(rhs), value)
                                      : checked_mul(unwrap(lhs), unwrap(rhs), value);
    if (!ok) {
        return make_error(ErrorKind::UnsupportedMacroExpression,
                          "integer overflow evaluating '" + to_string(expr) + "'");
    }
    return value;
}

std::string to_string(const MacroExpr& expr) {
    if (expr.is<LiteralExpr>()) {
        return std::to_string(expr.as<LiteralExpr>().value);
    }
    if (expr.is<RefExpr>()) {
        return expr.as<RefExpr>().name;
    }
    const auto& bin = expr.as<BinaryExpr>();
    return "(" + to_string(*bin.lhs) + (bin.op == BinaryOp::Add ? " + " : " * ") +
           to_string(*bin.rhs) + ")";
}

std::optional<int64_t> parse_int_literal(std::string_view text) {
    if (!text.empty() && (text.back() == 'u' || text.back() == 'i')) {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    int base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }

    int64_t value = 0;
    for (char c : text) {
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (base == 16 && c >= 'a' && c <= 'f') {
            digit = c - 'a' + 10;
        } else if (base == 16 && c >= 'A' && c <= 'F') {
            digit = c - 'A' + 10;
        } else {
            return std::nullopt;
        }
        if (value > (MAX - digit) / base) {
            return std::nullopt;
        }
        value = value * base + digit;
    }
    return value;
}

} // namespace smc::macro
