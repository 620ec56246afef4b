//! # Resolution Diagnostics
//!
//! Error codes, names and terminal rendering for `ResolutionError`.

#include "error/diagnostic.hpp"

#include <sstream>

namespace smc {

namespace {

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Cyan = "\033[36m";
};

std::string location(const ResolutionError& error) {
    if (error.fragment.empty()) {
        return "<root>";
    }
    if (error.line == 0) {
        return error.fragment;
    }
    return error.fragment + ":" + std::to_string(error.line);
}

} // namespace

const char* error_code(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DirectiveSyntax:
        return "R001";
    case ErrorKind::UnresolvedImport:
        return "R002";
    case ErrorKind::CyclicImport:
        return "R003";
    case ErrorKind::UndefinedMacro:
        return "R004";
    case ErrorKind::UnsupportedMacroExpression:
        return "R005";
    case ErrorKind::MacroSubstitution:
        return "R006";
    case ErrorKind::UnresolvedReference:
        return "R007";
    case ErrorKind::BindingSlotCollision:
        return "R008";
    case ErrorKind::MacroShadowing:
        return "R009";
    case ErrorKind::BindingLimit:
        return "R010";
    }
    return "R000";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DirectiveSyntax:
        return "DirectiveSyntaxError";
    case ErrorKind::UnresolvedImport:
        return "UnresolvedImportError";
    case ErrorKind::CyclicImport:
        return "CyclicImportError";
    case ErrorKind::UndefinedMacro:
        return "UndefinedMacroError";
    case ErrorKind::UnsupportedMacroExpression:
        return "UnsupportedMacroExpressionError";
    case ErrorKind::MacroSubstitution:
        return "MacroSubstitutionError";
    case ErrorKind::UnresolvedReference:
        return "UnresolvedReferenceError";
    case ErrorKind::BindingSlotCollision:
        return "BindingSlotCollisionError";
    case ErrorKind::MacroShadowing:
        return "MacroShadowingError";
    case ErrorKind::BindingLimit:
        return "BindingLimitError";
    }
    return "ResolutionError";
}

std::string ResolutionError::to_string() const {
    return location(*this) + ": error[" + code() + "]: " + message;
}

ResolutionError make_error(ErrorKind kind, std::string message, std::string fragment,
                           size_t line) {
    ResolutionError error;
    error.kind = kind;
    error.message = std::move(message);
    error.fragment = std::move(fragment);
    error.line = line;
    return error;
}

std::string format_error(const ResolutionError& error, bool use_colors) {
    std::ostringstream oss;
    if (use_colors) {
        oss << Colors::Bold << location(error) << ": " << Colors::Red << "error[" << error.code()
            << "]" << Colors::Reset << Colors::Bold << ": " << error.message << Colors::Reset;
    } else {
        oss << error.to_string();
    }

    for (const auto& item : error.related) {
        oss << "\n  ";
        if (use_colors) {
            oss << Colors::Cyan << "note" << Colors::Reset;
        } else {
            oss << "note";
        }
        oss << ": " << item;
    }
    return oss.str();
}

} // namespace smc
