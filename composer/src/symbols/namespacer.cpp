#include "symbols/namespacer.hpp"

#include "common/crc32c.hpp"
#include "directive/scanner.hpp"
#include "log/log.hpp"

#include <unordered_map>

namespace smc::symbols {

using directive::Token;
using directive::TokenKind;

std::string mangle(const graph::Fragment& fragment, std::string_view name) {
    return fragment.stem() + "_" + crc32c_hex8(crc32c(fragment.path)) + "_" + std::string(name);
}

std::string Namespacer::final_name(const graph::Fragment& fragment, std::string_view name) const {
    const auto* decl = fragment.parsed.find_declaration(name);
    if (!decl || decl->is_entry_point() || is_root(fragment)) {
        return std::string(name);
    }
    return mangle(fragment, name);
}

namespace {

/// Attributes whose arguments are enumerants, never declarations.
bool takes_enumerants(std::string_view attr) {
    return attr == "builtin" || attr == "interpolate" || attr == "diagnostic";
}

} // namespace

std::vector<bool> reference_mask(const std::vector<Token>& tokens) {
    std::vector<bool> mask(tokens.size(), false);

    const Token* prev = nullptr; // previous significant token
    int depth = 0;
    bool struct_pending = false; // saw `struct` at depth 0, body not yet open
    bool in_struct = false;      // inside a struct body
    bool enum_pending = false;   // saw `@builtin` and friends, args not yet open
    int enum_parens = 0;         // inside enumerant arguments

    auto next_is_colon = [&](size_t i) {
        for (++i; i < tokens.size(); ++i) {
            if (tokens[i].is_significant()) {
                return tokens[i].is_punct(':');
            }
        }
        return false;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        if (!tok.is_significant()) {
            continue;
        }

        if (tok.kind == TokenKind::Identifier) {
            bool member_access = prev && prev->is_punct('.');
            bool attribute_name = prev && prev->is_punct('@');
            bool member_name = in_struct && depth == 1 && next_is_colon(i);
            mask[i] = !member_access && !attribute_name && !member_name && enum_parens == 0;

            enum_pending = takes_enumerants(tok.lexeme) && (attribute_name || depth == 0);
            if (depth == 0 && tok.lexeme == "struct") {
                struct_pending = true;
            }
        } else {
            if (tok.is_punct('(')) {
                if (enum_pending) {
                    enum_parens = 1;
                } else if (enum_parens > 0) {
                    ++enum_parens;
                }
            } else if (tok.is_punct(')') && enum_parens > 0) {
                --enum_parens;
            } else if (tok.is_punct('{')) {
                if (depth == 0 && struct_pending) {
                    in_struct = true;
                    struct_pending = false;
                }
                ++depth;
            } else if (tok.is_punct('}')) {
                if (depth > 0 && --depth == 0) {
                    in_struct = false;
                }
            } else if (tok.is_punct(';') && depth == 0) {
                struct_pending = false;
            }
            enum_pending = false;
        }

        prev = &tok;
    }
    return mask;
}

Result<std::string, ResolutionError> Namespacer::rewrite(const graph::Fragment& fragment,
                                                         std::string_view text) const {
    std::unordered_map<std::string_view, std::string> renames;
    if (!is_root(fragment)) {
        for (const auto& decl : fragment.parsed.declarations) {
            if (!decl.is_entry_point()) {
                renames.emplace(decl.name, mangle(fragment, decl.name));
            }
        }
    }

    auto tokens = directive::tokenize(text);
    auto references = reference_mask(tokens);
    std::string out;
    out.reserve(text.size() + renames.size() * 16);

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];

        if (tok.kind == TokenKind::Qualified) {
            auto alias = tok.qualifier();
            auto symbol = tok.member();
            const auto* edge = graph_.find_import(fragment.path, alias);
            if (!edge) {
                auto error = make_error(ErrorKind::UnresolvedReference,
                                        "unknown import alias '" + std::string(alias) + "' in '" +
                                            std::string(tok.lexeme) + "'",
                                        fragment.path, tok.line);
                error.symbol = std::string(tok.lexeme);
                return error;
            }
            auto target = graph_.find(edge->to);
            const auto* decl = target ? target->parsed.find_declaration(symbol) : nullptr;
            if (!decl || !decl->exported) {
                auto error = make_error(ErrorKind::UnresolvedReference,
                                        "'" + std::string(symbol) + "' is not exported by " +
                                            edge->to + " (imported as '" + std::string(alias) +
                                            "')",
                                        fragment.path, tok.line);
                error.symbol = std::string(tok.lexeme);
                return error;
            }
            out += final_name(*target, symbol);
            continue;
        }

        auto it = references[i] ? renames.find(tok.lexeme) : renames.end();
        if (it != renames.end()) {
            out += it->second;
        } else {
            out += tok.lexeme;
        }
    }

    SMC_LOG_TRACE("namespace", "Rewrote " << fragment.path << " (" << renames.size()
                                          << " renamed declarations)");
    return out;
}

} // namespace smc::symbols
