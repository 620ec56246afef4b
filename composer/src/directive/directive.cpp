//! # Directive Parser
//!
//! Line-oriented pass for `#import`, `#define` and `@export`, followed by a
//! token pass over the residual text that finds top-level declarations and
//! attaches export markers to them.

#include "directive/directive.hpp"

#include "directive/scanner.hpp"

#include <cctype>
#include <unordered_set>

namespace smc::directive {

namespace {

// ============================================================================
// Text Helpers
// ============================================================================

std::string_view trim_start(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    return sv;
}

std::string_view trim(std::string_view sv) {
    sv = trim_start(sv);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

std::string_view strip_line_comment(std::string_view sv) {
    auto pos = sv.find("//");
    return pos == std::string_view::npos ? sv : sv.substr(0, pos);
}

/// Reads an identifier after optional leading whitespace.
std::string_view read_identifier(std::string_view& sv) {
    sv = trim_start(sv);
    if (sv.empty() || !is_ident_start(sv[0])) {
        return {};
    }
    size_t end = 1;
    while (end < sv.size() && is_ident_char(sv[end])) {
        ++end;
    }
    std::string_view result = sv.substr(0, end);
    sv.remove_prefix(end);
    return result;
}

ResolutionError syntax_error(const std::string& path, size_t line, std::string message) {
    return make_error(ErrorKind::DirectiveSyntax, std::move(message), path, line);
}

// ============================================================================
// Directive Lines
// ============================================================================

Result<ImportDirective, ResolutionError> parse_import(std::string_view rest,
                                                      const std::string& path, size_t line) {
    rest = trim_start(rest);
    if (rest.empty()) {
        return syntax_error(path, line, "#import requires a path");
    }

    ImportDirective imp;
    imp.line = line;

    if (rest[0] == '"') {
        auto close = rest.find('"', 1);
        if (close == std::string_view::npos) {
            return syntax_error(path, line, "unterminated quoted path in #import");
        }
        imp.path = std::string(rest.substr(1, close - 1));
        rest.remove_prefix(close + 1);
    } else {
        size_t end = 0;
        while (end < rest.size() && !std::isspace(static_cast<unsigned char>(rest[end]))) {
            ++end;
        }
        imp.path = std::string(rest.substr(0, end));
        rest.remove_prefix(end);
    }

    if (imp.path.empty()) {
        return syntax_error(path, line, "#import requires a non-empty path");
    }

    rest = trim(strip_line_comment(rest));
    if (!rest.empty()) {
        std::string_view trailing = rest;
        auto keyword = read_identifier(rest);
        if (keyword != "as") {
            return syntax_error(path, line,
                                "unexpected '" + std::string(trailing) + "' after #import path");
        }
        auto alias = read_identifier(rest);
        if (alias.empty()) {
            return syntax_error(path, line, "expected an alias after 'as'");
        }
        if (!trim(rest).empty()) {
            return syntax_error(path, line,
                                "unexpected '" + std::string(trim(rest)) + "' after import alias");
        }
        imp.alias = std::string(alias);
        imp.explicit_alias = true;
    } else {
        auto alias = default_alias(imp.path);
        if (!alias) {
            return syntax_error(path, line,
                                "cannot derive an alias from '" + imp.path + "'; add 'as <alias>'");
        }
        imp.alias = *alias;
    }

    return imp;
}

Result<DefineDirective, ResolutionError> parse_define(std::string_view rest,
                                                      const std::string& path, size_t line) {
    auto name = read_identifier(rest);
    if (name.empty()) {
        return syntax_error(path, line, "#define requires a macro name");
    }

    auto expr = trim(strip_line_comment(rest));
    if (expr.empty()) {
        return syntax_error(path, line, "#define " + std::string(name) + " requires a value");
    }

    return DefineDirective{std::string(name), std::string(expr), line};
}

/// Lines that begin inside a multi-line block comment, or inside a
/// parenthesis opened on an earlier line.
struct ContinuationLines {
    std::unordered_set<size_t> comment;
    std::unordered_set<size_t> paren;
};

ContinuationLines continuation_lines(std::string_view source) {
    ContinuationLines lines;
    int parens = 0;
    size_t last_line = 0;      // line of the previous significant token
    size_t directive_line = 0; // a top-level #import/#define line
    for (const auto& tok : tokenize(source)) {
        if (tok.is_significant() && tok.line != last_line) {
            last_line = tok.line;
            if (parens == 0 && tok.kind == TokenKind::MacroRef &&
                (tok.macro_name() == "import" || tok.macro_name() == "define")) {
                directive_line = tok.line;
            }
        }
        if (tok.line != directive_line) {
            if (tok.is_punct('(')) {
                ++parens;
            } else if (tok.is_punct(')') && parens > 0) {
                --parens;
            }
        }
        size_t line = tok.line;
        for (char c : tok.lexeme) {
            if (c != '\n') {
                continue;
            }
            ++line;
            if (tok.kind == TokenKind::Comment) {
                lines.comment.insert(line);
            } else if (parens > 0) {
                lines.paren.insert(line);
            }
        }
    }
    return lines;
}

// ============================================================================
// Declarations
// ============================================================================

/// A declaration plus the lines needed to attach `@export` markers.
struct DeclSite {
    Declaration decl;
    size_t first_line = 0; ///< Line of the first attribute, or of the keyword
    size_t prev_line = 0;  ///< Line of the preceding significant token (0 if none)
};

/// Text of `sig[from, to)` without comments. Tokens that were apart in the
/// source are joined by one space.
std::string join_significant(const std::vector<const Token*>& sig, size_t from, size_t to) {
    std::string out;
    for (size_t k = from; k < to; ++k) {
        if (k > from && sig[k]->offset != sig[k - 1]->offset + sig[k - 1]->lexeme.size()) {
            out += ' ';
        }
        out += sig[k]->lexeme;
    }
    return out;
}

std::optional<DeclKind> keyword_kind(std::string_view word) {
    if (word == "struct")
        return DeclKind::Struct;
    if (word == "fn")
        return DeclKind::Function;
    if (word == "var")
        return DeclKind::Var;
    if (word == "const")
        return DeclKind::Const;
    if (word == "override")
        return DeclKind::Override;
    if (word == "alias")
        return DeclKind::Alias;
    return std::nullopt;
}

ShaderStage stage_of(const Declaration& decl) {
    if (decl.kind != DeclKind::Function) {
        return ShaderStage::None;
    }
    for (const auto& attr : decl.attributes) {
        if (attr.name == "vertex")
            return ShaderStage::Vertex;
        if (attr.name == "fragment")
            return ShaderStage::Fragment;
        if (attr.name == "compute")
            return ShaderStage::Compute;
    }
    return ShaderStage::None;
}

std::vector<DeclSite> scan_declarations(std::string_view text) {
    auto tokens = tokenize(text);
    std::vector<const Token*> sig;
    for (const auto& tok : tokens) {
        if (tok.is_significant()) {
            sig.push_back(&tok);
        }
    }

    std::vector<DeclSite> sites;
    std::vector<Attribute> attrs;
    size_t group_line = 0;
    size_t group_prev_line = 0;
    size_t last_line = 0;
    int depth = 0;
    bool expecting = true;
    const size_t n = sig.size();

    for (size_t i = 0; i < n; ++i) {
        const Token& tok = *sig[i];

        if (depth > 0) {
            if (tok.is_punct('{')) {
                ++depth;
            } else if (tok.is_punct('}') && --depth == 0) {
                expecting = true;
            }
            last_line = tok.line;
            continue;
        }

        if (tok.is_punct('{')) {
            ++depth;
            attrs.clear();
            last_line = tok.line;
            continue;
        }
        if (tok.is_punct(';')) {
            expecting = true;
            attrs.clear();
            last_line = tok.line;
            continue;
        }
        if (!expecting) {
            last_line = tok.line;
            continue;
        }

        // Attribute: @name or @name(args)
        if (tok.is_punct('@') && i + 1 < n && sig[i + 1]->kind == TokenKind::Identifier) {
            if (attrs.empty()) {
                group_line = tok.line;
                group_prev_line = last_line;
            }
            Attribute attr;
            attr.name = std::string(sig[++i]->lexeme);
            if (i + 1 < n && sig[i + 1]->is_punct('(')) {
                int parens = 0;
                size_t j = i + 1;
                for (; j < n; ++j) {
                    if (sig[j]->is_punct('(')) {
                        ++parens;
                    } else if (sig[j]->is_punct(')') && --parens == 0) {
                        break;
                    }
                }
                if (j < n) {
                    attr.args = join_significant(sig, i + 2, j);
                    i = j;
                } else {
                    i = n - 1;
                }
            }
            attrs.push_back(std::move(attr));
            continue;
        }

        auto kind = tok.kind == TokenKind::Identifier ? keyword_kind(tok.lexeme) : std::nullopt;
        if (!kind) {
            // enable, requires, diagnostic, const_assert, ...
            attrs.clear();
            expecting = false;
            last_line = tok.line;
            continue;
        }

        size_t j = i + 1;
        if (*kind == DeclKind::Var && j < n && sig[j]->is_punct('<')) {
            int angles = 0;
            for (; j < n; ++j) {
                if (sig[j]->is_punct('<')) {
                    ++angles;
                } else if (sig[j]->is_punct('>') && --angles == 0) {
                    ++j;
                    break;
                }
            }
        }

        expecting = false;
        if (j >= n || sig[j]->kind != TokenKind::Identifier) {
            attrs.clear();
            last_line = tok.line;
            continue;
        }

        DeclSite site;
        site.first_line = attrs.empty() ? tok.line : group_line;
        site.prev_line = attrs.empty() ? last_line : group_prev_line;
        site.decl.kind = *kind;
        site.decl.name = std::string(sig[j]->lexeme);
        site.decl.line = tok.line;
        site.decl.attributes = std::move(attrs);
        site.decl.stage = stage_of(site.decl);
        sites.push_back(std::move(site));

        attrs.clear();
        i = j;
        last_line = sig[j]->line;
    }

    return sites;
}

} // namespace

// ============================================================================
// Declaration Queries
// ============================================================================

const Attribute* Declaration::find_attribute(std::string_view attr) const {
    for (const auto& a : attributes) {
        if (a.name == attr) {
            return &a;
        }
    }
    return nullptr;
}

bool Declaration::is_binding() const {
    return kind == DeclKind::Var && find_attribute("group") && find_attribute("binding");
}

const Declaration* ParsedFragment::find_declaration(std::string_view name) const {
    for (const auto& decl : declarations) {
        if (decl.name == name) {
            return &decl;
        }
    }
    return nullptr;
}

const ImportDirective* ParsedFragment::find_import(std::string_view alias) const {
    for (const auto& imp : imports) {
        if (imp.alias == alias) {
            return &imp;
        }
    }
    return nullptr;
}

std::vector<Declaration> collect_declarations(std::string_view text) {
    std::vector<Declaration> decls;
    for (auto& site : scan_declarations(text)) {
        decls.push_back(std::move(site.decl));
    }
    return decls;
}

std::optional<std::string> default_alias(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = base.find_last_of('.');
    if (dot != std::string_view::npos && dot > 0) {
        base = base.substr(0, dot);
    }
    if (!is_identifier(base)) {
        return std::nullopt;
    }
    return std::string(base);
}

const char* decl_kind_name(DeclKind kind) {
    switch (kind) {
    case DeclKind::Struct:
        return "struct";
    case DeclKind::Function:
        return "fn";
    case DeclKind::Var:
        return "var";
    case DeclKind::Const:
        return "const";
    case DeclKind::Override:
        return "override";
    case DeclKind::Alias:
        return "alias";
    }
    return "?";
}

const char* stage_name(ShaderStage stage) {
    switch (stage) {
    case ShaderStage::None:
        return "none";
    case ShaderStage::Vertex:
        return "vertex";
    case ShaderStage::Fragment:
        return "fragment";
    case ShaderStage::Compute:
        return "compute";
    }
    return "?";
}

// ============================================================================
// Fragment Parsing
// ============================================================================

Result<ParsedFragment, ResolutionError> parse_fragment(std::string_view source,
                                                       const std::string& path) {
    ParsedFragment result;
    result.residual.reserve(source.size());

    auto continuation = continuation_lines(source);
    const auto& in_comment = continuation.comment;
    std::optional<size_t> pending_export;

    size_t pos = 0;
    size_t line = 1;
    while (pos < source.size()) {
        size_t line_end = source.find('\n', pos);
        bool has_newline = line_end != std::string_view::npos;
        if (!has_newline) {
            line_end = source.size();
        }
        std::string_view text = source.substr(pos, line_end - pos);
        std::string_view trimmed = trim_start(text);

        if (in_comment.count(line) == 0 && continuation.paren.count(line) == 0 &&
            !trimmed.empty() && trimmed[0] == '#') {
            std::string_view rest = trimmed.substr(1);
            std::string_view name;
            if (!rest.empty() && is_ident_start(rest[0])) {
                name = read_identifier(rest);
            }
            if (name.empty()) {
                return syntax_error(path, line, "expected a directive name after '#'");
            }
            if (pending_export) {
                return syntax_error(path, *pending_export,
                                    "@export must be followed by a declaration, found #" +
                                        std::string(name));
            }

            if (name == "import") {
                auto imp = parse_import(rest, path, line);
                if (is_err(imp)) {
                    return unwrap_err(imp);
                }
                if (const auto* prev = result.find_import(unwrap(imp).alias)) {
                    return syntax_error(path, line,
                                        "duplicate import alias '" + unwrap(imp).alias +
                                            "' (first used on line " + std::to_string(prev->line) +
                                            ")");
                }
                result.imports.push_back(std::move(unwrap(imp)));
            } else if (name == "define") {
                auto def = parse_define(rest, path, line);
                if (is_err(def)) {
                    return unwrap_err(def);
                }
                result.defines.push_back(std::move(unwrap(def)));
            } else {
                return syntax_error(path, line, "unknown directive '#" + std::string(name) + "'");
            }
            // Keep the line so residual line numbers match the source
            text = {};
        } else if (in_comment.count(line) == 0 && trimmed.starts_with("@export") &&
                   (trimmed.size() == 7 || !is_ident_char(trimmed[7]))) {
            if (pending_export) {
                return syntax_error(path, line,
                                    "@export must be followed by a declaration, found another "
                                    "@export");
            }
            result.export_lines.push_back(line);

            size_t indent = text.size() - trimmed.size();
            std::string_view after = trim_start(trimmed.substr(7));
            if (trim(strip_line_comment(after)).empty()) {
                pending_export = line;
            }
            result.residual.append(text.substr(0, indent));
            text = after;
        } else if (pending_export) {
            auto content = trim(strip_line_comment(trimmed));
            if (!content.empty() && !content.starts_with("/*") && in_comment.count(line) == 0) {
                pending_export.reset();
            }
        }

        result.residual.append(text);
        if (has_newline) {
            result.residual.push_back('\n');
        }
        pos = line_end + 1;
        ++line;
    }

    // Attach every marker to the declaration that follows it
    auto sites = scan_declarations(result.residual);
    for (size_t marker : result.export_lines) {
        DeclSite* target = nullptr;
        for (auto& site : sites) {
            if (site.decl.line >= marker) {
                target = &site;
                break;
            }
        }
        if (!target || target->prev_line >= marker) {
            return syntax_error(path, marker, "@export is not followed by a declaration");
        }
        if (target->decl.exported) {
            return syntax_error(path, marker,
                                "'" + target->decl.name + "' is already marked @export");
        }
        target->decl.exported = true;
    }

    for (auto& site : sites) {
        result.declarations.push_back(std::move(site.decl));
    }
    return result;
}

} // namespace smc::directive
