#include "macro/macro_expander.hpp"

#include "directive/scanner.hpp"
#include "log/log.hpp"
#include "macro/macro_expr.hpp"

#include <limits>

namespace smc::macro {

namespace {

using directive::Token;
using directive::TokenKind;

std::string site(const graph::Fragment& fragment, size_t line) {
    return fragment.path + ":" + std::to_string(line);
}

/// Index of the next significant token after `i`, or `tokens.size()`.
size_t next_significant(const std::vector<Token>& tokens, size_t i) {
    for (++i; i < tokens.size(); ++i) {
        if (tokens[i].is_significant()) {
            return i;
        }
    }
    return tokens.size();
}

/// One argument of an attribute after substitution, without comments.
struct AttributeArg {
    std::string text;
    bool has_macro = false;
    bool gap = false; ///< whitespace or a comment since the last token

    void append(std::string_view piece) {
        if (gap && !text.empty()) {
            text += ' ';
        }
        gap = false;
        text += piece;
    }
};

struct AttributeUse {
    std::string name;
    size_t line = 0;
    std::vector<AttributeArg> args;
};

} // namespace

std::string to_string(const MacroEnvironment& env) {
    std::string result;
    for (const auto& [name, value] : env) {
        if (!result.empty())
            result += ',';
        result += name + "=" + std::to_string(value);
    }
    return result;
}

MacroExpander::MacroExpander(const graph::ModuleGraph& graph, const MacroEnvironment& env)
    : graph_(graph), env_(env) {}

// ============================================================================
// Definitions
// ============================================================================

std::optional<ResolutionError> MacroExpander::check_definitions() {
    definitions_.clear();
    visible_.clear();

    for (const auto& fragment : graph_.order()) {
        auto upstream = graph_.upstream(fragment->path);
        std::unordered_set<std::string> upstream_paths;
        for (const auto& dep : upstream) {
            upstream_paths.insert(dep->path);
        }

        for (const auto& def : fragment->parsed.defines) {
            auto shadowing = [&](std::string message) {
                auto error = make_error(ErrorKind::MacroShadowing, std::move(message),
                                        fragment->path, def.line);
                error.symbol = def.name;
                return error;
            };

            if (env_.count(def.name) > 0) {
                return shadowing("macro '" + def.name +
                                 "' redefines a value supplied by the caller environment");
            }

            auto prev = definitions_.find(def.name);
            if (prev != definitions_.end()) {
                const auto& other = prev->second;
                std::string where = site(*other.owner, other.directive->line);
                if (other.owner == fragment.get()) {
                    return shadowing("macro '" + def.name + "' is already defined on line " +
                                     std::to_string(other.directive->line));
                }
                auto error =
                    upstream_paths.count(other.owner->path) > 0
                        ? shadowing("macro '" + def.name + "' shadows the definition at " + where)
                        : shadowing("macro '" + def.name + "' conflicts with the definition at " +
                                    where);
                error.related = {where, site(*fragment, def.line)};
                return error;
            }
            definitions_.emplace(def.name, Definition{&def, fragment.get()});
        }

        auto& names = visible_[fragment->path];
        for (const auto& def : fragment->parsed.defines) {
            names.insert(def.name);
        }
        for (const auto& dep : upstream) {
            for (const auto& def : dep->parsed.defines) {
                names.insert(def.name);
            }
        }
    }

    return std::nullopt;
}

Result<int64_t, ResolutionError> MacroExpander::value_of(const std::string& fragment,
                                                         const std::string& name, size_t line) {
    auto env_it = env_.find(name);
    if (env_it != env_.end()) {
        return env_it->second;
    }

    auto vis = visible_.find(fragment);
    if (vis != visible_.end() && vis->second.count(name) > 0) {
        return evaluate_definition(name);
    }

    std::string message = "undefined macro '#" + name + "'";
    auto def = definitions_.find(name);
    if (def != definitions_.end()) {
        message += " (defined in " + def->second.owner->path + ", which " + fragment +
                   " does not import)";
    }
    auto error = make_error(ErrorKind::UndefinedMacro, message, fragment, line);
    error.symbol = name;
    return error;
}

Result<int64_t, ResolutionError> MacroExpander::evaluate_definition(const std::string& name) {
    auto cached = values_.find(name);
    if (cached != values_.end()) {
        return cached->second;
    }

    const auto& def = definitions_.at(name);
    const std::string& owner = def.owner->path;
    size_t line = def.directive->line;

    if (evaluating_.count(name) > 0) {
        auto error = make_error(ErrorKind::UnsupportedMacroExpression,
                                "recursive macro definition '" + name + "'", owner, line);
        error.symbol = name;
        return error;
    }

    auto expr = parse_macro_expr(def.directive->expr);
    if (is_err(expr)) {
        auto error = make_error(ErrorKind::UnsupportedMacroExpression,
                                unwrap_err(expr) + " (in '#define " + name + " " +
                                    def.directive->expr + "')",
                                owner, line);
        error.symbol = name;
        return error;
    }

    evaluating_.insert(name);
    auto value = evaluate(*unwrap(expr),
                          [&](const std::string& ref) { return value_of(owner, ref, line); });
    evaluating_.erase(name);

    if (is_err(value)) {
        auto& error = unwrap_err(value);
        if (error.fragment.empty()) {
            error.fragment = owner;
            error.line = line;
            error.symbol = name;
        }
        return value;
    }

    SMC_LOG_TRACE("macro", "#" << name << " = " << unwrap(value) << " (" << owner << ":" << line
                               << ")");
    values_.emplace(name, unwrap(value));
    return value;
}

// ============================================================================
// Substitution
// ============================================================================

Result<std::string, ResolutionError> MacroExpander::expand(const graph::Fragment& fragment) {
    const std::string& text = fragment.parsed.residual;
    auto tokens = directive::tokenize(text);

    std::string out;
    out.reserve(text.size());
    std::vector<AttributeUse> uses;
    std::optional<AttributeUse> current;
    int parens = 0;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];

        if (!current && tok.is_punct('@')) {
            size_t name_at = next_significant(tokens, i);
            size_t open_at = next_significant(tokens, name_at);
            if (open_at < tokens.size() && tokens[name_at].kind == TokenKind::Identifier &&
                tokens[open_at].is_punct('(')) {
                for (size_t j = i; j <= open_at; ++j) {
                    out += tokens[j].lexeme;
                }
                current = AttributeUse{std::string(tokens[name_at].lexeme), tok.line, {}};
                current->args.emplace_back();
                parens = 1;
                i = open_at;
                continue;
            }
        }

        bool closes = false;
        if (current) {
            if (tok.is_punct('(')) {
                ++parens;
            } else if (tok.is_punct(')') && --parens == 0) {
                closes = true;
            } else if (tok.is_punct(',') && parens == 1) {
                out += ',';
                current->args.emplace_back();
                continue;
            }
        }

        if (tok.kind == TokenKind::MacroRef) {
            auto value = value_of(fragment.path, std::string(tok.macro_name()), tok.line);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            auto text = std::to_string(unwrap(value));
            out += text;
            if (current) {
                current->args.back().append(text);
                current->args.back().has_macro = true;
            }
            continue;
        }

        out += tok.lexeme;
        if (closes) {
            uses.push_back(std::move(*current));
            current.reset();
        } else if (current) {
            if (tok.is_significant()) {
                current->args.back().append(tok.lexeme);
            } else {
                current->args.back().gap = true;
            }
        }
    }

    for (const auto& use : uses) {
        bool slot = use.name == "group" || use.name == "binding";
        for (const auto& arg : use.args) {
            if (!arg.has_macro) {
                continue;
            }
            std::string_view value_text = arg.text;
            auto value = parse_int_literal(value_text);

            std::string problem;
            if (slot && value_text.starts_with("-")) {
                problem = "must be a non-negative integer";
            } else if (!value) {
                problem = "is not a single integer literal";
            } else if (slot && *value > std::numeric_limits<uint32_t>::max()) {
                problem = "does not fit in 32 bits";
            }
            if (!problem.empty()) {
                auto error = make_error(ErrorKind::MacroSubstitution,
                                        "argument '" + std::string(value_text) + "' of @" +
                                            use.name + " " + problem + " after substitution",
                                        fragment.path, use.line);
                error.symbol = use.name;
                return error;
            }
        }
    }

    return out;
}

Result<std::vector<ExpandedFragment>, ResolutionError> MacroExpander::expand_all() {
    if (auto error = check_definitions()) {
        return *error;
    }

    for (const auto& fragment : graph_.order()) {
        for (const auto& def : fragment->parsed.defines) {
            auto value = evaluate_definition(def.name);
            if (is_err(value)) {
                return unwrap_err(value);
            }
        }
    }

    std::vector<ExpandedFragment> result;
    result.reserve(graph_.size());
    for (const auto& fragment : graph_.order()) {
        auto text = expand(*fragment);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        result.push_back(ExpandedFragment{fragment, std::move(unwrap(text))});
    }

    SMC_LOG_DEBUG("macro", "Expanded " << result.size() << " fragments of " << graph_.root()
                                       << " with {" << to_string(env_) << "}");
    return result;
}

Result<std::vector<ExpandedFragment>, ResolutionError>
expand_macros(const graph::ModuleGraph& graph, const MacroEnvironment& env) {
    MacroExpander expander(graph, env);
    return expander.expand_all();
}

} // namespace smc::macro
