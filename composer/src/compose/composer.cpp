#include "compose/composer.hpp"

#include "directive/scanner.hpp"
#include "log/log.hpp"
#include "macro/macro_expr.hpp"
#include "symbols/namespacer.hpp"

#include <algorithm>
#include <limits>
#include <string_view>
#include <unordered_map>

namespace smc::compose {

namespace {

/// Reads the slot of a binding declaration from its expanded attributes.
Result<BindingSlot, ResolutionError> read_slot(const directive::Declaration& decl,
                                               const std::string& fragment) {
    BindingSlot slot;
    for (const char* attr : {"group", "binding"}) {
        const auto* found = decl.find_attribute(attr);
        auto value = macro::parse_int_literal(found->args);
        if (!value || *value > std::numeric_limits<uint32_t>::max()) {
            auto error = make_error(ErrorKind::MacroSubstitution,
                                    "@" + std::string(attr) + "(" + found->args + ") of '" +
                                        decl.name + "' is not a 32-bit integer literal",
                                    fragment, decl.line);
            error.symbol = decl.name;
            return error;
        }
        (std::string_view(attr) == "group" ? slot.group : slot.binding) =
            static_cast<uint32_t>(*value);
    }
    return slot;
}

std::string describe(const BindingInfo& info) {
    return "'" + info.declared + "' (" + info.fragment + ":" + std::to_string(info.line) + ")";
}

} // namespace

std::string BindingSlot::to_string() const {
    return "(group " + std::to_string(group) + ", binding " + std::to_string(binding) + ")";
}

bool ComposedShader::includes(std::string_view path) const {
    return std::find(fragments.begin(), fragments.end(), path) != fragments.end();
}

Result<ComposedShader, ResolutionError> compose(const graph::ModuleGraph& graph,
                                                const macro::MacroEnvironment& env,
                                                const ComposeOptions& options) {
    auto expanded = macro::expand_macros(graph, env);
    if (is_err(expanded)) {
        return unwrap_err(expanded);
    }

    symbols::Namespacer namespacer(graph);
    ComposedShader shader;
    shader.env = env;
    shader.root = graph.root();

    std::vector<BindingInfo> candidates;
    for (const auto& part : unwrap(expanded)) {
        const auto& fragment = *part.fragment;
        auto text = namespacer.rewrite(fragment, part.text);
        if (is_err(text)) {
            return unwrap_err(text);
        }

        if (options.markers) {
            shader.text += "// fragment: " + fragment.path + "\n";
        }
        shader.text += unwrap(text);
        if (!shader.text.empty() && shader.text.back() != '\n') {
            shader.text += '\n';
        }
        shader.fragments.push_back(fragment.path);

        for (const auto& decl : directive::collect_declarations(part.text)) {
            if (decl.is_entry_point()) {
                shader.reflection.entry_points.push_back(
                    EntryPoint{decl.name, decl.stage, fragment.path});
            }
            if (!decl.is_binding()) {
                continue;
            }
            auto slot = read_slot(decl, fragment.path);
            if (is_err(slot)) {
                return unwrap_err(slot);
            }
            candidates.push_back(BindingInfo{namespacer.final_name(fragment, decl.name), decl.name,
                                             fragment.path, decl.line, unwrap(slot)});
        }
    }

    // A binding is live when its name is referenced outside its own declaration
    std::unordered_map<std::string_view, size_t> uses;
    auto tokens = directive::tokenize(shader.text);
    auto references = symbols::reference_mask(tokens);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (references[i]) {
            ++uses[tokens[i].lexeme];
        }
    }

    std::vector<BindingInfo> live;
    for (auto& info : candidates) {
        auto it = uses.find(info.name);
        if (it != uses.end() && it->second > 1) {
            live.push_back(std::move(info));
        } else {
            SMC_LOG_TRACE("compose", "Binding " << info.name << " " << info.slot.to_string()
                                                << " is unused");
        }
    }

    std::stable_sort(live.begin(), live.end(), [](const BindingInfo& a, const BindingInfo& b) {
        return a.slot < b.slot;
    });

    for (size_t i = 1; i < live.size(); ++i) {
        if (live[i].slot == live[i - 1].slot) {
            const auto& first = live[i - 1];
            const auto& second = live[i];
            auto error = make_error(ErrorKind::BindingSlotCollision,
                                    "binding slot " + second.slot.to_string() +
                                        " is used by both " + describe(first) + " and " +
                                        describe(second),
                                    second.fragment, second.line);
            error.symbol = second.declared;
            error.related = {first.declared, second.declared};
            return error;
        }
    }

    const auto& limits = options.limits;
    for (const auto& info : live) {
        std::string problem;
        if (limits.max_bind_groups && info.slot.group >= *limits.max_bind_groups) {
            problem = "uses group " + std::to_string(info.slot.group) + " but at most " +
                      std::to_string(*limits.max_bind_groups) + " bind groups are allowed";
        } else if (limits.max_bindings_per_group &&
                   info.slot.binding >= *limits.max_bindings_per_group) {
            problem = "uses binding " + std::to_string(info.slot.binding) + " but at most " +
                      std::to_string(*limits.max_bindings_per_group) +
                      " bindings per group are allowed";
        }
        if (!problem.empty()) {
            auto error = make_error(ErrorKind::BindingLimit,
                                    "binding '" + info.declared + "' " + problem, info.fragment,
                                    info.line);
            error.symbol = info.declared;
            return error;
        }
    }

    shader.reflection.bindings = std::move(live);
    shader.fingerprint = cache::fingerprint_string(shader.text);

    SMC_LOG_DEBUG("compose", "Composed " << shader.root << ": " << shader.fragments.size()
                                         << " fragments, " << shader.reflection.bindings.size()
                                         << " live bindings, "
                                         << shader.reflection.entry_points.size()
                                         << " entry points");
    return shader;
}

} // namespace smc::compose
