#include "cli/commands/cmd_compose.hpp"

#include "cli/utils.hpp"
#include "graph/loader.hpp"
#include "log/log.hpp"
#include "macro/macro_expr.hpp"
#include "resolver/resolver.hpp"

#include <iostream>
#include <limits>
#include <sstream>

namespace smc::cli {

namespace {

std::optional<uint32_t> parse_limit(const std::string& flag, const std::string& text) {
    auto value = macro::parse_int_literal(text);
    if (!value || *value <= 0 || *value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "error: " << flag << " expects a positive integer, got '" << text << "'\n";
        return std::nullopt;
    }
    return static_cast<uint32_t>(*value);
}

} // namespace

std::optional<ComposeCommandOptions> parse_compose_args(const std::vector<std::string>& args) {
    ComposeCommandOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value_of = [&](const std::string& flag) -> std::optional<std::string> {
            if (arg.size() > flag.size() && arg.starts_with(flag)) {
                return arg.substr(flag.size());
            }
            if (i + 1 >= args.size()) {
                std::cerr << "error: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg.starts_with("-I")) {
            auto dir = value_of("-I");
            if (!dir)
                return std::nullopt;
            options.include_dir = *dir;
        } else if (arg.starts_with("-D")) {
            auto text = value_of("-D");
            if (!text)
                return std::nullopt;
            auto define = parse_define(*text);
            if (is_err(define)) {
                std::cerr << "error: " << unwrap_err(define) << "\n";
                return std::nullopt;
            }
            options.defines[unwrap(define).first] = unwrap(define).second;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 >= args.size()) {
                std::cerr << "error: " << arg << " requires a value\n";
                return std::nullopt;
            }
            options.output = args[++i];
        } else if (arg == "--no-markers") {
            options.markers = false;
        } else if (arg == "--reflect") {
            options.reflect = true;
        } else if (arg.starts_with("--max-bind-groups=")) {
            auto limit = parse_limit("--max-bind-groups", arg.substr(18));
            if (!limit)
                return std::nullopt;
            options.limits.max_bind_groups = limit;
        } else if (arg.starts_with("--max-bindings=")) {
            auto limit = parse_limit("--max-bindings", arg.substr(15));
            if (!limit)
                return std::nullopt;
            options.limits.max_bindings_per_group = limit;
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return std::nullopt;
        } else if (options.root.empty()) {
            options.root = arg;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            return std::nullopt;
        }
    }

    if (options.root.empty()) {
        std::cerr << "Usage: smc compose <root.wgsl> [-I <dir>] [-D NAME=VALUE]... [-o <file>]\n";
        return std::nullopt;
    }
    return options;
}

std::string format_reflection(const compose::ComposedShader& shader) {
    std::ostringstream out;
    out << "root: " << shader.root << "\n";
    out << "fingerprint: " << shader.fingerprint.to_hex() << "\n";
    out << "fragments:\n";
    for (const auto& path : shader.fragments) {
        out << "  " << path << "\n";
    }
    out << "entry points:\n";
    for (const auto& entry : shader.reflection.entry_points) {
        out << "  @" << directive::stage_name(entry.stage) << " " << entry.name << " ("
            << entry.fragment << ")\n";
    }
    out << "bindings:\n";
    for (const auto& binding : shader.reflection.bindings) {
        out << "  " << binding.slot.to_string() << " " << binding.name << " (" << binding.fragment
            << ":" << binding.line << ")\n";
    }
    return out.str();
}

int run_compose(const ComposeCommandOptions& options) {
    graph::FileLoader loader(options.include_dir);
    ResolverOptions resolver_options;
    resolver_options.limits = options.limits;
    resolver_options.markers = options.markers;
    Resolver resolver(loader, resolver_options);

    auto shader = resolver.resolve(options.root, options.defines);
    if (is_err(shader)) {
        print_error(unwrap_err(shader));
        return 1;
    }
    const auto& composed = *unwrap(shader);

    if (options.output.empty()) {
        std::cout << composed.text;
    } else if (!write_file(options.output, composed.text)) {
        std::cerr << "error: cannot write " << options.output << "\n";
        return 1;
    } else {
        SMC_LOG_INFO("cli", "Wrote " << options.output << " (" << composed.text.size()
                                     << " bytes)");
    }

    if (options.reflect) {
        (options.output.empty() ? std::cerr : std::cout) << format_reflection(composed);
    }
    return 0;
}

} // namespace smc::cli
