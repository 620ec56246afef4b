#include "utils.hpp"

#include "directive/scanner.hpp"
#include "macro/macro_expr.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#define SMC_ISATTY _isatty
#define SMC_FILENO _fileno
#else
#include <unistd.h>
#define SMC_ISATTY isatty
#define SMC_FILENO fileno
#endif

namespace smc::cli {

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

bool write_file(const std::string& path, const std::string& content) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream file(target, std::ios::binary);
    if (!file) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

Result<std::pair<std::string, int64_t>, std::string> parse_define(const std::string& arg) {
    auto eq = arg.find('=');
    std::string name = arg.substr(0, eq);
    if (!directive::is_identifier(name)) {
        return "invalid macro name in '" + arg + "'";
    }
    if (eq == std::string::npos) {
        return "missing value in '" + arg + "' (expected NAME=VALUE)";
    }

    std::string text = arg.substr(eq + 1);
    bool negative = !text.empty() && text[0] == '-';
    auto value = macro::parse_int_literal(negative ? text.substr(1) : text);
    if (!value) {
        return "invalid integer value in '" + arg + "'";
    }
    return std::make_pair(name, negative ? -*value : *value);
}

void print_error(const ResolutionError& error) {
    bool colors = SMC_ISATTY(SMC_FILENO(stderr)) != 0;
    std::cerr << format_error(error, colors) << "\n";
}

void print_usage() {
    std::cout << "Shader Module Composer " << VERSION << "\n\n";
    std::cout << "Usage: smc <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  compose   Compose one root fragment into a WGSL shader\n";
    std::cout << "  build     Compose every shader listed in a manifest\n";
    std::cout << "\nCompose options:\n";
    std::cout << "  smc compose <root.wgsl> [options]\n";
    std::cout << "  -I <dir>              Shader root directory (default: .)\n";
    std::cout << "  -D NAME=VALUE         Set a macro in the environment\n";
    std::cout << "  -o <file>             Write output to a file instead of stdout\n";
    std::cout << "  --no-markers          Omit '// fragment:' marker lines\n";
    std::cout << "  --reflect             Print entry points and live bindings\n";
    std::cout << "  --max-bind-groups=N   Limit the bind group index\n";
    std::cout << "  --max-bindings=N      Limit the binding index per group\n";
    std::cout << "\nBuild options:\n";
    std::cout << "  smc build [shaders.toml] [options]\n";
    std::cout << "  -j N                  Number of worker threads\n";
    std::cout << "  --out-dir <dir>       Override the manifest output directory\n";
    std::cout << "  --only <name>         Build a single shader variant\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h            Show this help\n";
    std::cout << "  --version, -V         Show version\n";
    std::cout << "  -v, -vv, -vvv         Increase log verbosity\n";
    std::cout << "  -q, --quiet           Only log errors\n";
    std::cout << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>   Per-module levels, e.g. graph=trace,*=warn\n";
    std::cout << "  --log-file=<path>     Also write logs to a file\n";
    std::cout << "  --log-format=<fmt>    text or json\n";
}

void print_version() {
    std::cout << "smc " << VERSION << "\n";
}

} // namespace smc::cli
