#include "cli/builder/build_config.hpp"

#include "directive/scanner.hpp"
#include "log/log.hpp"
#include "macro/macro_expr.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

namespace smc::cli {

// ============================================================================
// Validation Functions
// ============================================================================

bool is_valid_shader_name(const std::string& name) {
    if (name.empty())
        return false;

    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

// ============================================================================
// Manifest
// ============================================================================

std::optional<std::string> Manifest::validate() const {
    if (composer.shader_root.empty())
        return "shader-root must not be empty";
    if (composer.out_dir.empty())
        return "out-dir must not be empty";

    std::set<std::string> names;
    for (const auto& shader : shaders) {
        std::string where = "Line " + std::to_string(shader.line) + ": ";
        if (shader.name.empty())
            return where + "shader is missing a name";
        if (!is_valid_shader_name(shader.name))
            return where + "invalid shader name '" + shader.name + "'";
        if (shader.root.empty())
            return where + "shader '" + shader.name + "' is missing a root";
        if (!names.insert(shader.name).second)
            return where + "duplicate shader name '" + shader.name + "'";
    }

    return std::nullopt;
}

const ShaderVariant* Manifest::find_shader(const std::string& name) const {
    for (const auto& shader : shaders) {
        if (shader.name == name)
            return &shader;
    }
    return nullptr;
}

fs::path Manifest::shader_root_path() const {
    return base_dir / composer.shader_root;
}

fs::path Manifest::out_dir_path() const {
    return base_dir / composer.out_dir;
}

ResolverOptions Manifest::resolver_options() const {
    ResolverOptions options;
    options.limits = composer.limits;
    options.markers = composer.markers;
    return options;
}

Result<Manifest, std::string> Manifest::parse(const std::string& content) {
    SimpleTomlParser parser(content);
    auto manifest = parser.parse();
    if (!manifest) {
        return parser.get_error();
    }
    if (auto error = manifest->validate()) {
        return *error;
    }
    return std::move(*manifest);
}

Result<Manifest, std::string> Manifest::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        return "cannot open " + path.string();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto manifest = parse(buffer.str());
    if (is_err(manifest)) {
        return path.string() + ": " + unwrap_err(manifest);
    }
    unwrap(manifest).base_dir = path.parent_path();
    SMC_LOG_DEBUG("config", "Loaded " << path.string() << " with "
                                      << unwrap(manifest).shaders.size() << " shaders");
    return manifest;
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void SimpleTomlParser::skip_trivia() {
    while (!is_eof()) {
        skip_whitespace();
        if (peek() != '#')
            break;
        skip_comment();
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    char c = content_[pos_++];
    if (c == '\n')
        line_++;
    return c;
}

/// Requires the rest of the line to be blank or a comment.
bool SimpleTomlParser::expect_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (!is_eof() && peek() != '\n') {
        set_error(std::string("Unexpected '") + peek() + "' after value");
        return false;
    }
    return true;
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() &&
           (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' || peek() == '-')) {
        result += advance();
    }
    return result;
}

std::optional<std::string> SimpleTomlParser::parse_string() {
    if (peek() != '"') {
        set_error("Expected string");
        return std::nullopt;
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                result += escaped;
                break;
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("Unterminated string");
        return std::nullopt;
    }
    advance(); // Skip closing quote

    return result;
}

std::optional<int64_t> SimpleTomlParser::parse_integer() {
    bool negative = false;
    if (peek() == '-' || peek() == '+') {
        negative = advance() == '-';
    }

    std::string digits;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c != '_')
            digits += c;
    }

    auto value = macro::parse_int_literal(digits);
    if (!value) {
        set_error("Expected integer, found '" + digits + "'");
        return std::nullopt;
    }
    return negative ? -*value : *value;
}

std::optional<bool> SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value == "true")
        return true;
    if (value == "false")
        return false;
    set_error("Expected boolean, found '" + value + "'");
    return std::nullopt;
}

std::optional<macro::MacroEnvironment> SimpleTomlParser::parse_integer_table() {
    if (peek() != '{') {
        set_error("Expected inline table");
        return std::nullopt;
    }
    advance(); // Skip '{'

    macro::MacroEnvironment table;
    skip_inline_whitespace();
    while (!is_eof() && peek() != '}') {
        std::string key = parse_identifier();
        if (!directive::is_identifier(key)) {
            set_error("Invalid macro name '" + key + "'");
            return std::nullopt;
        }
        skip_inline_whitespace();
        if (peek() != '=') {
            set_error("Expected '=' after '" + key + "'");
            return std::nullopt;
        }
        advance();
        skip_inline_whitespace();

        auto value = parse_integer();
        if (!value)
            return std::nullopt;
        if (!table.emplace(key, *value).second) {
            set_error("Duplicate define '" + key + "'");
            return std::nullopt;
        }

        skip_inline_whitespace();
        if (peek() == ',') {
            advance();
            skip_inline_whitespace();
        } else if (peek() != '}') {
            set_error("Expected ',' or '}' in inline table");
            return std::nullopt;
        }
    }

    if (peek() != '}') {
        set_error("Unterminated inline table");
        return std::nullopt;
    }
    advance(); // Skip '}'

    return table;
}

/// Skips the value of an unknown key.
void SimpleTomlParser::skip_value() {
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

void SimpleTomlParser::set_error(const std::string& message) {
    if (error_message_.empty())
        error_message_ = "Line " + std::to_string(line_) + ": " + message;
}

/// Reads `key =` and leaves the cursor at the value.
std::optional<std::string> SimpleTomlParser::parse_key() {
    std::string key = parse_identifier();
    if (key.empty()) {
        set_error(std::string("Expected key, found '") + peek() + "'");
        return std::nullopt;
    }
    skip_inline_whitespace();

    if (peek() != '=') {
        set_error("Expected '=' after key");
        return std::nullopt;
    }
    advance();
    skip_inline_whitespace();
    return key;
}

bool SimpleTomlParser::parse_composer_section(ComposerSettings& settings) {
    skip_trivia();

    while (!is_eof() && peek() != '[') {
        auto key = parse_key();
        if (!key)
            return false;

        if (*key == "shader-root" || *key == "out-dir") {
            auto value = parse_string();
            if (!value)
                return false;
            (*key == "shader-root" ? settings.shader_root : settings.out_dir) = *value;
        } else if (*key == "max-bind-groups" || *key == "max-bindings-per-group") {
            auto value = parse_integer();
            if (!value)
                return false;
            if (*value <= 0 || *value > std::numeric_limits<uint32_t>::max()) {
                set_error(*key + " must be a positive integer");
                return false;
            }
            auto& limit = *key == "max-bind-groups" ? settings.limits.max_bind_groups
                                                    : settings.limits.max_bindings_per_group;
            limit = static_cast<uint32_t>(*value);
        } else if (*key == "markers") {
            auto value = parse_boolean();
            if (!value)
                return false;
            settings.markers = *value;
        } else {
            SMC_LOG_WARN("config", "Line " << line_ << ": ignoring unknown key '" << *key
                                           << "' in [composer]");
            skip_value();
        }

        if (!expect_line_end())
            return false;
        skip_trivia();
    }

    return true;
}

std::optional<ShaderVariant> SimpleTomlParser::parse_shader_section() {
    ShaderVariant shader;
    shader.line = static_cast<size_t>(line_);

    skip_trivia();

    while (!is_eof() && peek() != '[') {
        auto key = parse_key();
        if (!key)
            return std::nullopt;

        if (*key == "name" || *key == "root") {
            auto value = parse_string();
            if (!value)
                return std::nullopt;
            (*key == "name" ? shader.name : shader.root) = *value;
        } else if (*key == "defines") {
            auto defines = parse_integer_table();
            if (!defines)
                return std::nullopt;
            shader.defines = std::move(*defines);
        } else {
            SMC_LOG_WARN("config", "Line " << line_ << ": ignoring unknown key '" << *key
                                           << "' in [[shader]]");
            skip_value();
        }

        if (!expect_line_end())
            return std::nullopt;
        skip_trivia();
    }

    return shader;
}

std::optional<Manifest> SimpleTomlParser::parse() {
    Manifest manifest;

    while (!is_eof()) {
        skip_trivia();

        if (is_eof())
            break;

        if (peek() != '[') {
            set_error("Key outside of a section");
            return std::nullopt;
        }
        advance(); // Skip '['

        // Check for array section [[shader]]
        bool is_array = false;
        if (peek() == '[') {
            is_array = true;
            advance();
        }

        std::string section = parse_identifier();

        if (is_array && peek() == ']') {
            advance(); // Skip second ']'
        }

        if (peek() != ']') {
            set_error("Expected ']' after section name");
            return std::nullopt;
        }
        advance(); // Skip ']'

        if (!expect_line_end())
            return std::nullopt;

        // Parse section content
        if (section == "composer" && !is_array) {
            if (!parse_composer_section(manifest.composer))
                return std::nullopt;
        } else if (section == "shader" && is_array) {
            auto shader = parse_shader_section();
            if (!shader)
                return std::nullopt;
            manifest.shaders.push_back(std::move(*shader));
        } else {
            set_error("Unknown section '" + section + "'");
            return std::nullopt;
        }
    }

    if (!error_message_.empty()) {
        return std::nullopt;
    }

    return manifest;
}

} // namespace smc::cli
