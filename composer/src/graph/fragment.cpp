#include "graph/fragment.hpp"

#include "directive/scanner.hpp"

#include <filesystem>

namespace smc::graph {

std::string normalize_path(std::string_view path) {
    std::string generic(path);
    for (char& c : generic) {
        if (c == '\\')
            c = '/';
    }
    while (!generic.empty() && generic.front() == '/') {
        generic.erase(0, 1);
    }

    std::string normal = std::filesystem::path(generic).lexically_normal().generic_string();
    if (normal == ".") {
        return {};
    }
    // "dir/" after collapsing "dir/sub/.."
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

std::string resolve_import_path(std::string_view importer, std::string_view target) {
    if (!target.empty() && (target.front() == '/' || target.front() == '\\')) {
        return normalize_path(target);
    }
    auto dir = std::filesystem::path(normalize_path(importer)).parent_path();
    return normalize_path((dir / std::filesystem::path(std::string(target))).generic_string());
}

std::string Fragment::stem() const {
    auto base = std::filesystem::path(path).stem().string();
    for (char& c : base) {
        if (!directive::is_ident_char(c))
            c = '_';
    }
    if (base.empty() || !directive::is_ident_start(base[0])) {
        base.insert(0, "f");
    }
    return base;
}

Result<FragmentPtr, ResolutionError> make_fragment(std::string path, std::string source) {
    auto parsed = directive::parse_fragment(source, path);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    auto fragment = make_rc<Fragment>();
    fragment->path = std::move(path);
    fragment->fingerprint = cache::fingerprint_string(source);
    fragment->source = std::move(source);
    fragment->parsed = std::move(unwrap(parsed));
    return FragmentPtr(std::move(fragment));
}

} // namespace smc::graph
