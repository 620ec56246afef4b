#include "graph/loader.hpp"

#include "graph/fragment.hpp"

#include <fstream>
#include <sstream>

namespace smc::graph {

// ============================================================================
// FileLoader
// ============================================================================

FileLoader::FileLoader(std::filesystem::path base_dir) : base_dir_(std::move(base_dir)) {}

Result<std::string, LoadError> FileLoader::load(const std::string& path) {
    auto full = base_dir_ / path;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(full, ec)) {
        return LoadError{"cannot open file: " + full.generic_string()};
    }

    std::ifstream file(full, std::ios::binary);
    if (!file) {
        return LoadError{"cannot open file: " + full.generic_string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return LoadError{"error reading file: " + full.generic_string()};
    }
    return buffer.str();
}

// ============================================================================
// MemoryLoader
// ============================================================================

void MemoryLoader::add(const std::string& path, std::string source) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_[normalize_path(path)] = std::move(source);
}

void MemoryLoader::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_.erase(normalize_path(path));
}

Result<std::string, LoadError> MemoryLoader::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_loads_;
    ++loads_[path];

    auto it = sources_.find(path);
    if (it == sources_.end()) {
        return LoadError{"no such fragment: " + path};
    }
    return it->second;
}

size_t MemoryLoader::load_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_loads_;
}

size_t MemoryLoader::load_count(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loads_.find(normalize_path(path));
    return it == loads_.end() ? 0 : it->second;
}

} // namespace smc::graph
