//! # Source Loaders
//!
//! The resolver never touches storage directly: every fragment is read
//! through a caller-supplied `SourceLoader`. Loaders are called from several
//! threads at once and may block.
//!
//! | Loader         | Source                                  |
//! |----------------|-----------------------------------------|
//! | `FileLoader`   | Files below a base directory            |
//! | `MemoryLoader` | In-memory map, counts loads per path    |

#ifndef SMC_GRAPH_LOADER_HPP
#define SMC_GRAPH_LOADER_HPP

#include "common.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace smc::graph {

/// I/O failure reported by a loader.
struct LoadError {
    std::string message;
};

/// Capability that maps a normalized fragment path to its source text.
class SourceLoader {
public:
    virtual ~SourceLoader() = default;

    /// Returns the source text, or the I/O failure.
    virtual Result<std::string, LoadError> load(const std::string& path) = 0;
};

/// Reads fragments from files below a base directory.
class FileLoader : public SourceLoader {
public:
    explicit FileLoader(std::filesystem::path base_dir);

    Result<std::string, LoadError> load(const std::string& path) override;

    [[nodiscard]] const std::filesystem::path& base_dir() const {
        return base_dir_;
    }

private:
    std::filesystem::path base_dir_;
};

/// Thread-safe in-memory loader.
class MemoryLoader : public SourceLoader {
public:
    /// Adds or replaces a fragment. The path is normalized.
    void add(const std::string& path, std::string source);

    /// Removes a fragment; later loads of it fail.
    void remove(const std::string& path);

    Result<std::string, LoadError> load(const std::string& path) override;

    /// Total number of `load()` calls.
    [[nodiscard]] size_t load_count() const;

    /// Number of `load()` calls for one path.
    [[nodiscard]] size_t load_count(const std::string& path) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> sources_;
    std::unordered_map<std::string, size_t> loads_;
    size_t total_loads_ = 0;
};

} // namespace smc::graph

#endif // SMC_GRAPH_LOADER_HPP
