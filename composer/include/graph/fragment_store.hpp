//! # Fragment Store
//!
//! Parsed-fragment cache shared by every resolution of one resolver. A
//! fragment is loaded and parsed once and then handed out as a shared,
//! immutable `FragmentPtr`. Invalidation drops a path so the next request
//! reloads it.
//!
//! Uses `std::shared_mutex`: lookups take a shared lock, inserts and
//! invalidations an exclusive one. Loads run without the lock held.

#pragma once

#include "error/diagnostic.hpp"
#include "graph/fragment.hpp"
#include "graph/loader.hpp"

#include <atomic>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace smc::graph {

class FragmentStore {
public:
    explicit FragmentStore(SourceLoader& loader) : loader_(loader) {}

    /// Returns the fragment at a normalized path, loading and parsing it on
    /// first use. A load failure is reported as `UnresolvedImport` with the
    /// path in `symbol`; parse failures are returned as-is. Failures are not
    /// cached.
    [[nodiscard]] Result<FragmentPtr, ResolutionError> get(const std::string& path);

    /// Drops a cached fragment. Returns true if one was cached.
    bool invalidate(const std::string& path);

    /// Drops every cached fragment.
    void clear();

    struct Stats {
        size_t cached_fragments = 0;
        size_t loads = 0; ///< Calls made to the loader
        size_t hits = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    SourceLoader& loader_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FragmentPtr> fragments_;
    uint64_t generation_ = 0; ///< Bumped by every invalidation
    std::atomic<size_t> loads_{0};
    std::atomic<size_t> hits_{0};
};

} // namespace smc::graph
