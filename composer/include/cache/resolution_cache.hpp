//! # Resolution Cache
//!
//! Thread-safe memoization of composed shaders keyed by
//! `(normalized root path, macro environment)`.
//!
//! Uses `std::shared_mutex` for concurrent read access. A key being computed
//! is tracked as in-flight with a `std::shared_future`; later callers for the
//! same key wait for that result instead of computing it again.
//!
//! ## Invalidation
//!
//! `invalidate(path)` drops every entry whose composition included `path`.
//! A computation that overlaps an invalidation of one of its fragments still
//! hands its result to the waiting callers, but the result is not stored.
//! Failed computations are never stored.

#pragma once

#include "cache/fingerprint.hpp"
#include "compose/composer.hpp"
#include "error/diagnostic.hpp"
#include "macro/macro_expander.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace smc::cache {

/// Identity of one resolution.
struct ResolutionKey {
    std::string root;
    macro::MacroEnvironment env;

    bool operator==(const ResolutionKey& other) const = default;

    [[nodiscard]] Fingerprint fingerprint() const;
};

struct ResolutionKeyHash {
    size_t operator()(const ResolutionKey& key) const {
        return static_cast<size_t>(key.fingerprint().low);
    }
};

using ResolveResult = Result<compose::ComposedShaderPtr, ResolutionError>;

/// Thread-safe cache of composed shaders.
class ResolutionCache {
public:
    using Compute = std::function<ResolveResult()>;

    /// Returns the cached shader for `key`, joins a computation already in
    /// flight for it, or runs `compute` and stores its successful result.
    ResolveResult get_or_compute(const ResolutionKey& key, const Compute& compute);

    /// Look up a cached shader. Returns nullopt if not cached.
    [[nodiscard]] std::optional<compose::ComposedShaderPtr> lookup(const ResolutionKey& key) const;

    /// Check if a key is cached.
    [[nodiscard]] bool contains(const ResolutionKey& key) const;

    /// Drops every entry that included `path`. Returns the number dropped.
    size_t invalidate(const std::string& path);

    /// Clear the entire cache.
    void clear();

    /// Cache statistics.
    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
        size_t in_flight_waits = 0; ///< Callers that joined another's computation
    };

    /// Get cache statistics.
    [[nodiscard]] Stats get_stats() const;

private:
    struct InFlight {
        std::shared_future<ResolveResult> result;
        std::vector<std::string> invalidated; ///< Paths invalidated meanwhile
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<ResolutionKey, compose::ComposedShaderPtr, ResolutionKeyHash> entries_;
    std::unordered_map<ResolutionKey, InFlight, ResolutionKeyHash> in_flight_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> waits_{0};
};

} // namespace smc::cache
