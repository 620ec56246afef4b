#include "cache/resolution_cache.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <exception>

namespace smc::cache {

Fingerprint ResolutionKey::fingerprint() const {
    auto fp = fingerprint_string(root);
    for (const auto& [name, value] : env) {
        fp = fingerprint_combine(fp, fingerprint_string(name + "=" + std::to_string(value)));
    }
    return fp;
}

ResolveResult ResolutionCache::get_or_compute(const ResolutionKey& key, const Compute& compute) {
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    std::promise<ResolveResult> promise;
    {
        std::unique_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
        auto flight = in_flight_.find(key);
        if (flight != in_flight_.end()) {
            auto result = flight->second.result;
            lock.unlock();
            waits_.fetch_add(1, std::memory_order_relaxed);
            SMC_LOG_DEBUG("cache", "Waiting for in-flight resolution of " << key.root);
            return result.get();
        }
        misses_.fetch_add(1, std::memory_order_relaxed);
        in_flight_.emplace(key, InFlight{promise.get_future().share(), {}});
    }

    ResolveResult result;
    try {
        result = compute();
    } catch (...) {
        {
            std::unique_lock lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock lock(mutex_);
        auto flight = in_flight_.find(key);
        if (is_ok(result)) {
            const auto& shader = unwrap(result);
            const auto& invalidated = flight->second.invalidated;
            bool stale = std::any_of(invalidated.begin(), invalidated.end(),
                                     [&](const std::string& path) { return shader->includes(path); });
            if (stale) {
                SMC_LOG_DEBUG("cache", "Not caching " << key.root
                                                      << ": a fragment changed during composition");
            } else {
                entries_[key] = shader;
            }
        }
        in_flight_.erase(flight);
    }

    promise.set_value(result);
    return result;
}

std::optional<compose::ComposedShaderPtr>
ResolutionCache::lookup(const ResolutionKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

bool ResolutionCache::contains(const ResolutionKey& key) const {
    std::shared_lock lock(mutex_);
    return entries_.find(key) != entries_.end();
}

size_t ResolutionCache::invalidate(const std::string& path) {
    std::unique_lock lock(mutex_);

    size_t dropped = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second->includes(path)) {
            it = entries_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }

    for (auto& [key, flight] : in_flight_) {
        flight.invalidated.push_back(path);
    }

    SMC_LOG_DEBUG("cache", "Invalidated " << path << ": dropped " << dropped << " entries");
    return dropped;
}

void ResolutionCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    for (auto& [key, flight] : in_flight_) {
        flight.invalidated.push_back(key.root);
    }
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    waits_.store(0, std::memory_order_relaxed);
}

ResolutionCache::Stats ResolutionCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed), waits_.load(std::memory_order_relaxed)};
}

} // namespace smc::cache
