#include "graph/fragment_store.hpp"

#include "log/log.hpp"

#include <mutex>

namespace smc::graph {

Result<FragmentPtr, ResolutionError> FragmentStore::get(const std::string& path) {
    uint64_t generation;
    {
        std::shared_lock lock(mutex_);
        auto it = fragments_.find(path);
        if (it != fragments_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
        generation = generation_;
    }

    loads_.fetch_add(1, std::memory_order_relaxed);
    auto source = loader_.load(path);
    if (is_err(source)) {
        auto error = make_error(ErrorKind::UnresolvedImport, unwrap_err(source).message, path);
        error.symbol = path;
        return error;
    }

    auto fragment = make_fragment(path, std::move(unwrap(source)));
    if (is_err(fragment)) {
        return unwrap_err(fragment);
    }
    const auto& loaded = unwrap(fragment);
    SMC_LOG_TRACE("graph", "Loaded " << path << " (" << loaded->source.size() << " bytes, "
                                     << loaded->parsed.imports.size() << " imports, fp "
                                     << loaded->fingerprint.to_hex() << ")");

    std::unique_lock lock(mutex_);
    if (generation != generation_) {
        // Invalidated while loading; hand out the result without caching it
        return loaded;
    }
    // Another thread may have inserted the same path first; share its copy
    return fragments_.emplace(path, loaded).first->second;
}

bool FragmentStore::invalidate(const std::string& path) {
    std::unique_lock lock(mutex_);
    ++generation_;
    return fragments_.erase(path) > 0;
}

void FragmentStore::clear() {
    std::unique_lock lock(mutex_);
    ++generation_;
    fragments_.clear();
}

FragmentStore::Stats FragmentStore::get_stats() const {
    std::shared_lock lock(mutex_);
    return {fragments_.size(), loads_.load(std::memory_order_relaxed),
            hits_.load(std::memory_order_relaxed)};
}

} // namespace smc::graph
