#include "resolver/resolver.hpp"

#include "graph/fragment.hpp"
#include "graph/module_graph.hpp"
#include "log/log.hpp"

namespace smc {

Resolver::Resolver(graph::SourceLoader& loader, ResolverOptions options)
    : options_(options), store_(loader) {}

Result<compose::ComposedShaderPtr, ResolutionError>
Resolver::resolve(std::string_view root, const macro::MacroEnvironment& env) {
    cache::ResolutionKey key{graph::normalize_path(root), env};
    bool computed = false;

    auto result = cache_.get_or_compute(key, [&]() -> cache::ResolveResult {
        computed = true;
        SMC_LOG_DEBUG("resolve", "Cache miss for " << key.root << " {" << macro::to_string(env)
                                                   << "}");
        return compute(key);
    });

    if (is_err(result)) {
        SMC_LOG_WARN("resolve", unwrap_err(result).to_string());
    } else if (!computed) {
        SMC_LOG_DEBUG("resolve", "Cache hit for " << key.root << " {" << macro::to_string(env)
                                                  << "}");
    }
    return result;
}

cache::ResolveResult Resolver::compute(const cache::ResolutionKey& key) {
    auto graph = graph::ModuleGraph::build(key.root, store_);
    if (is_err(graph)) {
        return unwrap_err(graph);
    }

    compose::ComposeOptions options;
    options.limits = options_.limits;
    options.markers = options_.markers;

    auto shader = compose::compose(unwrap(graph), key.env, options);
    if (is_err(shader)) {
        return unwrap_err(shader);
    }

    auto composed = make_rc<const compose::ComposedShader>(std::move(unwrap(shader)));
    SMC_LOG_INFO("resolve", "Composed " << composed->root << " {" << macro::to_string(key.env)
                                        << "}: " << composed->fragments.size() << " fragments, "
                                        << composed->text.size() << " bytes, fingerprint "
                                        << composed->fingerprint.to_hex());
    return composed;
}

void Resolver::invalidate(std::string_view path) {
    auto normalized = graph::normalize_path(path);
    bool had_fragment = store_.invalidate(normalized);
    size_t dropped = cache_.invalidate(normalized);
    SMC_LOG_DEBUG("resolve", "Invalidated " << normalized << " (fragment cached: "
                                            << (had_fragment ? "yes" : "no") << ", " << dropped
                                            << " shaders dropped)");
}

void Resolver::clear() {
    store_.clear();
    cache_.clear();
}

ResolverStats Resolver::stats() const {
    auto cache_stats = cache_.get_stats();
    auto store_stats = store_.get_stats();
    return {cache_stats.hits, cache_stats.misses, cache_stats.total_entries, store_stats.loads,
            store_stats.cached_fragments};
}

} // namespace smc
