//! # Resolver
//!
//! Public entry point of the composer. Owns the fragment store and the
//! resolution cache and runs the full pipeline on a cache miss:
//!
//! ```text
//! resolve(root, env)
//!   -> ResolutionCache          hit: shared ComposedShader
//!   -> ModuleGraph::build       fragments via FragmentStore + SourceLoader
//!   -> compose                  macros, namespacing, binding validation
//! ```
//!
//! ## Example
//!
//! ```cpp
//! graph::FileLoader loader("shaders");
//! Resolver resolver(loader);
//! auto shader = resolver.resolve("unlit_diffuse.wgsl",
//!                                {{"CAMERA_GROUP", 0}, {"MODEL_GROUP", 1}});
//! if (is_err(shader)) {
//!     std::cerr << unwrap_err(shader).to_string() << "\n";
//! }
//! ```
//!
//! A `Resolver` may be shared between threads. The loader must outlive it.

#ifndef SMC_RESOLVER_RESOLVER_HPP
#define SMC_RESOLVER_RESOLVER_HPP

#include "cache/resolution_cache.hpp"
#include "common.hpp"
#include "compose/composer.hpp"
#include "error/diagnostic.hpp"
#include "graph/fragment_store.hpp"
#include "graph/loader.hpp"
#include "macro/macro_expander.hpp"

#include <string>
#include <string_view>

namespace smc {

struct ResolverOptions {
    compose::BindingLimits limits;
    bool markers = true;
};

struct ResolverStats {
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t cached_shaders = 0;
    size_t fragments_loaded = 0; ///< Loader calls
    size_t fragments_cached = 0;
};

class Resolver {
public:
    explicit Resolver(graph::SourceLoader& loader, ResolverOptions options = {});

    /// Composes `root` under `env`, or returns the cached composition.
    [[nodiscard]] Result<compose::ComposedShaderPtr, ResolutionError>
    resolve(std::string_view root, const macro::MacroEnvironment& env);

    /// Drops a fragment and every cached shader that included it.
    void invalidate(std::string_view path);

    /// Drops everything.
    void clear();

    [[nodiscard]] ResolverStats stats() const;

    [[nodiscard]] const ResolverOptions& options() const {
        return options_;
    }

private:
    ResolverOptions options_;
    graph::FragmentStore store_;
    cache::ResolutionCache cache_;

    cache::ResolveResult compute(const cache::ResolutionKey& key);
};

} // namespace smc

#endif // SMC_RESOLVER_RESOLVER_HPP
