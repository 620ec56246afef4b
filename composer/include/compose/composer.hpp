//! # Composer
//!
//! Turns a module graph into one WGSL text: macro expansion, namespacing,
//! ordered concatenation, binding-slot validation and reflection.
//!
//! ## Output Layout
//!
//! ```text
//! // fragment: include/camera.wgsl
//! ...camera text...
//! // fragment: unlit_diffuse.wgsl
//! ...root text...
//! ```
//!
//! Fragments are emitted dependencies-first, each exactly once. Marker lines
//! can be disabled with `ComposeOptions::markers`.
//!
//! ## Binding Validation
//!
//! A binding variable is live when its final name occurs in the output
//! outside its own declaration. No two live bindings may share a
//! `(group, binding)` slot. Optional limits bound the group and binding
//! indices of live bindings.

#ifndef SMC_COMPOSE_COMPOSER_HPP
#define SMC_COMPOSE_COMPOSER_HPP

#include "cache/fingerprint.hpp"
#include "common.hpp"
#include "directive/directive.hpp"
#include "error/diagnostic.hpp"
#include "graph/module_graph.hpp"
#include "macro/macro_expander.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace smc::compose {

/// A `(group, binding)` pair.
struct BindingSlot {
    uint32_t group = 0;
    uint32_t binding = 0;

    auto operator<=>(const BindingSlot&) const = default;

    [[nodiscard]] std::string to_string() const;
};

/// A live binding variable of a composed shader.
struct BindingInfo {
    std::string name;     ///< Final identifier in the output
    std::string declared; ///< Name as written in the fragment
    std::string fragment; ///< Declaring fragment
    size_t line = 0;
    BindingSlot slot;
};

/// An entry-point function of a composed shader.
struct EntryPoint {
    std::string name;
    directive::ShaderStage stage = directive::ShaderStage::None;
    std::string fragment;
};

/// Data the pipeline builder needs besides the text.
struct Reflection {
    std::vector<EntryPoint> entry_points; ///< In emission order
    std::vector<BindingInfo> bindings;    ///< Live bindings sorted by slot
};

/// Limits checked against live bindings; unset means unlimited.
struct BindingLimits {
    std::optional<uint32_t> max_bind_groups;
    std::optional<uint32_t> max_bindings_per_group;
};

struct ComposeOptions {
    BindingLimits limits;
    bool markers = true; ///< Emit `// fragment: <path>` lines
};

/// Final output of one composition.
struct ComposedShader {
    std::string text;
    macro::MacroEnvironment env; ///< Caller environment that produced it
    std::string root;            ///< Normalized root path
    std::vector<std::string> fragments; ///< Included paths, emission order
    Reflection reflection;
    cache::Fingerprint fingerprint; ///< Fingerprint of `text`

    /// True if `path` took part in this composition.
    [[nodiscard]] bool includes(std::string_view path) const;
};

using ComposedShaderPtr = Rc<const ComposedShader>;

/// Composes the graph under a macro environment.
[[nodiscard]] Result<ComposedShader, ResolutionError> compose(const graph::ModuleGraph& graph,
                                                              const macro::MacroEnvironment& env,
                                                              const ComposeOptions& options = {});

} // namespace smc::compose

#endif // SMC_COMPOSE_COMPOSER_HPP
