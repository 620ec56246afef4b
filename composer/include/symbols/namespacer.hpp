//! # Namespacer
//!
//! Gives every top-level declaration of an imported fragment a
//! collision-free name and rewrites references to it.
//!
//! ## Naming
//!
//! A declaration `name` of a non-root fragment becomes
//! `<stem>_<8 hex digits of CRC32C(path)>_<name>`. For example `Camera` in
//! `include/camera.wgsl` becomes `camera_1a2b3c4d_Camera`. The root fragment
//! keeps its names; entry points keep theirs everywhere.
//!
//! ## References
//!
//! | Written as       | Rewritten to                                 |
//! |------------------|----------------------------------------------|
//! | `alias::symbol`  | final name of `symbol` in the aliased import |
//! | bare `name`      | final name of the fragment's own `name`      |
//!
//! Member accesses (`x.name`), struct member names, attribute names and the
//! enumerant arguments of `@builtin`, `@interpolate` and `@diagnostic` are
//! left alone. A qualified reference with an unknown alias, or to a symbol
//! the target does not `@export`, fails with `UnresolvedReference`.

#pragma once

#include "common.hpp"
#include "directive/scanner.hpp"
#include "error/diagnostic.hpp"
#include "graph/module_graph.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace smc::symbols {

/// Collision-free name of `name` declared in `fragment`.
[[nodiscard]] std::string mangle(const graph::Fragment& fragment, std::string_view name);

/// Marks the identifier tokens that can refer to a top-level declaration.
[[nodiscard]] std::vector<bool> reference_mask(const std::vector<directive::Token>& tokens);

class Namespacer {
public:
    /// The graph must outlive the namespacer.
    explicit Namespacer(const graph::ModuleGraph& graph) : graph_(graph) {}

    /// Final identifier of `name` as declared in `fragment`. Names that
    /// `fragment` does not declare are returned unchanged.
    [[nodiscard]] std::string final_name(const graph::Fragment& fragment,
                                         std::string_view name) const;

    /// Rewrites `text` (the macro-expanded text of `fragment`).
    [[nodiscard]] Result<std::string, ResolutionError> rewrite(const graph::Fragment& fragment,
                                                               std::string_view text) const;

private:
    const graph::ModuleGraph& graph_;

    [[nodiscard]] bool is_root(const graph::Fragment& fragment) const {
        return fragment.path == graph_.root();
    }
};

} // namespace smc::symbols
