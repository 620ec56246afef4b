//! # Module Graph
//!
//! Resolves the `#import` closure of a root fragment into a DAG. Each
//! fragment appears once no matter how many importers reach it; import
//! aliases stay local to the importing fragment.
//!
//! ## Ordering
//!
//! `order()` lists fragments dependencies-first (post-order of a depth-first
//! walk that follows imports in source order). Among siblings, the
//! first-discovered fragment comes first. The root is always last.

#pragma once

#include "error/diagnostic.hpp"
#include "graph/fragment.hpp"
#include "graph/fragment_store.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace smc::graph {

/// One `#import` of a fragment, with the target resolved.
struct ImportEdge {
    std::string from;  ///< Importing fragment
    std::string to;    ///< Normalized target path
    std::string alias; ///< Alias local to `from`
    size_t line = 0;
};

class ModuleGraph {
public:
    ModuleGraph() = default;

    /// Builds the graph rooted at `root`, pulling fragments through `store`.
    ///
    /// Fails with `UnresolvedImport` for missing fragments (naming the
    /// importer, or no importer for the root), `CyclicImport` when an import
    /// revisits a fragment on the active path, and propagates directive
    /// syntax errors.
    [[nodiscard]] static Result<ModuleGraph, ResolutionError> build(const std::string& root,
                                                                    FragmentStore& store);

    [[nodiscard]] const std::string& root() const {
        return root_;
    }

    /// Fragments, dependencies first.
    [[nodiscard]] const std::vector<FragmentPtr>& order() const {
        return order_;
    }

    [[nodiscard]] size_t size() const {
        return order_.size();
    }

    [[nodiscard]] bool contains(std::string_view path) const;

    /// Returns the fragment at `path`, or nullptr.
    [[nodiscard]] FragmentPtr find(std::string_view path) const;

    /// Imports of one fragment in source order.
    [[nodiscard]] const std::vector<ImportEdge>& imports_of(std::string_view path) const;

    /// Finds the import of `from` that uses `alias`.
    [[nodiscard]] const ImportEdge* find_import(std::string_view from,
                                                std::string_view alias) const;

    /// Fragments `path` transitively imports (excluding itself), in `order()`.
    [[nodiscard]] std::vector<FragmentPtr> upstream(std::string_view path) const;

    /// Paths of all fragments in `order()`.
    [[nodiscard]] std::vector<std::string> paths() const;

private:
    std::string root_;
    std::vector<FragmentPtr> order_;
    std::unordered_map<std::string, FragmentPtr> by_path_;
    std::unordered_map<std::string, std::vector<ImportEdge>> edges_;

    friend class GraphBuilder;
};

} // namespace smc::graph
