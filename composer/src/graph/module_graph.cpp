//! # Module Graph Builder
//!
//! Depth-first walk over `#import` edges with an active stack for cycle
//! detection.

#include "graph/module_graph.hpp"

#include "log/log.hpp"

#include <cstddef>
#include <optional>
#include <unordered_set>

namespace smc::graph {

class GraphBuilder {
public:
    GraphBuilder(ModuleGraph& graph, FragmentStore& store) : graph_(graph), store_(store) {}

    /// Visits `path`; `importer` is empty for the root.
    std::optional<ResolutionError> visit(const std::string& path, const std::string& importer,
                                         size_t line) {
        if (auto cycle = detect_cycle(path)) {
            std::string chain;
            for (const auto& member : *cycle) {
                if (!chain.empty())
                    chain += " -> ";
                chain += member;
            }
            auto error = make_error(ErrorKind::CyclicImport, "import cycle: " + chain, importer,
                                    line);
            error.symbol = path;
            error.related = std::move(*cycle);
            return error;
        }

        if (graph_.by_path_.count(path) > 0) {
            return std::nullopt;
        }

        auto loaded = store_.get(path);
        if (is_err(loaded)) {
            auto& error = unwrap_err(loaded);
            if (error.kind == ErrorKind::UnresolvedImport) {
                std::string message = importer.empty()
                                          ? "cannot load root fragment '" + path + "'"
                                          : "cannot resolve import '" + path + "'";
                auto unresolved = make_error(ErrorKind::UnresolvedImport,
                                             message + ": " + error.message, importer, line);
                unresolved.symbol = path;
                return unresolved;
            }
            return error;
        }
        const FragmentPtr& fragment = unwrap(loaded);

        active_.push_back(path);
        auto& edges = graph_.edges_[path];
        for (const auto& imp : fragment->parsed.imports) {
            ImportEdge edge;
            edge.from = path;
            edge.to = resolve_import_path(path, imp.path);
            edge.alias = imp.alias;
            edge.line = imp.line;
            edges.push_back(edge);

            if (auto error = visit(edge.to, path, imp.line)) {
                return error;
            }
        }
        active_.pop_back();

        graph_.by_path_.emplace(path, fragment);
        graph_.order_.push_back(fragment);
        return std::nullopt;
    }

private:
    ModuleGraph& graph_;
    FragmentStore& store_;
    std::vector<std::string> active_;

    /// Path from the first occurrence of `path` on the active stack, closed
    /// by `path` itself.
    std::optional<std::vector<std::string>> detect_cycle(const std::string& path) const {
        for (size_t i = 0; i < active_.size(); ++i) {
            if (active_[i] == path) {
                std::vector<std::string> cycle(active_.begin() + static_cast<std::ptrdiff_t>(i),
                                               active_.end());
                cycle.push_back(path);
                return cycle;
            }
        }
        return std::nullopt;
    }
};

Result<ModuleGraph, ResolutionError> ModuleGraph::build(const std::string& root,
                                                        FragmentStore& store) {
    ModuleGraph graph;
    graph.root_ = normalize_path(root);

    GraphBuilder builder(graph, store);
    if (auto error = builder.visit(graph.root_, "", 0)) {
        SMC_LOG_DEBUG("graph", "Graph for " << graph.root_ << " failed: " << error->to_string());
        return *error;
    }

    SMC_LOG_DEBUG("graph", "Graph for " << graph.root_ << ": " << graph.order_.size()
                                        << " fragments");
    return graph;
}

bool ModuleGraph::contains(std::string_view path) const {
    return by_path_.count(std::string(path)) > 0;
}

FragmentPtr ModuleGraph::find(std::string_view path) const {
    auto it = by_path_.find(std::string(path));
    return it == by_path_.end() ? nullptr : it->second;
}

const std::vector<ImportEdge>& ModuleGraph::imports_of(std::string_view path) const {
    static const std::vector<ImportEdge> empty;
    auto it = edges_.find(std::string(path));
    return it == edges_.end() ? empty : it->second;
}

const ImportEdge* ModuleGraph::find_import(std::string_view from, std::string_view alias) const {
    for (const auto& edge : imports_of(from)) {
        if (edge.alias == alias) {
            return &edge;
        }
    }
    return nullptr;
}

std::vector<FragmentPtr> ModuleGraph::upstream(std::string_view path) const {
    std::unordered_set<std::string> reachable;
    std::vector<std::string> worklist{std::string(path)};
    while (!worklist.empty()) {
        auto current = std::move(worklist.back());
        worklist.pop_back();
        for (const auto& edge : imports_of(current)) {
            if (reachable.insert(edge.to).second) {
                worklist.push_back(edge.to);
            }
        }
    }

    std::vector<FragmentPtr> result;
    for (const auto& fragment : order_) {
        if (fragment->path != path && reachable.count(fragment->path) > 0) {
            result.push_back(fragment);
        }
    }
    return result;
}

std::vector<std::string> ModuleGraph::paths() const {
    std::vector<std::string> result;
    result.reserve(order_.size());
    for (const auto& fragment : order_) {
        result.push_back(fragment->path);
    }
    return result;
}

} // namespace smc::graph
