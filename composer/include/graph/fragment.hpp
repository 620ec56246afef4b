//! # Fragments
//!
//! A fragment is one shader source unit of the import graph, identified by its
//! normalized path. Fragments are immutable once parsed and are shared between
//! module graphs and the fragment store.

#ifndef SMC_GRAPH_FRAGMENT_HPP
#define SMC_GRAPH_FRAGMENT_HPP

#include "cache/fingerprint.hpp"
#include "common.hpp"
#include "directive/directive.hpp"
#include "error/diagnostic.hpp"

#include <string>
#include <string_view>

namespace smc::graph {

/// Normalizes a fragment path: `/` separators, no `.` segments, `..`
/// collapsed where possible, no leading `/`.
[[nodiscard]] std::string normalize_path(std::string_view path);

/// Resolves an import target relative to the importing fragment's directory.
[[nodiscard]] std::string resolve_import_path(std::string_view importer, std::string_view target);

/// A parsed shader fragment.
struct Fragment {
    std::string path;                  ///< Normalized path (identity)
    std::string source;                ///< Raw text as loaded
    cache::Fingerprint fingerprint;    ///< Fingerprint of `source`
    directive::ParsedFragment parsed;  ///< Directives, declarations, residual

    /// Base name without extension, made identifier-safe.
    [[nodiscard]] std::string stem() const;
};

using FragmentPtr = Rc<const Fragment>;

/// Parses `source` into a shared fragment.
[[nodiscard]] Result<FragmentPtr, ResolutionError> make_fragment(std::string path,
                                                                 std::string source);

} // namespace smc::graph

#endif // SMC_GRAPH_FRAGMENT_HPP
