//! # Macro Expander
//!
//! Evaluates the `#define` macros of a module graph against a caller-supplied
//! environment and substitutes every `#NAME` reference with its decimal value.
//!
//! ## Visibility
//!
//! A fragment sees the caller environment, its own definitions, and the
//! definitions of every fragment it transitively imports. A definition is
//! evaluated in the scope of the fragment that declares it.
//!
//! ## Single Definition
//!
//! A name may be bound once per composition. Redefining a caller value, a
//! definition of the same fragment or of an upstream fragment, or defining
//! the same name in two fragments that meet in a common importer, fails with
//! `MacroShadowing`.
//!
//! ## Attribute Positions
//!
//! Inside `@attr(...)` argument lists every argument containing a macro must
//! become a single integer literal. `@group` and `@binding` arguments must also
//! be non-negative and fit in 32 bits.

#ifndef SMC_MACRO_MACRO_EXPANDER_HPP
#define SMC_MACRO_MACRO_EXPANDER_HPP

#include "common.hpp"
#include "error/diagnostic.hpp"
#include "graph/module_graph.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace smc::macro {

/// Caller-supplied macro values, ordered by name.
using MacroEnvironment = std::map<std::string, int64_t>;

/// Renders an environment as `A=0,B=1`.
[[nodiscard]] std::string to_string(const MacroEnvironment& env);

/// Substituted text of one fragment.
struct ExpandedFragment {
    graph::FragmentPtr fragment;
    std::string text;
};

class MacroExpander {
public:
    /// Both arguments must outlive the expander.
    MacroExpander(const graph::ModuleGraph& graph, const MacroEnvironment& env);

    /// Checks every definition, evaluates it, and expands all fragments in
    /// graph order.
    [[nodiscard]] Result<std::vector<ExpandedFragment>, ResolutionError> expand_all();

    /// Value of `name` as visible from `fragment`; `line` names the
    /// reference site in errors. Requires `expand_all()` or
    /// `check_definitions()` to have run.
    [[nodiscard]] Result<int64_t, ResolutionError> value_of(const std::string& fragment,
                                                            const std::string& name, size_t line);

    /// Validates single definition and computes visibility.
    [[nodiscard]] std::optional<ResolutionError> check_definitions();

private:
    struct Definition {
        const directive::DefineDirective* directive;
        const graph::Fragment* owner;
    };

    const graph::ModuleGraph& graph_;
    const MacroEnvironment& env_;
    std::unordered_map<std::string, Definition> definitions_;
    std::unordered_map<std::string, std::unordered_set<std::string>> visible_;
    std::unordered_map<std::string, int64_t> values_;
    std::unordered_set<std::string> evaluating_;

    Result<int64_t, ResolutionError> evaluate_definition(const std::string& name);
    Result<std::string, ResolutionError> expand(const graph::Fragment& fragment);
};

/// Runs a `MacroExpander` over the whole graph.
[[nodiscard]] Result<std::vector<ExpandedFragment>, ResolutionError>
expand_macros(const graph::ModuleGraph& graph, const MacroEnvironment& env);

} // namespace smc::macro

#endif // SMC_MACRO_MACRO_EXPANDER_HPP
