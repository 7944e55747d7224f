#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "dependant.hpp"
#include "graph.hpp"
#include "plan.hpp"

#include <source_location>
#include <string>
#include <vector>

namespace depsolve {

struct solve_options {
    /// Declared scope ordering, outermost (longest-lived) first.
    std::vector<std::string> scopes;

    /// Scope given to dependants with an empty scope tag.
    /// Empty = the innermost declared scope.
    std::string default_scope;
};

/// Turn a closed graph into an execution plan.
///
/// Checks, all before any stage is emitted:
///   - cycles (cyclic_dependency, with the key path in cycle order);
///   - scope legality: every scope must be declared and no dependant may
///     depend on one in a descendant scope (scope_mismatch).
///
/// A node's stage is one past the highest stage of its parameters; ties
/// keep first-discovery order, so identical graphs give identical plans.
DEPSOLVE_EXPORT execution_plan solve(
    const dependency_graph& graph, const solve_options& options,
    std::source_location loc = std::source_location::current());

/// build_graph + solve.
DEPSOLVE_EXPORT execution_plan solve(
    const dependant_ptr& root, const binding_table& bindings,
    const solve_options& options,
    std::source_location loc = std::source_location::current());

} // namespace depsolve
