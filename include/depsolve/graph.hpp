#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "dependant.hpp"
#include "key.hpp"

#include <cstddef>
#include <optional>
#include <source_location>
#include <unordered_map>
#include <vector>

namespace depsolve {

/// One node of a closed graph.  `edges[i]` is the node index providing the
/// i-th parameter, or nullopt for an optional parameter nobody provides.
struct graph_node {
    dependant_ptr source;
    std::vector<std::optional<std::size_t>> edges;
};

// ---------------------------------------------------------------
// dependency_graph — closed, binding-free resolution request
// ---------------------------------------------------------------

/// Nodes are numbered in breadth-first discovery order from the root, so
/// the root is always node 0.  Node numbers double as plan handles.
class DEPSOLVE_EXPORT dependency_graph {
public:
    dependency_graph() = default;

    /// Adopt already-closed nodes; node 0 is the root.
    explicit dependency_graph(std::vector<graph_node> nodes);

    const std::vector<graph_node>& nodes() const noexcept { return nodes_; }
    std::size_t size() const noexcept { return nodes_.size(); }

    const graph_node& root() const { return nodes_.at(0); }
    const dependant& at(std::size_t idx) const { return *nodes_.at(idx).source; }

    std::optional<std::size_t> find(const key& k) const;

private:
    std::vector<graph_node> nodes_;
    std::unordered_map<key, std::size_t, key_hash> index_;
};

/// Close `root` under `bindings`: resolve every parameter to a concrete
/// dependant (binding first, then the parameter's fallback), collapsing
/// references to the same key into one node.
///
/// Throws missing_binding for an unprovided required parameter and
/// conflicting_dependant when one key is reached with different scope or
/// sharing settings.  Cycles are left in place for the solver to report.
DEPSOLVE_EXPORT dependency_graph build_graph(
    const dependant_ptr& root, const binding_map& bindings,
    std::source_location loc = std::source_location::current());

DEPSOLVE_EXPORT dependency_graph build_graph(
    const dependant_ptr& root, const binding_table& bindings,
    std::source_location loc = std::source_location::current());

} // namespace depsolve
