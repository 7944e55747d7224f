#pragma once

#include "export.hpp"
#include "dependant.hpp"
#include "key.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace depsolve {

/// One dependant scheduled for construction.
struct plan_node {
    key           id;
    dependant_ptr source;
    std::string   scope;               // resolved scope name
    std::size_t   scope_depth = 0;     // 0 = outermost declared scope
    std::size_t   stage = 0;

    /// Node handle providing each parameter; nullopt = absent optional.
    std::vector<std::optional<std::size_t>> arguments;
};

/// Nodes whose parameters are all produced by earlier stages, in
/// first-discovery order, and the distinct scopes they execute in.
struct plan_stage {
    std::vector<std::size_t> nodes;
    std::vector<std::string> scopes;
};

// ---------------------------------------------------------------
// execution_plan — solver output, executor input
// ---------------------------------------------------------------

struct DEPSOLVE_EXPORT execution_plan {
    std::vector<plan_node>   nodes;    // indexed by handle
    std::vector<plan_stage>  stages;
    std::vector<std::string> scopes;   // every scope used, outermost first
    std::size_t              root = 0;

    const plan_node& node(std::size_t handle) const { return nodes.at(handle); }
    const plan_node& root_node() const { return nodes.at(root); }

    std::optional<std::size_t> find(const key& k) const;

    /// Keys of every stage, in execution order.
    std::vector<std::vector<key>> stage_keys() const;

    /// One line per stage, e.g. "0: {Config} [app]".
    std::string describe() const;
};

} // namespace depsolve
