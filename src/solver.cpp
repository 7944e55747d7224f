#include "depsolve/solver.hpp"
#include "depsolve/exceptions.hpp"
#include "log.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <vector>

namespace depsolve {

namespace {

// ------------------------------------------------------------------
// Cycle detection (DFS on the closed graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

struct dfs_context {
    const dependency_graph& graph;
    std::vector<visit_state> states;
    std::vector<std::size_t> path;
    std::vector<std::size_t> finish_order;   // parameters before consumers
    std::source_location loc;
};

[[noreturn]] void throw_cycle(std::size_t node, const dfs_context& ctx) {
    // Build cycle path from where the node first appears
    auto it = std::find(ctx.path.begin(), ctx.path.end(), node);
    std::vector<key> cycle;
    std::vector<const dependant*> members;
    for (; it != ctx.path.end(); ++it) {
        cycle.push_back(ctx.graph.at(*it).id);
        members.push_back(&ctx.graph.at(*it));
    }
    cycle.push_back(ctx.graph.at(node).id);
    auto ex = cyclic_dependency(cycle, ctx.loc);
    std::string detail = internal::format_definition_traces(members);
    if (!detail.empty()) ex.set_diagnostic_detail(detail);
    throw ex;
}

/// Iterative so chain length is bounded by memory, not the call stack.
/// `ctx.path` holds the nodes in progress; `next_edge` parallels it.
void dfs(std::size_t start, dfs_context& ctx) {
    if (ctx.states[start] == visit_state::done) return;

    std::vector<std::size_t> next_edge;
    ctx.states[start] = visit_state::in_progress;
    ctx.path.push_back(start);
    next_edge.push_back(0);

    while (!ctx.path.empty()) {
        const std::size_t node = ctx.path.back();
        const auto& edges = ctx.graph.nodes()[node].edges;
        std::size_t& cursor = next_edge.back();

        if (cursor == edges.size()) {
            ctx.path.pop_back();
            next_edge.pop_back();
            ctx.states[node] = visit_state::done;
            ctx.finish_order.push_back(node);
            continue;
        }

        const auto& edge = edges[cursor++];
        if (!edge) continue;
        switch (ctx.states[*edge]) {
        case visit_state::done:
            break;
        case visit_state::in_progress:
            throw_cycle(*edge, ctx);
        case visit_state::unvisited:
            ctx.states[*edge] = visit_state::in_progress;
            ctx.path.push_back(*edge);
            next_edge.push_back(0);
            break;
        }
    }
}

// ------------------------------------------------------------------
// Scope resolution and legality
// ------------------------------------------------------------------
struct scope_slot {
    std::string name;
    std::size_t depth = 0;
};

std::vector<scope_slot> resolve_scopes(const dependency_graph& graph,
                                       const solve_options& options,
                                       std::source_location loc) {
    std::map<std::string, std::size_t, std::less<>> depth_of;
    for (std::size_t i = 0; i < options.scopes.size(); ++i) {
        if (!depth_of.emplace(options.scopes[i], i).second) {
            throw di_error("Scope \"" + options.scopes[i] + "\" declared twice", loc);
        }
    }

    const std::string& fallback = options.default_scope.empty()
        ? options.scopes.back()
        : options.default_scope;

    std::vector<scope_slot> slots(graph.size());
    for (std::size_t i = 0; i < graph.size(); ++i) {
        const auto& d = graph.at(i);
        const std::string& name = d.scope.empty() ? fallback : d.scope;
        auto it = depth_of.find(name);
        if (it == depth_of.end()) {
            auto ex = scope_mismatch(d.id, name, loc);
            ex.set_diagnostic_detail(internal::format_definition_trace(d));
            throw ex;
        }
        slots[i] = scope_slot{name, it->second};
    }
    return slots;
}

void check_scope_rules(const dependency_graph& graph,
                       const std::vector<scope_slot>& slots,
                       std::source_location loc) {
    for (std::size_t i = 0; i < graph.size(); ++i) {
        for (const auto& edge : graph.nodes()[i].edges) {
            if (!edge) continue;
            // A deeper scope is shorter-lived; the consumer would outlive
            // the value it captured.
            if (slots[*edge].depth > slots[i].depth) {
                const auto& consumer = graph.at(i);
                const auto& dependency = graph.at(*edge);
                auto ex = scope_mismatch(consumer.id, slots[i].name,
                                         dependency.id, slots[*edge].name, loc);
                std::vector<const dependant*> both{&consumer, &dependency};
                ex.set_diagnostic_detail(internal::format_definition_traces(both));
                throw ex;
            }
        }
    }
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry points
// ------------------------------------------------------------------
execution_plan solve(const dependency_graph& graph, const solve_options& options,
                     std::source_location loc) {
    if (graph.size() == 0) {
        throw di_error("Cannot solve an empty graph", loc);
    }
    if (options.scopes.empty()) {
        throw di_error("solve_options::scopes must declare at least one scope", loc);
    }

    dfs_context ctx{graph, std::vector<visit_state>(graph.size(), visit_state::unvisited),
                    {}, {}, loc};
    dfs(0, ctx);

    auto slots = resolve_scopes(graph, options, loc);
    check_scope_rules(graph, slots, loc);

    execution_plan plan;
    plan.root = 0;
    plan.nodes.resize(graph.size());

    // Finish order lists every parameter before its consumers.
    std::size_t last_stage = 0;
    for (std::size_t idx : ctx.finish_order) {
        const auto& gnode = graph.nodes()[idx];
        std::size_t stage = 0;
        for (const auto& edge : gnode.edges) {
            if (edge) stage = std::max(stage, plan.nodes[*edge].stage + 1);
        }
        auto& pnode = plan.nodes[idx];
        pnode.id = gnode.source->id;
        pnode.source = gnode.source;
        pnode.scope = slots[idx].name;
        pnode.scope_depth = slots[idx].depth;
        pnode.stage = stage;
        pnode.arguments = gnode.edges;
        last_stage = std::max(last_stage, stage);
    }

    // Handles ascend in discovery order, which fixes the tie-break.
    plan.stages.resize(last_stage + 1);
    for (std::size_t idx = 0; idx < plan.nodes.size(); ++idx) {
        auto& stage = plan.stages[plan.nodes[idx].stage];
        stage.nodes.push_back(idx);
        const auto& scope = plan.nodes[idx].scope;
        if (std::find(stage.scopes.begin(), stage.scopes.end(), scope) == stage.scopes.end()) {
            stage.scopes.push_back(scope);
        }
    }

    for (const auto& declared : options.scopes) {
        bool used = std::any_of(plan.nodes.begin(), plan.nodes.end(),
            [&](const plan_node& n) { return n.scope == declared; });
        if (used) plan.scopes.push_back(declared);
    }

    DEPSOLVE_LOG_DEBUG << "solved " << plan.root_node().id.to_string() << ": "
                       << plan.nodes.size() << " node(s) in "
                       << plan.stages.size() << " stage(s)";
    return plan;
}

execution_plan solve(const dependant_ptr& root, const binding_table& bindings,
                     const solve_options& options, std::source_location loc) {
    return solve(build_graph(root, bindings, loc), options, loc);
}

} // namespace depsolve
