#include "depsolve/executor.hpp"
#include "depsolve/exceptions.hpp"
#include "depsolve/scope.hpp"
#include "log.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace depsolve {

namespace {

using cache_map = std::map<std::string, std::shared_ptr<scope_cache>, std::less<>>;

// ------------------------------------------------------------------
// Scope lookup: all or nothing, before anything is built
// ------------------------------------------------------------------
cache_map bind_scopes(const execution_plan& plan, const scope_stack& scopes) {
    cache_map caches;
    for (const auto& node : plan.nodes) {
        if (caches.contains(node.scope)) continue;
        auto cache = scopes.find(node.scope);
        if (!cache) {
            auto ex = scope_not_entered(node.id, node.scope);
            ex.set_diagnostic_detail(internal::format_definition_trace(*node.source));
            throw ex;
        }
        caches.emplace(node.scope, std::move(cache));
    }
    return caches;
}

// ------------------------------------------------------------------
// Per-request state
// ------------------------------------------------------------------
struct run_state {
    const execution_plan& plan;
    const cache_map& caches;
    std::vector<instance> results;     // by handle
    std::vector<bool> pending;         // true = must be constructed this run
};

/// Mark what this run has to construct.  Supplied values and shared values
/// already cached satisfy a node together with everything below it.
void mark_pending(run_state& st, const execute_options& options) {
    const auto& plan = st.plan;
    std::vector<bool> seen(plan.nodes.size(), false);
    std::vector<std::size_t> work{plan.root};
    seen[plan.root] = true;

    while (!work.empty()) {
        std::size_t idx = work.back();
        work.pop_back();
        const auto& node = plan.nodes[idx];

        if (auto it = options.values.find(node.id); it != options.values.end()) {
            st.results[idx] = it->second;
            continue;
        }
        if (node.source->shared) {
            if (auto cached = st.caches.find(node.scope)->second->find(node.id)) {
                st.results[idx] = std::move(cached);
                continue;
            }
        }

        st.pending[idx] = true;
        for (const auto& arg : node.arguments) {
            if (arg && !seen[*arg]) {
                seen[*arg] = true;
                work.push_back(*arg);
            }
        }
    }
}

/// Node handles from the root down to `target`, along the first path found.
std::vector<std::size_t> consumer_chain(const execution_plan& plan, std::size_t target) {
    constexpr std::size_t none = static_cast<std::size_t>(-1);
    std::vector<std::size_t> parent(plan.nodes.size(), none);
    std::vector<bool> seen(plan.nodes.size(), false);
    std::vector<std::size_t> queue{plan.root};
    seen[plan.root] = true;
    for (std::size_t i = 0; i < queue.size() && !seen[target]; ++i) {
        for (const auto& arg : plan.nodes[queue[i]].arguments) {
            if (arg && !seen[*arg]) {
                seen[*arg] = true;
                parent[*arg] = queue[i];
                queue.push_back(*arg);
            }
        }
    }

    std::vector<std::size_t> chain;
    for (std::size_t at = target; at != none; at = parent[at]) {
        chain.push_back(at);
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

instance construct(const run_state& st, std::size_t idx) {
    const auto& node = st.plan.nodes[idx];

    std::vector<instance> values;
    values.reserve(node.arguments.size());
    for (const auto& arg : node.arguments) {
        values.push_back(arg ? st.results[*arg] : nullptr);
    }
    argument_list args(std::move(values));

    auto& cache = *st.caches.find(node.scope)->second;
    return cache.get_or_create(node.id, node.source->shared, [&]() -> product {
        std::exception_ptr cause;
        if (!node.source->factory) {
            cause = std::make_exception_ptr(di_error(
                "No factory and no supplied value for " + node.id.to_string()));
        } else {
            try {
                DEPSOLVE_LOG_TRACE << "constructing " << node.id.to_string()
                                   << " in scope \"" << node.scope << "\"";
                return node.source->factory(args);
            } catch (...) {
                cause = std::current_exception();
            }
        }
        DEPSOLVE_LOG_ERROR << "construction of " << node.id.to_string() << " failed: "
                           << internal::describe(cause);
        auto ex = construction_error(node.id, cause);
        ex.set_diagnostic_detail(internal::format_definition_trace(*node.source));
        for (std::size_t link : consumer_chain(st.plan, idx)) {
            ex.append_resolution_context(st.plan.nodes[link].id.to_string());
        }
        throw ex;
    });
}

// ------------------------------------------------------------------
// Stage runners
// ------------------------------------------------------------------
void run_sequential(run_state& st, const std::vector<std::size_t>& nodes) {
    for (std::size_t idx : nodes) {
        st.results[idx] = construct(st, idx);
    }
}

/// Every task of the stage is waited for even after one fails, so no
/// construction is still running when the error reaches the caller.
void run_parallel(run_state& st, const std::vector<std::size_t>& nodes) {
    if (nodes.size() == 1) {
        run_sequential(st, nodes);
        return;
    }

    std::vector<std::future<instance>> tasks;
    tasks.reserve(nodes.size());
    for (std::size_t idx : nodes) {
        tasks.push_back(std::async(std::launch::async,
            [&st, idx] { return construct(st, idx); }));
    }

    std::exception_ptr first_failure;
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        try {
            st.results[nodes[i]] = tasks[i].get();
        } catch (...) {
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) std::rethrow_exception(first_failure);
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry point
// ------------------------------------------------------------------
instance execute(const execution_plan& plan, const scope_stack& scopes,
                 const execute_options& options) {
    if (plan.nodes.empty()) {
        throw di_error("Cannot execute an empty plan");
    }

    auto caches = bind_scopes(plan, scopes);

    run_state st{plan, caches,
                 std::vector<instance>(plan.nodes.size()),
                 std::vector<bool>(plan.nodes.size(), false)};
    mark_pending(st, options);

    std::size_t constructed = 0;
    std::vector<std::size_t> batch;
    for (const auto& stage : plan.stages) {
        batch.clear();
        for (std::size_t idx : stage.nodes) {
            if (st.pending[idx]) batch.push_back(idx);
        }
        if (batch.empty()) continue;

        if (options.policy == execution_policy::parallel) {
            run_parallel(st, batch);
        } else {
            run_sequential(st, batch);
        }
        constructed += batch.size();
    }

    DEPSOLVE_LOG_DEBUG << "executed " << plan.root_node().id.to_string() << " ("
                       << to_string(options.policy) << "): " << constructed
                       << " of " << plan.nodes.size() << " node(s) run";
    return st.results[plan.root];
}

} // namespace depsolve
