#include "depsolve/graph.hpp"
#include "depsolve/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace depsolve {

dependency_graph::dependency_graph(std::vector<graph_node> nodes)
    : nodes_(std::move(nodes))
{
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        index_.emplace(nodes_[i].source->id, i);
    }
}

std::optional<std::size_t> dependency_graph::find(const key& k) const {
    auto it = index_.find(k);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

namespace {

// ------------------------------------------------------------------
// Two dependants reached under one key must agree on how the value
// is shared; otherwise collapsing them into one node changes meaning.
// ------------------------------------------------------------------
void check_equivalent(const dependant& seen, const dependant& other,
                      std::source_location loc) {
    std::string detail;
    if (seen.scope != other.scope) {
        detail = "scopes \"" + seen.scope + "\" and \"" + other.scope + "\" differ";
    } else if (seen.shared != other.shared) {
        detail = "one is shared and the other is not";
    } else {
        return;
    }
    auto ex = conflicting_dependant(seen.id, detail, loc);
    std::vector<const dependant*> both{&seen, &other};
    ex.set_diagnostic_detail(internal::format_definition_traces(both));
    throw ex;
}

std::string required_by(const dependant& consumer) {
    std::string hint = "required by " + consumer.id.to_string();
    if (consumer.location.file_name()[0]) {
        hint += " defined at " + std::string(consumer.location.file_name())
                + ":" + std::to_string(consumer.location.line());
    }
    return hint;
}

} // namespace

dependency_graph build_graph(const dependant_ptr& root, const binding_map& bindings,
                             std::source_location loc) {
    if (!root) {
        throw di_error("Cannot build a graph from a null root dependant", loc);
    }

    auto lookup = [&](const key& k) -> dependant_ptr {
        auto it = bindings.find(k);
        return it == bindings.end() ? nullptr : it->second;
    };

    std::vector<graph_node> nodes;
    std::unordered_map<key, std::size_t, key_hash> index;
    std::deque<std::size_t> queue;

    auto add_node = [&](dependant_ptr d) -> std::size_t {
        auto it = index.find(d->id);
        if (it != index.end()) {
            const auto& seen = nodes[it->second].source;
            if (seen != d) check_equivalent(*seen, *d, loc);
            return it->second;
        }
        std::size_t idx = nodes.size();
        index.emplace(d->id, idx);
        nodes.push_back(graph_node{std::move(d), {}});
        queue.push_back(idx);
        return idx;
    };

    // The root itself may be overridden.
    auto bound_root = lookup(root->id);
    add_node(bound_root ? bound_root : root);

    // Breadth-first so handles follow first-discovery order from the root.
    while (!queue.empty()) {
        std::size_t idx = queue.front();
        queue.pop_front();
        dependant_ptr current = nodes[idx].source;

        std::vector<std::optional<std::size_t>> edges;
        edges.reserve(current->parameters.size());
        for (const auto& param : current->parameters) {
            dependant_ptr provider = lookup(param.target);
            if (!provider) provider = param.fallback;

            if (!provider) {
                if (!param.required) {
                    edges.emplace_back(std::nullopt);
                    continue;
                }
                auto ex = missing_binding(param.target, required_by(*current), loc);
                ex.set_diagnostic_detail(internal::format_definition_trace(*current));
                throw ex;
            }
            edges.emplace_back(add_node(std::move(provider)));
        }
        nodes[idx].edges = std::move(edges);
    }

    return dependency_graph(std::move(nodes));
}

dependency_graph build_graph(const dependant_ptr& root, const binding_table& bindings,
                             std::source_location loc) {
    return build_graph(root, bindings.snapshot(), loc);
}

} // namespace depsolve
