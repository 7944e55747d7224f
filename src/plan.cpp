#include "depsolve/plan.hpp"

#include <string>
#include <vector>

namespace depsolve {

std::optional<std::size_t> execution_plan::find(const key& k) const {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id == k) return i;
    }
    return std::nullopt;
}

std::vector<std::vector<key>> execution_plan::stage_keys() const {
    std::vector<std::vector<key>> out;
    out.reserve(stages.size());
    for (const auto& stage : stages) {
        std::vector<key> keys;
        keys.reserve(stage.nodes.size());
        for (auto idx : stage.nodes) keys.push_back(nodes[idx].id);
        out.push_back(std::move(keys));
    }
    return out;
}

std::string execution_plan::describe() const {
    std::string out;
    for (std::size_t s = 0; s < stages.size(); ++s) {
        out += std::to_string(s) + ": {";
        for (std::size_t i = 0; i < stages[s].nodes.size(); ++i) {
            if (i > 0) out += ", ";
            out += nodes[stages[s].nodes[i]].id.to_string();
        }
        out += "} [";
        for (std::size_t i = 0; i < stages[s].scopes.size(); ++i) {
            if (i > 0) out += ", ";
            out += stages[s].scopes[i];
        }
        out += "]\n";
    }
    return out;
}

} // namespace depsolve
