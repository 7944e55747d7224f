#pragma once

#include "export.hpp"
#include "dependant.hpp"
#include "key.hpp"
#include "plan.hpp"

#include <memory>
#include <string_view>
#include <unordered_map>

namespace depsolve {

class scope_stack;

enum class execution_policy {
    sequential,     // stage nodes run one after another on the caller's thread
    parallel        // stage nodes run as concurrent tasks
};

constexpr std::string_view to_string(execution_policy p) noexcept {
    constexpr std::string_view names[] = {"sequential", "parallel"};
    return names[static_cast<int>(p)];
}

struct execute_options {
    execution_policy policy = execution_policy::sequential;

    /// Values supplied for this execution only.  A node whose key appears
    /// here is not constructed and nothing it needs is executed.
    std::unordered_map<key, instance, key_hash> values;
};

/// Run `plan` against the active scopes of `scopes` and return the root's
/// value.
///
/// Every scope the plan names must be active, else scope_not_entered is
/// thrown before anything is constructed.  Shared nodes already cached in
/// their scope are taken from the cache and their own parameters are not
/// executed.  A failing factory surfaces as construction_error; siblings in
/// the same stage are drained first and values they completed stay cached.
DEPSOLVE_EXPORT instance execute(const execution_plan& plan, const scope_stack& scopes,
                                 const execute_options& options = {});

template <typename T>
std::shared_ptr<T> execute_as(const execution_plan& plan, const scope_stack& scopes,
                              const execute_options& options = {}) {
    return std::static_pointer_cast<T>(execute(plan, scopes, options));
}

} // namespace depsolve
