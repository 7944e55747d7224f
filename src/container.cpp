#include "depsolve/container.hpp"
#include "depsolve/exceptions.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace depsolve {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct container::impl {
    struct cached_plan {
        std::uint64_t generation = 0;
        dependant_ptr root;
        std::shared_ptr<const execution_plan> plan;
    };

    solve_options settings;
    std::string execution_scope;
    binding_table bindings;
    scope_stack stack;
    std::optional<scope_handle> self;   // declared after stack: exits first

    mutable std::mutex plan_mutex;
    std::unordered_map<key, cached_plan, key_hash> plans;
};

container::container(container_options options)
    : impl_(std::make_unique<impl>())
{
    impl_->settings.scopes = std::move(options.scopes);
    impl_->settings.default_scope = std::move(options.default_scope);

    const auto& declared = impl_->settings.scopes;
    auto is_declared = [&](const std::string& name) {
        return std::find(declared.begin(), declared.end(), name) != declared.end();
    };
    if (!impl_->settings.default_scope.empty() && !is_declared(impl_->settings.default_scope)) {
        throw di_error("Default scope \"" + impl_->settings.default_scope
                       + "\" is not a declared scope");
    }

    if (!options.self_scope.empty()) {
        if (!is_declared(options.self_scope)) {
            throw di_error("Self scope \"" + options.self_scope + "\" is not a declared scope");
        }
        impl_->self.emplace(impl_->stack.enter(options.self_scope));
        // Non-owning: the container outlives its own scope.
        impl_->self->cache().put(key::of<container>(), instance(instance(), this));
    }

    if (!options.execution_scope.empty()) {
        if (!is_declared(options.execution_scope)) {
            throw di_error("Execution scope \"" + options.execution_scope
                           + "\" is not a declared scope");
        }
        impl_->execution_scope = std::move(options.execution_scope);
    }

    DEPSOLVE_LOG_DEBUG << "container created with " << declared.size() << " scope(s)";
}

container::~container() = default;

// ---------------------------------------------------------------
// Bindings
// ---------------------------------------------------------------

binding_table& container::bindings() noexcept {
    return impl_->bindings;
}

void container::bind(const key& target, dependant_ptr provider) {
    impl_->bindings.bind(target, std::move(provider));
}

scoped_binding container::bind_scoped(const key& target, dependant_ptr provider) {
    return impl_->bindings.bind_scoped(target, std::move(provider));
}

// ---------------------------------------------------------------
// Scopes
// ---------------------------------------------------------------

scope_stack& container::scopes() noexcept {
    return impl_->stack;
}

scope_handle container::enter_scope(std::string name) {
    return impl_->stack.enter(std::move(name));
}

// ---------------------------------------------------------------
// Solve / execute
// ---------------------------------------------------------------

std::shared_ptr<const execution_plan> container::solve(const dependant_ptr& root) {
    if (!root) {
        throw di_error("Cannot solve a null root dependant");
    }

    // Read before the bindings are snapshotted: a concurrent bind can only
    // leave the cached entry stale, never make it look current.
    const std::uint64_t generation = impl_->bindings.generation();
    {
        std::lock_guard lock(impl_->plan_mutex);
        auto it = impl_->plans.find(root->id);
        if (it != impl_->plans.end()
            && it->second.generation == generation
            && it->second.root == root) {
            return it->second.plan;
        }
    }

    auto plan = std::make_shared<const execution_plan>(
        depsolve::solve(root, impl_->bindings, impl_->settings));

    std::lock_guard lock(impl_->plan_mutex);
    impl_->plans.insert_or_assign(root->id, impl::cached_plan{generation, root, plan});
    return plan;
}

instance container::execute(const execution_plan& plan, const execute_options& options) {
    return execute(plan, impl_->stack, options);
}

instance container::execute(const execution_plan& plan, const scope_stack& stack,
                            const execute_options& options) {
    const auto& scope_name = impl_->execution_scope;
    if (scope_name.empty() || stack.is_active(scope_name)) {
        return depsolve::execute(plan, stack, options);
    }

    // Entered on a branch, so each call gets its own instance of the scope.
    auto local = stack.branch();
    auto scope = local.enter(scope_name);
    auto result = depsolve::execute(plan, local, options);
    scope.exit();
    return result;
}

const solve_options& container::settings() const noexcept {
    return impl_->settings;
}

std::size_t container::cached_plans() const {
    std::lock_guard lock(impl_->plan_mutex);
    return impl_->plans.size();
}

void container::clear_plan_cache() {
    std::lock_guard lock(impl_->plan_mutex);
    impl_->plans.clear();
}

} // namespace depsolve
