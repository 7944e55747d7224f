#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "dependant.hpp"
#include "executor.hpp"
#include "plan.hpp"
#include "scope.hpp"
#include "solver.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace depsolve {

struct container_options {
    /// Declared scope ordering, outermost first (see solve_options).
    std::vector<std::string> scopes;
    std::string default_scope;

    /// When non-empty, this scope is entered at construction and holds the
    /// container itself under key::of<container>().  Must be declared.
    std::string self_scope;

    /// When non-empty, execute() enters this scope on a branch of the
    /// target stack for the duration of the call unless it is already
    /// active there.  Must be declared.
    std::string execution_scope;
};

// ---------------------------------------------------------------
// container — bindings, scopes and plan cache in one place
// ---------------------------------------------------------------

class DEPSOLVE_EXPORT container {
public:
    explicit container(container_options options = {});
    ~container();

    container(const container&) = delete;
    container& operator=(const container&) = delete;

    // ---------------------------------------------------------------
    // Bindings
    // ---------------------------------------------------------------

    binding_table& bindings() noexcept;
    void bind(const key& target, dependant_ptr provider);
    [[nodiscard]] scoped_binding bind_scoped(const key& target, dependant_ptr provider);

    // ---------------------------------------------------------------
    // Scopes
    // ---------------------------------------------------------------

    scope_stack& scopes() noexcept;
    [[nodiscard]] scope_handle enter_scope(std::string name);

    // ---------------------------------------------------------------
    // Solve / execute
    // ---------------------------------------------------------------

    /// Solve `root` against the current bindings.  Plans are cached per
    /// root key and reused until the binding table changes.
    std::shared_ptr<const execution_plan> solve(const dependant_ptr& root);

    /// Execute on the container's own scope stack.  Values of the
    /// execution scope, when it is entered here, are cleaned up before
    /// this returns.
    instance execute(const execution_plan& plan, const execute_options& options = {});

    /// Execute on a branch (or any other stack).
    instance execute(const execution_plan& plan, const scope_stack& stack,
                     const execute_options& options = {});

    template <typename T>
    std::shared_ptr<T> execute_as(const execution_plan& plan,
                                  const execute_options& options = {}) {
        return std::static_pointer_cast<T>(execute(plan, options));
    }

    /// solve + execute.
    template <typename T>
    std::shared_ptr<T> resolve(const dependant_ptr& root,
                               const execute_options& options = {}) {
        return execute_as<T>(*solve(root), options);
    }

    const solve_options& settings() const noexcept;
    std::size_t cached_plans() const;
    void clear_plan_cache();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace depsolve
