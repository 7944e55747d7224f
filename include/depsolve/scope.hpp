#pragma once

#include "export.hpp"
#include "scope_cache.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace depsolve {

class scope_handle;

// ---------------------------------------------------------------
// scope_stack — nested lifetime containers
// ---------------------------------------------------------------

/// Scopes are entered and exited last-in-first-out.  Each entered scope
/// owns a fresh scope_cache.  The stack is passed explicitly to whoever
/// executes plans; there is no process-wide registry.
class DEPSOLVE_EXPORT scope_stack {
public:
    scope_stack();
    ~scope_stack();

    scope_stack(const scope_stack&) = delete;
    scope_stack& operator=(const scope_stack&) = delete;
    scope_stack(scope_stack&&) noexcept;
    scope_stack& operator=(scope_stack&&) noexcept;

    /// Push a new scope.  Throws scope_order_error if `name` is already
    /// active on this stack.
    [[nodiscard]] scope_handle enter(std::string name);

    /// Child stack sharing this stack's currently active scopes.  Scopes
    /// entered on the branch are private to it; inherited scopes can only
    /// be exited by their owner.
    scope_stack branch() const;

    /// Cache of the active scope `name`, or nullptr.
    std::shared_ptr<scope_cache> find(std::string_view name) const;

    bool is_active(std::string_view name) const;

    /// Names of active scopes, outermost first.
    std::vector<std::string> active_scopes() const;

    std::size_t depth() const;

private:
    friend class scope_handle;
    struct impl;

    explicit scope_stack(std::shared_ptr<impl> state);

    std::shared_ptr<impl> impl_;
};

// ---------------------------------------------------------------
// scope_handle — one entered scope
// ---------------------------------------------------------------

/// Returned by scope_stack::enter.  Exits the scope on destruction if
/// exit() was not called; cleanup failures seen there are logged.
class DEPSOLVE_EXPORT scope_handle {
public:
    ~scope_handle();

    scope_handle(const scope_handle&) = delete;
    scope_handle& operator=(const scope_handle&) = delete;
    scope_handle(scope_handle&&) noexcept;
    scope_handle& operator=(scope_handle&&) noexcept;

    /// Undefined on a moved-from handle.
    const std::string& name() const noexcept { return cache_->name(); }
    scope_cache& cache() const noexcept { return *cache_; }

    /// True until exit() or destruction.
    bool active() const noexcept { return stack_ != nullptr; }

    /// Pop this scope and run its cleanups.
    /// Throws scope_order_error if this is not the innermost scope (nothing
    /// is popped), it already exited, or the handle was moved from; throws cleanup_errors, after the
    /// scope is fully released, if any cleanup failed.
    void exit();

private:
    friend class scope_stack;
    scope_handle(std::shared_ptr<scope_stack::impl> stack,
                 std::shared_ptr<scope_cache> cache) noexcept;

    /// Destructor path: pop from wherever it sits, log failures.
    void exit_quietly() noexcept;

    std::shared_ptr<scope_stack::impl> stack_;
    std::shared_ptr<scope_cache> cache_;
};

} // namespace depsolve
