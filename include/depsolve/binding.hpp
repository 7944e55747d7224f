#pragma once

#include "export.hpp"
#include "dependant.hpp"
#include "key.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>

namespace depsolve {

using binding_map = std::unordered_map<key, dependant_ptr, key_hash>;

class scoped_binding;

// ---------------------------------------------------------------
// binding_table — key → dependant override rules
// ---------------------------------------------------------------

/// Override rules consulted before the graph is walked.  A rule replaces
/// the default dependant of every reference to its key, including the
/// root.  Rules are applied once per reference, never transitively.
class DEPSOLVE_EXPORT binding_table {
public:
    binding_table() = default;

    binding_table(const binding_table&) = delete;
    binding_table& operator=(const binding_table&) = delete;

    /// Install (or replace) the rule for `target`.
    void bind(const key& target, dependant_ptr provider);

    /// Install a rule keyed by the provider's own key.
    void bind(dependant_ptr provider);

    /// Install a rule that is rolled back when the returned guard dies.
    [[nodiscard]] scoped_binding bind_scoped(const key& target, dependant_ptr provider);

    /// Remove the rule for `target`.  Returns false if there was none.
    bool unbind(const key& target);

    /// Provider bound to `target`, or nullptr.
    dependant_ptr find(const key& target) const;

    std::size_t size() const;

    /// Copy of all rules, consistent with a single generation.
    binding_map snapshot() const;

    /// Incremented on every change; lets callers detect stale solves.
    std::uint64_t generation() const noexcept { return generation_.load(std::memory_order_acquire); }

private:
    friend class scoped_binding;

    /// Put `previous` back if `installed` is still the active rule.
    void restore(const key& target, const dependant_ptr& installed, dependant_ptr previous);

    mutable std::shared_mutex mutex_;
    binding_map rules_;
    std::atomic<std::uint64_t> generation_{0};
};

// ---------------------------------------------------------------
// scoped_binding — RAII guard returned by bind_scoped
// ---------------------------------------------------------------

class DEPSOLVE_EXPORT scoped_binding {
public:
    ~scoped_binding();

    scoped_binding(const scoped_binding&) = delete;
    scoped_binding& operator=(const scoped_binding&) = delete;
    scoped_binding(scoped_binding&& o) noexcept;
    scoped_binding& operator=(scoped_binding&& o) noexcept;

    /// Keep the rule permanently; the guard no longer restores anything.
    void release() noexcept { table_ = nullptr; }

private:
    friend class binding_table;
    scoped_binding(binding_table* table, key target,
                   dependant_ptr installed, dependant_ptr previous) noexcept;

    void reset() noexcept;

    binding_table* table_ = nullptr;
    key            target_;
    dependant_ptr  installed_;
    dependant_ptr  previous_;
};

} // namespace depsolve
