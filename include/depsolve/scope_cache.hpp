#pragma once

#include "export.hpp"
#include "dependant.hpp"
#include "key.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace depsolve {

// ---------------------------------------------------------------
// scope_cache — values owned by one scope instance
// ---------------------------------------------------------------

/// Completed shared values keyed by dependant key, in-flight markers for
/// keys under construction, and the cleanup actions of everything built in
/// the scope.  All mutation goes through get_or_create / put / close.
class DEPSOLVE_EXPORT scope_cache {
public:
    using constructor_fn = std::function<product()>;

    explicit scope_cache(std::string name);

    /// Runs outstanding cleanups if close() was never called.
    ~scope_cache();

    scope_cache(const scope_cache&) = delete;
    scope_cache& operator=(const scope_cache&) = delete;

    const std::string& name() const noexcept { return name_; }

    /// Single-flight lookup.
    ///   - completed value for `k` → returned, constructor not invoked;
    ///   - construction of `k` in flight → wait for it, same value (or the
    ///     same exception);
    ///   - otherwise construct, publish, return.  A failed construction is
    ///     forgotten so a later call retries.
    /// With `shared == false` the cache is bypassed and every call
    /// constructs.  Cleanups of both kinds are registered on this scope.
    ///
    /// Throws scope_order_error once the scope has exited.
    instance get_or_create(const key& k, bool shared, const constructor_fn& constructor);

    /// Completed value for `k`, or nullptr.
    instance find(const key& k) const;

    /// Seed a completed value.  Throws di_error if `k` is already present.
    void put(const key& k, instance value, cleanup_fn cleanup = {});

    /// Number of completed shared values.
    std::size_t size() const;

    bool closed() const;

    /// Run every registered cleanup once, newest first, then drop all
    /// values.  Failures do not stop later cleanups; they are returned.
    /// Subsequent calls return an empty list.
    std::vector<std::exception_ptr> close();

private:
    struct entry {
        std::shared_future<instance> pending;
        bool     completed = false;
        instance value;
    };

    void throw_if_closed() const;
    void register_cleanup(cleanup_fn cleanup);

    std::string name_;
    mutable std::mutex mutex_;
    bool closed_ = false;
    std::unordered_map<key, entry, key_hash> entries_;
    std::vector<cleanup_fn> cleanups_;  // construction order
};

} // namespace depsolve
