#include "depsolve/scope_cache.hpp"
#include "depsolve/exceptions.hpp"
#include "log.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <utility>

namespace depsolve {

namespace {

/// A value finished building after its scope exited.  Nobody will ever
/// close that scope again, so its cleanup runs here.
void run_orphaned_cleanup(cleanup_fn& cleanup, const std::string& scope_name,
                          const key& k) {
    if (!cleanup) return;
    try {
        cleanup();
    } catch (const std::exception& e) {
        DEPSOLVE_LOG_ERROR << "cleanup of " << k.to_string() << " in exited scope \""
                           << scope_name << "\" failed: " << e.what();
    }
}

} // namespace

scope_cache::scope_cache(std::string name)
    : name_(std::move(name))
{}

scope_cache::~scope_cache() {
    if (closed()) return;
    for (const auto& failure : close()) {
        DEPSOLVE_LOG_ERROR << "cleanup failed while destroying scope \"" << name_
                           << "\": " << internal::describe(failure);
    }
}

void scope_cache::throw_if_closed() const {
    if (closed_) {
        throw scope_order_error("Scope \"" + name_ + "\" has already exited");
    }
}

instance scope_cache::get_or_create(const key& k, bool shared,
                                    const constructor_fn& constructor) {
    if (!shared) {
        {
            std::lock_guard lock(mutex_);
            throw_if_closed();
        }
        product p = constructor();
        if (p.cleanup) register_cleanup(std::move(p.cleanup));
        return std::move(p.value);
    }

    std::promise<instance> promise;
    {
        std::unique_lock lock(mutex_);
        throw_if_closed();
        auto it = entries_.find(k);
        if (it != entries_.end()) {
            if (it->second.completed) {
                return it->second.value;
            }
            // Someone else is building it: wait outside the lock.
            auto pending = it->second.pending;
            lock.unlock();
            DEPSOLVE_LOG_TRACE << "waiting for in-flight " << k.to_string()
                               << " in scope \"" << name_ << "\"";
            return pending.get();
        }
        entries_.emplace(k, entry{promise.get_future().share(), false, nullptr});
    }

    product p;
    try {
        p = constructor();
    } catch (...) {
        {
            std::lock_guard lock(mutex_);
            entries_.erase(k);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock lock(mutex_);
        if (!closed_) {
            auto& e = entries_[k];
            e.completed = true;
            e.value = p.value;
            if (p.cleanup) cleanups_.push_back(std::move(p.cleanup));
            lock.unlock();
            promise.set_value(p.value);
            return std::move(p.value);
        }
    }

    auto error = std::make_exception_ptr(scope_order_error(
        "Scope \"" + name_ + "\" exited while " + k.to_string()
        + " was being constructed"));
    promise.set_exception(error);
    run_orphaned_cleanup(p.cleanup, name_, k);
    std::rethrow_exception(error);
}

void scope_cache::register_cleanup(cleanup_fn cleanup) {
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            cleanups_.push_back(std::move(cleanup));
            return;
        }
    }
    run_orphaned_cleanup(cleanup, name_, key{});
    throw scope_order_error("Scope \"" + name_ + "\" exited during construction");
}

instance scope_cache::find(const key& k) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(k);
    if (it == entries_.end() || !it->second.completed) return nullptr;
    return it->second.value;
}

void scope_cache::put(const key& k, instance value, cleanup_fn cleanup) {
    std::lock_guard lock(mutex_);
    throw_if_closed();
    if (entries_.contains(k)) {
        throw di_error("Scope \"" + name_ + "\" already holds " + k.to_string());
    }
    entries_.emplace(k, entry{{}, true, std::move(value)});
    if (cleanup) cleanups_.push_back(std::move(cleanup));
}

std::size_t scope_cache::size() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [](const auto& kv) { return kv.second.completed; }));
}

bool scope_cache::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::vector<std::exception_ptr> scope_cache::close() {
    std::unordered_map<key, entry, key_hash> entries;
    std::vector<cleanup_fn> cleanups;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return {};
        closed_ = true;
        entries.swap(entries_);
        cleanups.swap(cleanups_);
    }

    std::vector<std::exception_ptr> failures;
    for (auto it = cleanups.rbegin(); it != cleanups.rend(); ++it) {
        try {
            (*it)();
        } catch (...) {
            failures.push_back(std::current_exception());
        }
    }
    DEPSOLVE_LOG_DEBUG << "closed scope \"" << name_ << "\": " << entries.size()
                       << " value(s), " << cleanups.size() << " cleanup(s), "
                       << failures.size() << " failure(s)";
    return failures;
}

} // namespace depsolve
