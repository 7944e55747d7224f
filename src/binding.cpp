#include "depsolve/binding.hpp"
#include "depsolve/exceptions.hpp"
#include "log.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace depsolve {

// ---------------------------------------------------------------
// binding_table
// ---------------------------------------------------------------

void binding_table::bind(const key& target, dependant_ptr provider) {
    if (!provider) {
        throw di_error("Cannot bind " + target.to_string() + " to a null dependant");
    }
    {
        std::unique_lock lock(mutex_);
        rules_[target] = std::move(provider);
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }
    DEPSOLVE_LOG_DEBUG << "bound " << target.to_string();
}

void binding_table::bind(dependant_ptr provider) {
    if (!provider) {
        throw di_error("Cannot bind a null dependant");
    }
    auto target = provider->id;
    bind(target, std::move(provider));
}

scoped_binding binding_table::bind_scoped(const key& target, dependant_ptr provider) {
    if (!provider) {
        throw di_error("Cannot bind " + target.to_string() + " to a null dependant");
    }
    dependant_ptr previous;
    {
        std::unique_lock lock(mutex_);
        auto& slot = rules_[target];
        previous = std::exchange(slot, provider);
        generation_.fetch_add(1, std::memory_order_acq_rel);
    }
    DEPSOLVE_LOG_DEBUG << "bound " << target.to_string() << " (scoped)";
    return scoped_binding(this, target, std::move(provider), std::move(previous));
}

bool binding_table::unbind(const key& target) {
    std::unique_lock lock(mutex_);
    if (rules_.erase(target) == 0) return false;
    generation_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

dependant_ptr binding_table::find(const key& target) const {
    std::shared_lock lock(mutex_);
    auto it = rules_.find(target);
    return it == rules_.end() ? nullptr : it->second;
}

std::size_t binding_table::size() const {
    std::shared_lock lock(mutex_);
    return rules_.size();
}

binding_map binding_table::snapshot() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

void binding_table::restore(const key& target, const dependant_ptr& installed,
                            dependant_ptr previous) {
    std::unique_lock lock(mutex_);
    auto it = rules_.find(target);
    if (it == rules_.end() || it->second != installed) {
        // Replaced or removed since; leave the newer rule alone.
        return;
    }
    if (previous) {
        it->second = std::move(previous);
    } else {
        rules_.erase(it);
    }
    generation_.fetch_add(1, std::memory_order_acq_rel);
}

// ---------------------------------------------------------------
// scoped_binding
// ---------------------------------------------------------------

scoped_binding::scoped_binding(binding_table* table, key target,
                               dependant_ptr installed, dependant_ptr previous) noexcept
    : table_(table)
    , target_(std::move(target))
    , installed_(std::move(installed))
    , previous_(std::move(previous))
{}

scoped_binding::~scoped_binding() {
    reset();
}

scoped_binding::scoped_binding(scoped_binding&& o) noexcept
    : table_(std::exchange(o.table_, nullptr))
    , target_(std::move(o.target_))
    , installed_(std::move(o.installed_))
    , previous_(std::move(o.previous_))
{}

scoped_binding& scoped_binding::operator=(scoped_binding&& o) noexcept {
    if (this != &o) {
        reset();
        table_ = std::exchange(o.table_, nullptr);
        target_ = std::move(o.target_);
        installed_ = std::move(o.installed_);
        previous_ = std::move(o.previous_);
    }
    return *this;
}

void scoped_binding::reset() noexcept {
    if (!table_) return;
    auto* table = std::exchange(table_, nullptr);
    try {
        table->restore(target_, installed_, std::move(previous_));
    } catch (const std::exception& e) {
        DEPSOLVE_LOG_ERROR << "failed to restore binding for "
                           << target_.to_string() << ": " << e.what();
    }
}

} // namespace depsolve
