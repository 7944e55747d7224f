#include "depsolve/scope.hpp"
#include "depsolve/exceptions.hpp"
#include "log.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace depsolve {

// ---------------------------------------------------------------
// Impl, shared by a stack and every handle it issued
// ---------------------------------------------------------------

struct scope_stack::impl {
    struct frame {
        std::shared_ptr<scope_cache> cache;
        bool inherited = false;         // owned by the stack this one branched from
    };

    mutable std::mutex mutex;
    std::vector<frame> frames;          // outermost first

    // Inherited scopes may have been exited by their owner since.
    template <typename F>
    void for_each_live(F&& f) const {
        for (const auto& fr : frames) {
            if (!fr.cache->closed()) f(fr);
        }
    }
};

// ---------------------------------------------------------------
// scope_stack
// ---------------------------------------------------------------

scope_stack::scope_stack()
    : impl_(std::make_shared<impl>())
{}

scope_stack::scope_stack(std::shared_ptr<impl> state)
    : impl_(std::move(state))
{}

scope_stack::~scope_stack() = default;

scope_stack::scope_stack(scope_stack&&) noexcept = default;
scope_stack& scope_stack::operator=(scope_stack&&) noexcept = default;

scope_handle scope_stack::enter(std::string name) {
    auto cache = std::make_shared<scope_cache>(name);
    {
        std::lock_guard lock(impl_->mutex);
        bool duplicate = false;
        impl_->for_each_live([&](const impl::frame& fr) {
            if (fr.cache->name() == name) duplicate = true;
        });
        if (duplicate) {
            throw scope_order_error("Scope \"" + name + "\" has already been entered");
        }
        impl_->frames.push_back(impl::frame{cache, false});
    }
    DEPSOLVE_LOG_DEBUG << "entered scope \"" << name << "\"";
    return scope_handle(impl_, std::move(cache));
}

scope_stack scope_stack::branch() const {
    auto child = std::make_shared<impl>();
    {
        std::lock_guard lock(impl_->mutex);
        impl_->for_each_live([&](const impl::frame& fr) {
            child->frames.push_back(impl::frame{fr.cache, true});
        });
    }
    return scope_stack(std::move(child));
}

std::shared_ptr<scope_cache> scope_stack::find(std::string_view name) const {
    std::lock_guard lock(impl_->mutex);
    for (auto it = impl_->frames.rbegin(); it != impl_->frames.rend(); ++it) {
        if (it->cache->name() == name && !it->cache->closed()) return it->cache;
    }
    return nullptr;
}

bool scope_stack::is_active(std::string_view name) const {
    return find(name) != nullptr;
}

std::vector<std::string> scope_stack::active_scopes() const {
    std::vector<std::string> names;
    std::lock_guard lock(impl_->mutex);
    impl_->for_each_live([&](const impl::frame& fr) {
        names.push_back(fr.cache->name());
    });
    return names;
}

std::size_t scope_stack::depth() const {
    std::size_t n = 0;
    std::lock_guard lock(impl_->mutex);
    impl_->for_each_live([&](const impl::frame&) { ++n; });
    return n;
}

// ---------------------------------------------------------------
// scope_handle
// ---------------------------------------------------------------

scope_handle::scope_handle(std::shared_ptr<scope_stack::impl> stack,
                           std::shared_ptr<scope_cache> cache) noexcept
    : stack_(std::move(stack))
    , cache_(std::move(cache))
{}

scope_handle::~scope_handle() {
    exit_quietly();
}

scope_handle::scope_handle(scope_handle&& o) noexcept
    : stack_(std::move(o.stack_))
    , cache_(std::move(o.cache_))
{}

scope_handle& scope_handle::operator=(scope_handle&& o) noexcept {
    if (this != &o) {
        exit_quietly();
        stack_ = std::move(o.stack_);
        cache_ = std::move(o.cache_);
    }
    return *this;
}

void scope_handle::exit() {
    if (!cache_) {
        throw scope_order_error("Scope handle is empty (moved from)");
    }
    if (!stack_) {
        throw scope_order_error("Scope \"" + name() + "\" has already exited");
    }
    {
        std::lock_guard lock(stack_->mutex);
        auto& frames = stack_->frames;
        if (frames.empty() || frames.back().cache != cache_) {
            std::string innermost = frames.empty() ? std::string("<none>")
                                                   : frames.back().cache->name();
            throw scope_order_error("Scope \"" + name()
                                    + "\" exited out of order; innermost scope is \""
                                    + innermost + "\"");
        }
        frames.pop_back();
    }
    stack_.reset();

    auto failures = cache_->close();
    DEPSOLVE_LOG_DEBUG << "exited scope \"" << name() << "\"";
    if (!failures.empty()) {
        throw cleanup_errors(name(), std::move(failures));
    }
}

void scope_handle::exit_quietly() noexcept {
    if (!stack_) return;
    try {
        {
            std::lock_guard lock(stack_->mutex);
            auto& frames = stack_->frames;
            auto it = std::find_if(frames.begin(), frames.end(),
                [&](const scope_stack::impl::frame& fr) { return fr.cache == cache_; });
            if (it != frames.end()) {
                if (std::next(it) != frames.end()) {
                    DEPSOLVE_LOG_WARN << "scope \"" << name()
                                      << "\" released while inner scopes are still active";
                }
                frames.erase(it);
            }
        }
        stack_.reset();
        for (const auto& failure : cache_->close()) {
            DEPSOLVE_LOG_ERROR << "cleanup failed while leaving scope \"" << name()
                               << "\": " << internal::describe(failure);
        }
    } catch (const std::exception& e) {
        stack_.reset();
        DEPSOLVE_LOG_ERROR << "failed to leave scope \"" << name() << "\": " << e.what();
    }
}

} // namespace depsolve
