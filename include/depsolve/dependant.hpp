#pragma once

#include "export.hpp"
#include "key.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <vector>

namespace depsolve {

/// Type-erased constructed value.  Shared between the owning scope cache
/// and every consumer that received it.
using instance = std::shared_ptr<void>;

using cleanup_fn = std::function<void()>;

/// What a factory hands back: the value plus an optional cleanup action,
/// run exactly once when the scope the value was built in exits.
struct product {
    instance   value;
    cleanup_fn cleanup;
};

// ---------------------------------------------------------------
// argument_list — resolved parameter values, in declared order
// ---------------------------------------------------------------

class DEPSOLVE_EXPORT argument_list {
public:
    argument_list() = default;
    explicit argument_list(std::vector<instance> values)
        : values_(std::move(values)) {}

    std::size_t size() const noexcept { return values_.size(); }
    bool empty() const noexcept { return values_.empty(); }

    /// Null for an optional parameter that had no provider.
    const instance& operator[](std::size_t i) const noexcept { return values_[i]; }

    /// Bounds-checked access.  Throws std::out_of_range.
    const instance& at(std::size_t i) const;

    template <typename T>
    std::shared_ptr<T> get(std::size_t i) const {
        return std::static_pointer_cast<T>(at(i));
    }

private:
    std::vector<instance> values_;
};

using factory_fn = std::function<product(const argument_list&)>;

struct dependant;
using dependant_ptr = std::shared_ptr<const dependant>;

// ---------------------------------------------------------------
// parameter — one declared sub-dependency
// ---------------------------------------------------------------

struct parameter {
    key           target;
    bool          required = true;
    dependant_ptr fallback;            // used when no binding overrides target
};

// ---------------------------------------------------------------
// dependant — one node of a resolution request
// ---------------------------------------------------------------

struct dependant {
    key                    id;
    factory_fn             factory;    // may be empty for values supplied at execute time
    std::vector<parameter> parameters;
    std::string            scope;      // empty = solve_options::default_scope
    bool                   shared = true;

    // Diagnostics
    std::source_location   location;
    std::any               definition_stacktrace;
};

namespace internal {
/// Capture the current call stack for diagnostics.  Returns an empty any
/// when the library was built without Boost.Stacktrace.
DEPSOLVE_EXPORT std::any capture_stacktrace();
} // namespace internal

} // namespace depsolve
