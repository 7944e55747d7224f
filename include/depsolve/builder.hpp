#pragma once

#include "export.hpp"
#include "dependant.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace depsolve {

/// Settings shared by the typed dependant builders.
struct dependant_options {
    std::string name;                       // key qualifier
    std::string scope;                      // empty = solve_options::default_scope
    bool        shared = true;
    std::vector<dependant_ptr> defaults;    // matched to parameters by key
};

/// Wrap a typed value (plus optional cleanup) as a product.
template <typename T>
product make_product(std::shared_ptr<T> value, cleanup_fn cleanup = {}) {
    return product{std::static_pointer_cast<void>(std::move(value)), std::move(cleanup)};
}

namespace detail {

template <typename... Deps>
std::vector<parameter> make_parameters() {
    return { parameter{
        key::of<typename dep_traits<Deps>::interface_type>(),
        !dep_traits<Deps>::is_optional,
        nullptr
    }... };
}

/// Attach each default to the parameter with the same key.
/// Throws di_error if a default matches no parameter.
DEPSOLVE_EXPORT void attach_defaults(std::vector<parameter>& params,
                                     const std::vector<dependant_ptr>& defaults,
                                     const key& owner);

template <typename TInterface, typename TImpl, typename R>
product to_product(R&& result) {
    if constexpr (std::is_same_v<std::remove_cvref_t<R>, product>) {
        return std::forward<R>(result);
    } else if constexpr (std::is_convertible_v<R, std::shared_ptr<TImpl>>) {
        std::shared_ptr<TImpl> impl = std::forward<R>(result);
        std::shared_ptr<TInterface> iface = std::move(impl);
        return make_product(std::move(iface));
    } else {
        std::shared_ptr<TInterface> iface =
            std::make_shared<TImpl>(std::forward<R>(result));
        return make_product(std::move(iface));
    }
}

template <typename TInterface, typename TImpl, typename... Deps, typename F, std::size_t... I>
product invoke_factory(F& f, const argument_list& args, std::index_sequence<I...>) {
    return to_product<TInterface, TImpl>(
        std::invoke(f, args.get<typename dep_traits<Deps>::interface_type>(I)...));
}

} // namespace detail

// ---------------------------------------------------------------
// make_dependant — typed construction of a dependant
// ---------------------------------------------------------------

/// Build a dependant for `TInterface`, constructed as `TImpl`, whose factory
/// receives each declared parameter as a `std::shared_ptr`.
///
///   auto repo = make_dependant<IRepo, SqlRepo>(
///       deps<Database, optional<Cache>>,
///       [](std::shared_ptr<Database> db, std::shared_ptr<Cache> cache) {
///           return std::make_shared<SqlRepo>(db, cache);
///       },
///       {.scope = "request"});
///
/// A factory returning `product` must store the value as a `TInterface*`.
template <typename TInterface, typename TImpl = TInterface, typename... Deps, typename F>
    requires derived_from_base<TImpl, TInterface>
          && factory_for<F, Deps...>
          && product_source<std::invoke_result_t<F&, inject_type_t<Deps>...>,
                            TInterface, TImpl>
dependant_ptr make_dependant(deps_tag<Deps...>, F factory,
                             dependant_options options = {},
                             std::source_location loc = std::source_location::current()) {
    static_assert(std::is_same_v<TInterface, TImpl>
               || std::has_virtual_destructor_v<TInterface>,
        "make_dependant<I,T>: I must have a virtual destructor when I != T");

    auto d = std::make_shared<dependant>();
    d->id = key::of<TInterface>(options.name);
    d->parameters = detail::make_parameters<Deps...>();
    detail::attach_defaults(d->parameters, options.defaults, d->id);
    d->factory = [f = std::move(factory)](const argument_list& args) mutable -> product {
        return detail::invoke_factory<TInterface, TImpl, Deps...>(
            f, args, std::index_sequence_for<Deps...>{});
    };
    d->scope = std::move(options.scope);
    d->shared = options.shared;
    d->location = loc;
    d->definition_stacktrace = internal::capture_stacktrace();
    return d;
}

/// Zero-parameter overload.
template <typename TInterface, typename TImpl = TInterface, typename F>
    requires derived_from_base<TImpl, TInterface>
          && factory_for<F>
          && product_source<std::invoke_result_t<F&>, TInterface, TImpl>
dependant_ptr make_dependant(F factory, dependant_options options = {},
                             std::source_location loc = std::source_location::current()) {
    return make_dependant<TInterface, TImpl>(deps<>, std::move(factory),
                                             std::move(options), loc);
}

/// Dependant that always yields an existing value.
template <typename T>
dependant_ptr value_dependant(std::shared_ptr<T> value, dependant_options options = {},
                              std::source_location loc = std::source_location::current()) {
    return make_dependant<T>(
        [v = std::move(value)]() { return v; },
        std::move(options), loc);
}

/// Dependant with no factory.  Its value must be supplied through
/// execute_options::values (e.g. the current request of a framework).
template <typename T>
dependant_ptr placeholder_dependant(dependant_options options = {},
                                    std::source_location loc = std::source_location::current()) {
    auto d = std::make_shared<dependant>();
    d->id = key::of<T>(options.name);
    d->scope = std::move(options.scope);
    d->shared = options.shared;
    d->location = loc;
    d->definition_stacktrace = internal::capture_stacktrace();
    return d;
}

} // namespace depsolve
