#pragma once

#include "dependant.hpp"

#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>

namespace depsolve {

// ---------------------------------------------------------------
// Parameter wrapper tag types
// ---------------------------------------------------------------

/// Marks a parameter as not required.  When neither a binding nor a default
/// provides it, the factory receives an empty `std::shared_ptr<T>`.
template <typename T>
struct optional { using type = T; };

/// A zero-size tag type that carries a compile-time parameter type list.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

// ---------------------------------------------------------------
// dep_traits — extract injection metadata from a parameter declaration
// ---------------------------------------------------------------

/// Primary: bare `T` → required, inject as `std::shared_ptr<T>`.
template <typename D>
struct dep_traits {
    using interface_type = D;
    static constexpr bool is_optional = false;
};

/// `optional<T>` → not required, inject as `std::shared_ptr<T>` (may be null).
template <typename T>
struct dep_traits<optional<T>> {
    using interface_type = T;
    static constexpr bool is_optional = true;
};

template <typename D>
using inject_type_t = std::shared_ptr<typename dep_traits<D>::interface_type>;

// ---------------------------------------------------------------
// Factory result normalisation
// ---------------------------------------------------------------

template <typename R>
struct is_shared_ptr : std::false_type {};

template <typename U>
struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

// ---------------------------------------------------------------
// Concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// F can be called with the injection types of all declared parameters.
template <typename F, typename... Deps>
concept factory_for = std::is_invocable_v<F&, inject_type_t<Deps>...>;

/// The factory's result can be turned into a product holding a TInterface
/// built as TImpl: a product, a shared_ptr to TImpl, or a TImpl value.
template <typename R, typename TInterface, typename TImpl>
concept product_source =
    std::is_same_v<std::remove_cvref_t<R>, product>
    || std::is_convertible_v<R, std::shared_ptr<TImpl>>
    || (!is_shared_ptr<std::remove_cvref_t<R>>::value
        && std::is_constructible_v<TImpl, R>);

} // namespace depsolve
