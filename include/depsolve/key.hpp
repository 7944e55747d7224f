#pragma once

#include "export.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

namespace depsolve {

// ---------------------------------------------------------------
// key — what a dependant satisfies
// ---------------------------------------------------------------

/// Identifies a dependency: a type plus an optional qualifier.
/// Two dependants with equal keys are the same node to the solver,
/// however they were built.
struct DEPSOLVE_EXPORT key {
    std::type_index type = std::type_index(typeid(void));
    std::string     name;               // empty = unqualified

    key() = default;
    explicit key(std::type_index t, std::string n = {})
        : type(t), name(std::move(n)) {}

    template <typename T>
    static key of(std::string_view name = {}) {
        return key(std::type_index(typeid(T)), std::string(name));
    }

    /// Demangled type name plus qualifier, e.g. `Database (key="replica")`.
    std::string to_string() const;

    bool operator==(const key& o) const noexcept {
        return type == o.type && name == o.name;
    }

    bool operator<(const key& o) const noexcept {
        if (type != o.type) return type < o.type;
        return name < o.name;
    }
};

struct key_hash {
    std::size_t operator()(const key& k) const noexcept {
        std::size_t h = k.type.hash_code();
        h ^= std::hash<std::string>{}(k.name) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace depsolve
