#pragma once

/// @file fwd.hpp
/// Forward declarations for all public depsolve symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <memory>

namespace depsolve {

// key.hpp
struct key;
struct key_hash;

// dependant.hpp
struct product;
class argument_list;
struct parameter;
struct dependant;
using dependant_ptr = std::shared_ptr<const dependant>;

// type_traits.hpp
template <typename T>
struct optional;
template <typename... Deps>
struct deps_tag;

// exceptions.hpp
class di_error;
class missing_binding;
class cyclic_dependency;
class scope_mismatch;
class conflicting_dependant;
class construction_error;
class cleanup_errors;
class scope_order_error;
class scope_not_entered;

// binding.hpp
class binding_table;
class scoped_binding;

// graph.hpp
struct graph_node;
class dependency_graph;

// plan.hpp
struct plan_node;
struct plan_stage;
struct execution_plan;

// solver.hpp
struct solve_options;

// scope_cache.hpp
class scope_cache;

// scope.hpp
class scope_stack;
class scope_handle;

// executor.hpp
enum class execution_policy;
struct execute_options;

// container.hpp
struct container_options;
class container;

} // namespace depsolve
