#pragma once

#include "depsolve/export.hpp"
#include "depsolve/fwd.hpp"
#include "depsolve/key.hpp"
#include "depsolve/dependant.hpp"
#include "depsolve/type_traits.hpp"
#include "depsolve/builder.hpp"
#include "depsolve/exceptions.hpp"
#include "depsolve/binding.hpp"
#include "depsolve/graph.hpp"
#include "depsolve/plan.hpp"
#include "depsolve/solver.hpp"
#include "depsolve/scope_cache.hpp"
#include "depsolve/scope.hpp"
#include "depsolve/executor.hpp"
#include "depsolve/container.hpp"
#include "depsolve/logging.hpp"
