#include "depsolve/dependant.hpp"

#include <any>

#ifdef DEPSOLVE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace depsolve::internal {

std::any capture_stacktrace() {
#ifdef DEPSOLVE_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace depsolve::internal
