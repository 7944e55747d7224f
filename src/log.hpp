#pragma once

// Internal logging macros.  This header is NOT installed — it is only used
// by the library's .cpp files.

#include "depsolve/logging.hpp"

#include <boost/log/trivial.hpp>

namespace depsolve::logging::internal {

bool enabled(log_level level) noexcept;

} // namespace depsolve::logging::internal

#define DEPSOLVE_LOG_AT(lvl, boost_lvl)                                          \
    if (!::depsolve::logging::internal::enabled(::depsolve::logging::log_level::lvl)) { \
    } else                                                                       \
        BOOST_LOG_TRIVIAL(boost_lvl) << "[depsolve] "

#define DEPSOLVE_LOG_TRACE DEPSOLVE_LOG_AT(trace, trace)
#define DEPSOLVE_LOG_DEBUG DEPSOLVE_LOG_AT(debug, debug)
#define DEPSOLVE_LOG_INFO  DEPSOLVE_LOG_AT(info, info)
#define DEPSOLVE_LOG_WARN  DEPSOLVE_LOG_AT(warning, warning)
#define DEPSOLVE_LOG_ERROR DEPSOLVE_LOG_AT(error, error)
