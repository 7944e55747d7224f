#pragma once

#include "export.hpp"

#include <string_view>

namespace depsolve::logging {

enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal,
    off
};

/// Messages below `level` are dropped before they reach Boost.Log.
/// The default is `warning`.
DEPSOLVE_EXPORT void set_level(log_level level) noexcept;
DEPSOLVE_EXPORT log_level level() noexcept;

/// "trace", "debug", "info", "warning"/"warn", "error", "fatal", "off".
/// Unknown strings map to `info`.
DEPSOLVE_EXPORT log_level level_from_string(std::string_view name) noexcept;

} // namespace depsolve::logging
