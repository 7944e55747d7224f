#include "log.hpp"

#include <atomic>
#include <cctype>
#include <cstddef>

namespace depsolve::logging {

namespace {

std::atomic<log_level> current_level{log_level::warning};

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

void set_level(log_level level) noexcept {
    current_level.store(level, std::memory_order_relaxed);
}

log_level level() noexcept {
    return current_level.load(std::memory_order_relaxed);
}

log_level level_from_string(std::string_view name) noexcept {
    if (iequals(name, "trace")) return log_level::trace;
    if (iequals(name, "debug")) return log_level::debug;
    if (iequals(name, "info")) return log_level::info;
    if (iequals(name, "warning") || iequals(name, "warn")) return log_level::warning;
    if (iequals(name, "error")) return log_level::error;
    if (iequals(name, "fatal")) return log_level::fatal;
    if (iequals(name, "off")) return log_level::off;
    return log_level::info;
}

namespace internal {

bool enabled(log_level level) noexcept {
    auto threshold = current_level.load(std::memory_order_relaxed);
    return threshold != log_level::off && level >= threshold;
}

} // namespace internal

} // namespace depsolve::logging
