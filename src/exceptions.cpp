#include "depsolve/exceptions.hpp"

#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace depsolve {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

std::string describe(const std::exception_ptr& error) {
    if (!error) return "no exception";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace internal

std::string di_error::format_message(const std::string& msg,
                                     const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

di_error::di_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void di_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void di_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* di_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (...) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string di_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

missing_binding::missing_binding(const key& component, std::source_location loc)
    : di_error("No binding or default for: " + component.to_string(), loc)
    , component_(component)
{}

missing_binding::missing_binding(const key& component, std::string_view hint,
                                 std::source_location loc)
    : di_error([&]() {
          std::string msg = "No binding or default for: " + component.to_string();
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , component_(component)
{}

std::string cyclic_dependency::build_message(const std::vector<key>& cycle) {
    std::string msg = "Cyclic dependency detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += cycle[i].to_string();
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(const std::vector<key>& cycle,
                                     std::source_location loc)
    : di_error(build_message(cycle), loc)
    , cycle_(cycle)
{}

std::string scope_mismatch::build_message(const key& consumer,
                                          std::string_view consumer_scope,
                                          const key& dependency,
                                          std::string_view dependency_scope) {
    return "Scope mismatch: " + consumer.to_string()
           + " (scope \"" + std::string(consumer_scope) + "\") depends on "
           + dependency.to_string()
           + " (scope \"" + std::string(dependency_scope)
           + "\"), which does not outlive it";
}

scope_mismatch::scope_mismatch(const key& consumer, std::string_view consumer_scope,
                               const key& dependency, std::string_view dependency_scope,
                               std::source_location loc)
    : di_error(build_message(consumer, consumer_scope, dependency, dependency_scope), loc)
    , consumer_(consumer)
    , dependency_(dependency)
{}

scope_mismatch::scope_mismatch(const key& consumer, std::string_view consumer_scope,
                               std::source_location loc)
    : di_error("Scope mismatch: " + consumer.to_string() + " uses undeclared scope \""
               + std::string(consumer_scope) + "\"", loc)
    , consumer_(consumer)
    , dependency_(consumer)
{}

conflicting_dependant::conflicting_dependant(const key& component, std::string_view detail,
                                             std::source_location loc)
    : di_error("Conflicting dependants for " + component.to_string()
               + ": " + std::string(detail), loc)
    , component_(component)
{}

construction_error::construction_error(const key& component, std::exception_ptr cause,
                                       std::source_location loc)
    : di_error("Failed to construct " + component.to_string()
               + ": " + internal::describe(cause), loc)
    , component_(component)
    , cause_(std::move(cause))
{}

void construction_error::rethrow_cause() const {
    std::rethrow_exception(cause_);
}

std::string cleanup_errors::build_message(const std::string& scope_name,
                                          const std::vector<std::exception_ptr>& errors) {
    std::string msg = std::to_string(errors.size()) + " cleanup action(s) failed in scope \""
                      + scope_name + "\"";
    for (const auto& e : errors) {
        msg += "; " + internal::describe(e);
    }
    return msg;
}

cleanup_errors::cleanup_errors(std::string scope_name,
                               std::vector<std::exception_ptr> errors,
                               std::source_location loc)
    : di_error(build_message(scope_name, errors), loc)
    , scope_name_(std::move(scope_name))
    , errors_(std::move(errors))
{}

scope_order_error::scope_order_error(const std::string& message, std::source_location loc)
    : di_error(message, loc)
{}

scope_not_entered::scope_not_entered(const key& component, std::string_view scope_name,
                                     std::source_location loc)
    : di_error("Scope \"" + std::string(scope_name) + "\" required by "
               + component.to_string() + " is not active", loc)
    , component_(component)
    , scope_name_(scope_name)
{}

} // namespace depsolve
