#pragma once

#include "export.hpp"
#include "key.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace depsolve {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
DEPSOLVE_EXPORT std::string demangle(std::type_index type);

/// what() of an exception_ptr's exception, or a placeholder for
/// exceptions that do not derive from std::exception.
DEPSOLVE_EXPORT std::string describe(const std::exception_ptr& error);
} // namespace internal

class DEPSOLVE_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. definition stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  Each call adds one
    /// link of the chain shown by what(), e.g.:
    ///   "... (while resolving Handler -> Controller)"
    void append_resolution_context(const std::string& component_info);

    /// Override to append resolution context (if any) to the base message.
    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// A required key has neither a binding nor a default dependant.
class DEPSOLVE_EXPORT missing_binding : public di_error {
public:
    explicit missing_binding(const key& component,
                             std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    missing_binding(const key& component, std::string_view hint,
                    std::source_location loc = std::source_location::current());

    const key& component() const noexcept { return component_; }

private:
    key component_;
};

class DEPSOLVE_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<key>& cycle,
                               std::source_location loc = std::source_location::current());

    /// Keys in cycle order; the first key is repeated at the end.
    const std::vector<key>& cycle() const noexcept { return cycle_; }

private:
    std::vector<key> cycle_;
    static std::string build_message(const std::vector<key>& cycle);
};

/// A dependant depends on one living in a shorter-lived scope, or names a
/// scope that was never declared.
class DEPSOLVE_EXPORT scope_mismatch : public di_error {
public:
    scope_mismatch(const key& consumer, std::string_view consumer_scope,
                   const key& dependency, std::string_view dependency_scope,
                   std::source_location loc = std::source_location::current());

    /// Undeclared scope.
    scope_mismatch(const key& consumer, std::string_view consumer_scope,
                   std::source_location loc = std::source_location::current());

    const key& consumer() const noexcept { return consumer_; }
    const key& dependency() const noexcept { return dependency_; }

private:
    key consumer_;
    key dependency_;

    static std::string build_message(const key& consumer, std::string_view consumer_scope,
                                     const key& dependency, std::string_view dependency_scope);
};

/// Two dependants share a key but disagree on scope or sharing.
class DEPSOLVE_EXPORT conflicting_dependant : public di_error {
public:
    conflicting_dependant(const key& component, std::string_view detail,
                          std::source_location loc = std::source_location::current());

    const key& component() const noexcept { return component_; }

private:
    key component_;
};

/// A factory failed.  Wraps the original exception.
class DEPSOLVE_EXPORT construction_error : public di_error {
public:
    construction_error(const key& component, std::exception_ptr cause,
                       std::source_location loc = std::source_location::current());

    const key& component() const noexcept { return component_; }
    const std::exception_ptr& cause() const noexcept { return cause_; }

    /// Rethrow the wrapped exception.
    [[noreturn]] void rethrow_cause() const;

private:
    key component_;
    std::exception_ptr cause_;
};

/// One or more cleanup actions failed while a scope was exiting.
class DEPSOLVE_EXPORT cleanup_errors : public di_error {
public:
    cleanup_errors(std::string scope_name, std::vector<std::exception_ptr> errors,
                   std::source_location loc = std::source_location::current());

    const std::string& scope_name() const noexcept { return scope_name_; }
    const std::vector<std::exception_ptr>& errors() const noexcept { return errors_; }

private:
    std::string scope_name_;
    std::vector<std::exception_ptr> errors_;

    static std::string build_message(const std::string& scope_name,
                                     const std::vector<std::exception_ptr>& errors);
};

/// Misuse of the scope stack API.
class DEPSOLVE_EXPORT scope_order_error : public di_error {
public:
    explicit scope_order_error(const std::string& message,
                               std::source_location loc = std::source_location::current());
};

/// A plan needs a scope that is not active on the stack it runs against.
class DEPSOLVE_EXPORT scope_not_entered : public di_error {
public:
    scope_not_entered(const key& component, std::string_view scope_name,
                      std::source_location loc = std::source_location::current());

    const key& component() const noexcept { return component_; }
    const std::string& scope_name() const noexcept { return scope_name_; }

private:
    key component_;
    std::string scope_name_;
};

} // namespace depsolve
