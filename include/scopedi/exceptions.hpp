#pragma once

#include "export.hpp"
#include "binding_key.hpp"
#include "lifetime.hpp"

#include <exception>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace scopedi {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
SCOPEDI_EXPORT std::string demangle(std::type_index type);
} // namespace internal

class SCOPEDI_EXPORT di_error : public std::runtime_error {
public:
    explicit di_error(const std::string& message,
                      std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  When a provider throws
    /// during resolution, each enclosing plan step appends its binding so
    /// that the final what() message shows the full chain, e.g.:
    ///   "... (while resolving B [impl: BImpl] -> A [impl: AImpl])"
    void append_resolution_context(const std::string& component_info);

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// No binding for a key in the requesting scope or any of its ancestors.
class SCOPEDI_EXPORT unbound_key_error : public di_error {
public:
    explicit unbound_key_error(binding_key key,
                               std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    unbound_key_error(binding_key key, std::string_view hint,
                      std::source_location loc = std::source_location::current());

    const binding_key& key() const noexcept { return key_; }

private:
    binding_key key_;
};

/// A key was registered twice in the same registry under
/// registration_policy::single.
class SCOPEDI_EXPORT conflict_error : public di_error {
public:
    explicit conflict_error(binding_key key,
                            std::source_location loc = std::source_location::current());

    const binding_key& key() const noexcept { return key_; }

private:
    binding_key key_;
};

/// The dependency graph reachable from a key contains a cycle.  The first
/// and last entries of cycle() are the same key.
class SCOPEDI_EXPORT cyclic_dependency : public di_error {
public:
    explicit cyclic_dependency(const std::vector<binding_key>& cycle,
                               std::source_location loc = std::source_location::current());

    const std::vector<binding_key>& cycle() const noexcept { return cycle_; }

private:
    std::vector<binding_key> cycle_;
    static std::string build_message(const std::vector<binding_key>& cycle);
};

class SCOPEDI_EXPORT lifetime_mismatch : public di_error {
public:
    lifetime_mismatch(binding_key consumer, lifetime_kind consumer_lifetime,
                      binding_key dependency, lifetime_kind dependency_lifetime,
                      std::optional<std::type_index> consumer_impl = std::nullopt,
                      std::source_location loc = std::source_location::current());

    const binding_key& consumer() const noexcept { return consumer_; }
    const binding_key& dependency() const noexcept { return dependency_; }

private:
    binding_key consumer_;
    binding_key dependency_;

    static std::string build_message(const binding_key& consumer, lifetime_kind consumer_lt,
                                     const binding_key& dependency, lifetime_kind dep_lt,
                                     std::optional<std::type_index> consumer_impl);
};

/// A scope was closed while one of its children was still open.
class SCOPEDI_EXPORT scope_order_error : public di_error {
public:
    scope_order_error(std::string_view scope_name, std::string_view open_child,
                      std::source_location loc = std::source_location::current());
};

/// An operation targeted a scope that is closed (or closing).
class SCOPEDI_EXPORT already_closed : public di_error {
public:
    already_closed(std::string_view scope_name, std::string_view operation,
                   std::source_location loc = std::source_location::current());

    const std::string& scope_name() const noexcept { return scope_name_; }

private:
    std::string scope_name_;
};

/// A provider failed while constructing an instance.
class SCOPEDI_EXPORT provider_failure : public di_error {
public:
    /// Wrap an exception thrown by the provider.
    provider_failure(binding_key key, const std::exception& inner,
                     std::exception_ptr inner_ptr,
                     std::source_location registration_loc);

    /// The provider completed but produced no instance.
    provider_failure(binding_key key, std::string_view reason,
                     std::source_location registration_loc);

    /// The provider threw something that is not a std::exception.
    provider_failure(binding_key key, std::string_view reason,
                     std::exception_ptr inner_ptr,
                     std::source_location registration_loc);

    const binding_key& key() const noexcept { return key_; }

    /// The exception the provider threw; null when the provider returned
    /// an empty instance.
    std::exception_ptr inner() const noexcept { return inner_; }

private:
    binding_key key_;
    std::exception_ptr inner_;
};

} // namespace scopedi
