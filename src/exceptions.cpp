#include "scopedi/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace scopedi {

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

} // namespace internal

std::string to_string(const binding_key& key) {
    std::string out = internal::demangle(key.type);
    if (!key.qualifier.empty()) {
        out += "[\"" + key.qualifier + "\"]";
    }
    return out;
}

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
        } catch (const std::bad_alloc&) {
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

unbound_key_error::unbound_key_error(binding_key key, std::source_location loc)
    : di_error("No binding for " + to_string(key), loc)
    , key_(std::move(key))
{}

unbound_key_error::unbound_key_error(binding_key key, std::string_view hint,
                                     std::source_location loc)
    : di_error([&]() {
          std::string msg = "No binding for " + to_string(key);
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , key_(std::move(key))
{}

conflict_error::conflict_error(binding_key key, std::source_location loc)
    : di_error("Duplicate binding for " + to_string(key), loc)
    , key_(std::move(key))
{}

std::string cyclic_dependency::build_message(const std::vector<binding_key>& cycle) {
    std::string msg = "Cyclic dependency detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += to_string(cycle[i]);
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(const std::vector<binding_key>& cycle,
                                     std::source_location loc)
    : di_error(build_message(cycle), loc)
    , cycle_(cycle)
{}

std::string lifetime_mismatch::build_message(const binding_key& consumer,
                                             lifetime_kind consumer_lt,
                                             const binding_key& dependency,
                                             lifetime_kind dep_lt,
                                             std::optional<std::type_index> consumer_impl) {
    std::string msg = "Lifetime mismatch: " + to_string(consumer);
    if (consumer_impl.has_value()) {
        msg += " [impl: " + internal::demangle(consumer_impl.value()) + "]";
    }
    msg += " (" + std::string(to_string(consumer_lt)) + ") depends on "
           + to_string(dependency) + " (" + std::string(to_string(dep_lt)) + ")";
    return msg;
}

lifetime_mismatch::lifetime_mismatch(binding_key consumer,
                                     lifetime_kind consumer_lifetime,
                                     binding_key dependency,
                                     lifetime_kind dependency_lifetime,
                                     std::optional<std::type_index> consumer_impl,
                                     std::source_location loc)
    : di_error(build_message(consumer, consumer_lifetime,
                             dependency, dependency_lifetime, consumer_impl), loc)
    , consumer_(std::move(consumer))
    , dependency_(std::move(dependency))
{}

scope_order_error::scope_order_error(std::string_view scope_name,
                                     std::string_view open_child,
                                     std::source_location loc)
    : di_error("Cannot close scope '" + std::string(scope_name)
               + "' while its child scope '" + std::string(open_child)
               + "' is still open", loc)
{}

already_closed::already_closed(std::string_view scope_name,
                               std::string_view operation,
                               std::source_location loc)
    : di_error("Scope '" + std::string(scope_name) + "' is closed ("
               + std::string(operation) + ")", loc)
    , scope_name_(scope_name)
{}

provider_failure::provider_failure(binding_key key, const std::exception& inner,
                                   std::exception_ptr inner_ptr,
                                   std::source_location registration_loc)
    : di_error([&]() {
          std::string msg = "Failed to construct " + to_string(key)
                            + ": " + inner.what();
          if (registration_loc.file_name()[0]) {
              msg += " (registered at " + std::string(registration_loc.file_name())
                     + ":" + std::to_string(registration_loc.line()) + ")";
          }
          return msg;
      }(), registration_loc)
    , key_(std::move(key))
    , inner_(std::move(inner_ptr))
{}

provider_failure::provider_failure(binding_key key, std::string_view reason,
                                   std::source_location registration_loc)
    : di_error("Failed to construct " + to_string(key) + ": " + std::string(reason),
               registration_loc)
    , key_(std::move(key))
{}

provider_failure::provider_failure(binding_key key, std::string_view reason,
                                   std::exception_ptr inner_ptr,
                                   std::source_location registration_loc)
    : provider_failure(std::move(key), reason, registration_loc)
{
    inner_ = std::move(inner_ptr);
}

} // namespace scopedi
