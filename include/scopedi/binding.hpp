#pragma once

#include "export.hpp"
#include "binding_key.hpp"
#include "erased_instance.hpp"
#include "lifetime.hpp"

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <typeindex>
#include <vector>

namespace scopedi {

/// Factory closure of a binding.  Receives the resolved dependency
/// instances in declaration order, each pointing at its interface subobject.
/// A `provider<T>` dependency arrives as a pointer to a `deferred_fn`.
using factory_fn = std::function<erased_instance(std::span<const std::shared_ptr<void>>)>;

/// Type-erased deferred resolution handed to `provider<T>` dependencies.
using deferred_fn = std::function<std::shared_ptr<void>()>;

// ---------------------------------------------------------------
// dependency_info: metadata for a single declared dependency
// ---------------------------------------------------------------

struct dependency_info {
    binding_key key;
    bool is_provider = false;

    bool operator==(const dependency_info&) const = default;
};

// ---------------------------------------------------------------
// binding: one registration record
// ---------------------------------------------------------------

struct binding {
    binding_key   key;
    lifetime_kind lifetime = lifetime_kind::transient;
    factory_fn    factory;
    std::vector<dependency_info> dependencies;
    std::optional<std::type_index> impl_type;

    /// Position in the owning registry, used to break ordering ties.
    std::size_t sequence = 0;

    // Diagnostics
    std::source_location registration_location;
    std::any registration_stacktrace;   // boost::stacktrace when enabled
    std::string api_name;               // e.g. "add_singleton"
};

} // namespace scopedi
