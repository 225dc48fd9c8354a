#pragma once

/// @file fwd.hpp
/// Forward declarations for all public scopedi symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>
#include <memory>

namespace scopedi {

// lifetime.hpp
enum class lifetime_kind;

// logging.hpp
enum class log_level;

// options.hpp
enum class registration_policy;
struct build_options;

// binding_key.hpp
struct binding_key;

// erased_instance.hpp
struct erased_instance;

// binding.hpp
struct dependency_info;
struct binding;

// exceptions.hpp
class di_error;
class unbound_key_error;
class conflict_error;
class cyclic_dependency;
class lifetime_mismatch;
class scope_order_error;
class already_closed;
class provider_failure;

// plan.hpp
struct plan_input;
struct plan_step;
struct resolution_plan;

// scope.hpp
class scope;
class scope_guard;
using scope_handle = std::shared_ptr<scope>;

// injector.hpp
class injector;

// type_traits.hpp
template <typename... Deps>
struct deps_tag;
template <typename T>
struct provider;

// registry.hpp
class registry;

} // namespace scopedi
