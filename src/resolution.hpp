#pragma once

// Plan construction and execution.  Internal header.

#include "scopedi/binding_key.hpp"
#include "scopedi/plan.hpp"
#include "scopedi/scope.hpp"

#include <memory>
#include <source_location>

namespace scopedi::internal {

/// Cached or freshly built plan for `key` requested from `s`.
std::shared_ptr<const resolution_plan> plan_for(scope& s, const binding_key& key,
                                                std::source_location loc);

/// Build the plan of every binding `s` owns, in registration order.
void validate_scope(scope& s, std::source_location loc);

/// Resolve `key` from `s`; the result points at the interface subobject.
std::shared_ptr<void> resolve(scope& s, const binding_key& key);

/// Deferred resolution of `key` from `context`, as injected into
/// `provider<T>` dependencies.
std::shared_ptr<void> make_deferred(scope& context, const binding_key& key);

} // namespace scopedi::internal
