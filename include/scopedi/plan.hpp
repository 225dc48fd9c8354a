#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "binding_key.hpp"

#include <cstddef>
#include <limits>
#include <vector>

namespace scopedi {

class scope;

/// One argument of a plan step.  Either the output of an earlier step, or a
/// deferred `provider<T>` resolved later from `context`.
struct plan_input {
    static constexpr std::size_t deferred = std::numeric_limits<std::size_t>::max();

    std::size_t step = deferred;
    scope*      context = nullptr;   // deferred only
    binding_key key;

    bool is_deferred() const noexcept { return step == deferred; }
};

struct plan_step {
    const binding* target = nullptr;

    /// Scope whose cache holds the instance; nullptr for transient steps.
    scope* cache_owner = nullptr;

    std::vector<plan_input> inputs;
};

/// Topologically ordered construction sequence for one requested key.
/// Every input of a step refers to an earlier step; the root is last.
/// The scope pointers stay valid while the scope the plan was built for is
/// open, since a scope cannot close before its descendants.
struct resolution_plan {
    binding_key root;
    std::vector<plan_step> steps;

    std::size_t size() const noexcept { return steps.size(); }

    /// Keys in construction order (duplicates for transient steps).
    std::vector<binding_key> construction_order() const {
        std::vector<binding_key> order;
        order.reserve(steps.size());
        for (const auto& s : steps) order.push_back(s.target->key);
        return order;
    }
};

} // namespace scopedi
