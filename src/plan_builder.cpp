#include "resolution.hpp"
#include "scope_impl.hpp"
#include "stacktrace_utils.hpp"
#include "log.hpp"

#include "scopedi/exceptions.hpp"

#include <algorithm>
#include <map>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

namespace scopedi::internal {

namespace {

// ------------------------------------------------------------------
// Depth-first plan construction with cycle and missing-binding checks
// ------------------------------------------------------------------
class plan_builder {
public:
    plan_builder(scope& requester, const build_options& options,
                 std::source_location loc)
        : requester_(requester), options_(options), loc_(loc) {}

    resolution_plan build(const binding_key& root) {
        visit(root, requester_, nullptr);
        resolution_plan plan;
        plan.root = root;
        plan.steps = std::move(steps_);
        return plan;
    }

private:
    /// Returns the index of the step producing `key` as seen from `context`.
    /// Dependencies are visited in declaration order, so a fixed registry
    /// always yields the same plan.
    std::size_t visit(const binding_key& key, scope& context, const binding* consumer) {
        located_binding found = scope_access::locate(context, key);
        if (!found.target) throw_unbound(key, context, consumer);
        const binding& b = *found.target;

        if (std::find(path_.begin(), path_.end(), &b) != path_.end()) {
            throw_cycle(b);
        }

        // A singleton lives in (and sees dependencies from) the scope that
        // owns its binding; a scoped instance lives in the requesting scope.
        scope* cache_owner = nullptr;
        scope* dep_context = &context;
        switch (b.lifetime) {
            case lifetime_kind::singleton:
                cache_owner = found.owner;
                dep_context = found.owner;
                break;
            case lifetime_kind::scoped:
                cache_owner = &context;
                break;
            case lifetime_kind::transient:
                break;
        }

        if (cache_owner) {
            auto it = cached_steps_.find({&b, cache_owner});
            if (it != cached_steps_.end()) return it->second;
        }

        plan_step step;
        step.target = &b;
        step.cache_owner = cache_owner;
        step.inputs.reserve(b.dependencies.size());

        path_.push_back(&b);
        for (const auto& dep : b.dependencies) {
            plan_input input;
            input.key = dep.key;
            if (dep.is_provider) {
                // Deferred: must be bound, but is not a construction edge.
                if (!scope_access::locate(*dep_context, dep.key).target) {
                    throw_unbound(dep.key, *dep_context, &b);
                }
                input.context = dep_context;
            } else {
                input.step = visit(dep.key, *dep_context, &b);
                check_lifetime(b, *steps_[input.step].target);
            }
            step.inputs.push_back(std::move(input));
        }
        path_.pop_back();

        steps_.push_back(std::move(step));
        std::size_t index = steps_.size() - 1;
        if (cache_owner) {
            cached_steps_.emplace(std::make_pair(&b, cache_owner), index);
        }
        return index;
    }

    void check_lifetime(const binding& consumer, const binding& dependency) const {
        if (!options_.validate_lifetimes) return;
        if (consumer.lifetime != lifetime_kind::singleton) return;
        if (dependency.lifetime == lifetime_kind::singleton) return;

        // A singleton would capture one instance of a shorter-lived binding.
        auto ex = lifetime_mismatch(consumer.key, consumer.lifetime,
                                    dependency.key, dependency.lifetime,
                                    consumer.impl_type, loc_);
        ex.set_diagnostic_detail(format_registration_trace(consumer));
        throw ex;
    }

    [[noreturn]] void throw_unbound(const binding_key& key, const scope& context,
                                    const binding* consumer) const {
        std::string hint;
        if (consumer) {
            hint = "required by " + describe(*consumer)
                 + " (" + std::string(to_string(consumer->lifetime)) + ")";
            if (consumer->registration_location.file_name()[0]) {
                hint += " registered at "
                    + std::string(consumer->registration_location.file_name())
                    + ":" + std::to_string(consumer->registration_location.line());
            }
        } else {
            hint = "requested from scope '" + context.name() + "'";
        }
        auto ex = unbound_key_error(key, hint, loc_);
        if (consumer) {
            ex.set_diagnostic_detail(format_registration_trace(*consumer));
        }
        throw ex;
    }

    [[noreturn]] void throw_cycle(const binding& b) const {
        auto it = std::find(path_.begin(), path_.end(), &b);
        std::vector<binding_key> cycle;
        std::string detail;
        for (; it != path_.end(); ++it) {
            cycle.push_back((*it)->key);
            std::string trace = format_registration_trace(**it);
            if (!trace.empty()) {
                if (!detail.empty()) detail += "\n";
                detail += trace;
            }
        }
        cycle.push_back(b.key);
        auto ex = cyclic_dependency(cycle, loc_);
        if (!detail.empty()) ex.set_diagnostic_detail(detail);
        throw ex;
    }

    scope& requester_;
    const build_options& options_;
    std::source_location loc_;

    std::vector<const binding*> path_;
    std::map<std::pair<const binding*, scope*>, std::size_t> cached_steps_;
    std::vector<plan_step> steps_;
};

} // anonymous namespace

std::shared_ptr<const resolution_plan> plan_for(scope& s, const binding_key& key,
                                                std::source_location loc) {
    scope_access::ensure_open(s, "build_plan", loc);
    if (auto cached = scope_access::cached_plan(s, key)) {
        return cached;
    }

    plan_builder builder(s, *scope_access::state(s).options, loc);
    auto plan = std::make_shared<const resolution_plan>(builder.build(key));

    SCOPEDI_LOG_TRACE << "built plan for " << to_string(key) << " in scope '"
                      << s.name() << "' with " << plan->size() << " step(s)";

    return scope_access::store_plan(s, key, std::move(plan));
}

void validate_scope(scope& s, std::source_location loc) {
    for (const auto& b : scope_access::state(s).bindings.bindings()) {
        plan_for(s, b.key, loc);
    }
}

} // namespace scopedi::internal
