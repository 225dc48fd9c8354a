#include "resolution.hpp"
#include "scope_impl.hpp"
#include "stacktrace_utils.hpp"

#include "scopedi/exceptions.hpp"

#include <exception>
#include <memory>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

namespace scopedi::internal {

namespace {

// ---------------------------------------------------------------
// Factory invocation with error annotation
// ---------------------------------------------------------------

erased_instance invoke_factory(const binding& b,
                               std::span<const std::shared_ptr<void>> args) {
    erased_instance created;
    try {
        created = b.factory(args);
    } catch (di_error& e) {
        // Annotate with resolution context so nested failures show the
        // full chain: "... (while resolving B -> A)".  Caught by non-const
        // reference so the exception can be enriched before rethrowing.
        e.append_resolution_context(describe(b));
        if (e.diagnostic_detail().empty()) {
            auto trace = format_registration_trace(b);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = provider_failure(b.key, e, std::current_exception(),
                                   b.registration_location);
        ex.set_diagnostic_detail(format_registration_trace(b));
        throw ex;
    } catch (...) {
        auto ex = provider_failure(b.key, "provider threw an unknown exception",
                                   std::current_exception(), b.registration_location);
        ex.set_diagnostic_detail(format_registration_trace(b));
        throw ex;
    }

    if (!created) {
        auto ex = provider_failure(b.key, "provider returned an empty instance",
                                   b.registration_location);
        ex.set_diagnostic_detail(format_registration_trace(b));
        throw ex;
    }
    return created;
}

// ---------------------------------------------------------------
// Plan execution
// ---------------------------------------------------------------

/// Evaluates a plan from its root.  A step whose instance is already cached
/// is returned without evaluating its inputs, so a cached singleton never
/// triggers construction of its transient dependencies again.
class plan_executor {
public:
    explicit plan_executor(const resolution_plan& plan)
        : plan_(plan), values_(plan.steps.size()) {}

    std::shared_ptr<void> run() {
        return evaluate(plan_.steps.size() - 1);
    }

private:
    std::shared_ptr<void> evaluate(std::size_t index) {
        if (values_[index]) return values_[index];

        const plan_step& step = plan_.steps[index];
        auto construct = [&]() -> erased_instance {
            std::vector<std::shared_ptr<void>> args;
            args.reserve(step.inputs.size());
            try {
                for (const auto& input : step.inputs) {
                    args.push_back(input.is_deferred()
                                       ? make_deferred(*input.context, input.key)
                                       : evaluate(input.step));
                }
            } catch (di_error& e) {
                e.append_resolution_context(describe(*step.target));
                throw;
            }
            return invoke_factory(*step.target, args);
        };

        if (step.cache_owner) {
            values_[index] = scope_access::get_or_create(*step.cache_owner,
                                                         *step.target, construct);
        } else {
            values_[index] = construct().ptr;
        }
        return values_[index];
    }

    const resolution_plan& plan_;
    std::vector<std::shared_ptr<void>> values_;
};

} // anonymous namespace

std::shared_ptr<void> resolve(scope& s, const binding_key& key) {
    auto plan = plan_for(s, key, std::source_location::current());
    return plan_executor(*plan).run();
}

std::shared_ptr<void> make_deferred(scope& context, const binding_key& key) {
    std::weak_ptr<scope> weak = context.weak_from_this();
    auto fn = std::make_shared<deferred_fn>(
        [weak = std::move(weak), key, name = context.name()]() -> std::shared_ptr<void> {
            auto target = weak.lock();
            if (!target) {
                throw already_closed(name, "provider<" + to_string(key) + ">");
            }
            return resolve(*target, key);
        });
    return fn;
}

} // namespace scopedi::internal
