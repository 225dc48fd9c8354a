#include "scopedi/registry.hpp"
#include "scopedi/injector.hpp"

#include "stacktrace_utils.hpp"
#include "log.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace scopedi {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct registry::Impl {
    registration_policy policy = registration_policy::single;
    std::vector<binding> bindings;
    std::size_t next_sequence = 0;
    bool sealed = false;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

registry::registry(registration_policy policy)
    : impl_(std::make_unique<Impl>())
{
    impl_->policy = policy;
}

registry::~registry() = default;

registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

registry::Impl& registry::state(std::source_location loc) const {
    if (!impl_) {
        throw di_error("registry has been moved from", loc);
    }
    return *impl_;
}

registration_policy registry::policy() const {
    return state(std::source_location::current()).policy;
}

const std::vector<binding>& registry::bindings() const {
    return state(std::source_location::current()).bindings;
}

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

registry& registry::register_binding(binding b, std::source_location loc) {
    auto& st = state(loc);
    if (st.sealed) {
        throw di_error("Cannot register bindings after the registry has been sealed", loc);
    }
    if (!b.factory) {
        throw di_error("Binding factory cannot be empty", loc);
    }

    b.registration_location = loc;
    b.registration_stacktrace = internal::capture_registration_trace();

    auto existing = std::find_if(st.bindings.begin(), st.bindings.end(),
        [&](const binding& other) { return other.key == b.key; });

    if (existing != st.bindings.end()) {
        switch (st.policy) {
            case registration_policy::single: {
                auto ex = conflict_error(b.key, loc);
                ex.set_diagnostic_detail(internal::format_registration_trace(*existing));
                throw ex;
            }
            case registration_policy::replace:
                SCOPEDI_LOG_DEBUG << "replacing binding for " << to_string(b.key);
                st.bindings.erase(existing);
                break;
            case registration_policy::skip:
                return *this;
        }
    }

    b.sequence = st.next_sequence++;
    st.bindings.push_back(std::move(b));
    return *this;
}

std::vector<binding> registry::seal(std::source_location loc) {
    auto& st = state(loc);
    if (st.sealed) {
        throw di_error("registry has already been sealed by build() or open_scope()", loc);
    }
    st.sealed = true;
    return std::move(st.bindings);
}

// ---------------------------------------------------------------
// build
// ---------------------------------------------------------------

std::shared_ptr<injector> registry::build(build_options options, std::source_location loc) {
    return injector::create(std::move(*this), std::move(options), loc);
}

} // namespace scopedi
