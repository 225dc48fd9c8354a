#include "scopedi/injector.hpp"
#include "scopedi/registry.hpp"
#include "scopedi/exceptions.hpp"

#include "resolution.hpp"
#include "scope_impl.hpp"
#include "log.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scopedi {

namespace {

/// Close `s` and everything below it, leaf first.  Used on injector
/// destruction, where nothing may propagate.
void close_tree(scope& s) noexcept {
    std::vector<std::shared_ptr<scope>> children;
    try {
        children = internal::scope_access::children(s);
    } catch (const std::exception& e) {
        SCOPEDI_LOG_ERROR << "cannot enumerate children of scope '" << s.name()
                          << "': " << e.what();
    }
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        close_tree(**it);
    }
    try {
        if (s.is_open()) {
            internal::scope_access::close(s, std::source_location::current());
        }
    } catch (const std::exception& e) {
        SCOPEDI_LOG_ERROR << "failed to close scope '" << s.name()
                          << "' during injector shutdown: " << e.what();
    } catch (...) {
        SCOPEDI_LOG_ERROR << "failed to close scope '" << s.name()
                          << "' during injector shutdown: non-standard exception";
    }
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct injector::impl {
    std::shared_ptr<const build_options> options;
    scope_handle root;
    std::atomic<std::uint64_t> next_scope_id{1};
};

// ---------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------

injector::injector(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

injector::~injector() {
    if (impl_ && impl_->root) {
        close_tree(*impl_->root);
    }
}

std::shared_ptr<injector> injector::create(registry&& root_bindings,
                                           build_options options,
                                           std::source_location loc) {
    auto bindings = root_bindings.seal(loc);

    auto p = std::make_unique<impl>();
    p->options = std::make_shared<const build_options>(std::move(options));
    p->root = internal::scope_access::make(
        0, p->options->root_scope_name, nullptr, p->options,
        internal::binding_table(std::move(bindings)));

    auto result = std::shared_ptr<injector>(new injector(std::move(p)));
    auto& root = *result->impl_->root;
    const auto& opts = *result->impl_->options;

    if (opts.validate_on_build) {
        internal::validate_scope(root, loc);
    }

    if (opts.eager_singletons) {
        for (const auto& b : internal::scope_access::state(root).bindings.bindings()) {
            if (b.lifetime == lifetime_kind::singleton) {
                internal::resolve(root, b.key);
            }
        }
    }

    SCOPEDI_LOG_INFO << "built injector with "
                      << internal::scope_access::state(root).bindings.size()
                      << " root binding(s)";
    return result;
}

const scope_handle& injector::root_scope() const noexcept {
    return impl_->root;
}

const build_options& injector::options() const noexcept {
    return *impl_->options;
}

// ---------------------------------------------------------------
// Scope lifecycle
// ---------------------------------------------------------------

scope_handle injector::open_scope(const scope_handle& parent, std::string name,
                                  std::source_location loc) {
    return open_scope(parent, std::move(name), registry{}, loc);
}

scope_handle injector::open_scope(const scope_handle& parent, std::string name,
                                  registry&& bindings, std::source_location loc) {
    if (!parent) {
        throw di_error("open_scope requires a parent scope", loc);
    }

    auto sealed = bindings.seal(loc);
    std::uint64_t id = impl_->next_scope_id.fetch_add(1);
    if (name.empty()) {
        name = parent->name() + "/" + std::to_string(id);
    }

    auto child = internal::scope_access::make(
        id, std::move(name), parent, impl_->options,
        internal::binding_table(std::move(sealed)));
    internal::scope_access::attach_child(*parent, child, loc);

    if (impl_->options->validate_on_build) {
        try {
            internal::validate_scope(*child, loc);
        } catch (const di_error&) {
            internal::scope_access::close(*child, loc);
            throw;
        }
    }

    SCOPEDI_LOG_DEBUG << "opened scope '" << child->name() << "' under '"
                      << parent->name() << "'";
    return child;
}

scope_guard injector::enter_scope(const scope_handle& parent, std::string name,
                                  std::source_location loc) {
    return scope_guard(shared_from_this(), open_scope(parent, std::move(name), loc));
}

scope_guard injector::enter_scope(const scope_handle& parent, std::string name,
                                  registry&& bindings, std::source_location loc) {
    return scope_guard(shared_from_this(),
                       open_scope(parent, std::move(name), std::move(bindings), loc));
}

void injector::close_scope(const scope_handle& s, std::source_location loc) {
    if (!s) {
        throw di_error("close_scope requires a scope", loc);
    }
    internal::scope_access::close(*s, loc);
}

// ---------------------------------------------------------------
// Planning / resolution
// ---------------------------------------------------------------

std::shared_ptr<const resolution_plan> injector::build_plan(
        const binding_key& key, const scope_handle& s, std::source_location loc) {
    if (!s) {
        throw di_error("build_plan requires a scope", loc);
    }
    return internal::plan_for(*s, key, loc);
}

std::shared_ptr<void> injector::resolve_key(const binding_key& key, const scope_handle& s) {
    if (!s) {
        throw di_error("resolve requires a scope");
    }
    return internal::resolve(*s, key);
}

std::shared_ptr<void> injector::resolve_dependency(const dependency_info& dep,
                                                   const scope_handle& s) {
    if (!s) {
        throw di_error("attach requires a scope");
    }
    if (dep.is_provider) {
        internal::scope_access::ensure_open(*s, "attach", std::source_location::current());
        s->lookup(dep.key);
        return internal::make_deferred(*s, dep.key);
    }
    return internal::resolve(*s, dep.key);
}

// ---------------------------------------------------------------
// scope_guard
// ---------------------------------------------------------------

scope_guard::scope_guard(std::shared_ptr<injector> owner, scope_handle handle)
    : owner_(std::move(owner))
    , scope_(std::move(handle))
{}

scope_guard::~scope_guard() {
    close_quietly();
}

scope_guard::scope_guard(scope_guard&&) noexcept = default;

scope_guard& scope_guard::operator=(scope_guard&& other) noexcept {
    if (this != &other) {
        close_quietly();
        owner_ = std::move(other.owner_);
        scope_ = std::move(other.scope_);
    }
    return *this;
}

void scope_guard::close() {
    if (owner_ && scope_) {
        owner_->close_scope(scope_);
    }
}

void scope_guard::close_quietly() noexcept {
    if (!owner_ || !scope_) return;
    try {
        if (scope_->is_open()) {
            owner_->close_scope(scope_);
        }
    } catch (const std::exception& e) {
        SCOPEDI_LOG_ERROR << "scope_guard failed to close scope '" << scope_->name()
                          << "': " << e.what();
    } catch (...) {
        SCOPEDI_LOG_ERROR << "scope_guard failed to close scope '" << scope_->name()
                          << "': non-standard exception";
    }
}

} // namespace scopedi
