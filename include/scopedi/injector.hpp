#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "binding_key.hpp"
#include "exceptions.hpp"
#include "options.hpp"
#include "plan.hpp"
#include "scope.hpp"
#include "type_traits.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>
#include <utility>

namespace scopedi {

class registry;

// ---------------------------------------------------------------
// Helper: turn a resolved, type-erased dependency into its inject type
// ---------------------------------------------------------------
namespace detail {

template <typename D>
auto unerase_dep(const std::shared_ptr<void>& erased) -> inject_type_t<D> {
    using traits = dep_traits<D>;
    using I = typename traits::interface_type;

    if constexpr (traits::is_provider) {
        deferred_fn fn = *static_cast<const deferred_fn*>(erased.get());
        return [fn = std::move(fn)]() -> std::shared_ptr<I> {
            return std::static_pointer_cast<I>(fn());
        };
    } else {
        return std::static_pointer_cast<I>(erased);
    }
}

template <typename D>
dependency_info make_dep_info() {
    using traits = dep_traits<D>;
    return dependency_info{
        binding_key(std::type_index(typeid(typename traits::interface_type)),
                    std::string(traits::qualifier())),
        traits::is_provider
    };
}

} // namespace detail

// ---------------------------------------------------------------
// injector
// ---------------------------------------------------------------

/// Runtime side of the container.  Created by registry::build(); owns the
/// root scope and executes resolution plans against scope caches.
/// All member functions are safe to call concurrently.
class SCOPEDI_EXPORT injector : public std::enable_shared_from_this<injector> {
public:
    /// Closes every scope that is still open, leaf first.
    ~injector();

    injector(const injector&) = delete;
    injector& operator=(const injector&) = delete;

    const scope_handle& root_scope() const noexcept;
    const build_options& options() const noexcept;

    // ---------------------------------------------------------------
    // Scope lifecycle
    // ---------------------------------------------------------------

    /// Open a child scope of `parent` with no bindings of its own.
    scope_handle open_scope(const scope_handle& parent, std::string name = {},
                            std::source_location loc = std::source_location::current());

    /// Open a child scope of `parent` that owns the bindings of `bindings`.
    /// The registry is consumed.
    scope_handle open_scope(const scope_handle& parent, std::string name,
                            registry&& bindings,
                            std::source_location loc = std::source_location::current());

    scope_guard enter_scope(const scope_handle& parent, std::string name = {},
                            std::source_location loc = std::source_location::current());

    scope_guard enter_scope(const scope_handle& parent, std::string name,
                            registry&& bindings,
                            std::source_location loc = std::source_location::current());

    /// Release every instance cached in `s`.  Throws already_closed on a
    /// second close and scope_order_error while a child is still open.
    void close_scope(const scope_handle& s,
                     std::source_location loc = std::source_location::current());

    // ---------------------------------------------------------------
    // Planning
    // ---------------------------------------------------------------

    /// Build (or fetch the memoised) plan for `key` requested from `s`.
    std::shared_ptr<const resolution_plan> build_plan(
        const binding_key& key, const scope_handle& s,
        std::source_location loc = std::source_location::current());

    // ---------------------------------------------------------------
    // Resolution
    // ---------------------------------------------------------------

    template <typename T>
    std::shared_ptr<T> resolve(const scope_handle& s) {
        return std::static_pointer_cast<T>(resolve_key(key_of<T>(), s));
    }

    template <typename T>
    std::shared_ptr<T> resolve(const scope_handle& s, std::string_view qualifier) {
        return std::static_pointer_cast<T>(resolve_key(key_of<T>(qualifier), s));
    }

    /// Resolve from the root scope.
    template <typename T>
    std::shared_ptr<T> resolve() {
        return resolve<T>(root_scope());
    }

    /// Like resolve(), but returns an empty pointer when the requested key
    /// itself is unbound.  Failures further down the graph still throw.
    template <typename T>
    std::shared_ptr<T> try_resolve(const scope_handle& s, std::string_view qualifier = {}) {
        auto key = key_of<T>(qualifier);
        if (!s || !s->find(key)) return nullptr;
        return std::static_pointer_cast<T>(resolve_key(key, s));
    }

    /// Type-erased resolution; the result points at the interface subobject.
    std::shared_ptr<void> resolve_key(const binding_key& key, const scope_handle& s);

    // ---------------------------------------------------------------
    // Two-phase injection
    // ---------------------------------------------------------------

    /// Resolve `Deps...` from `s` and hand them to `target.attach(...)`.
    /// For objects a host framework creates without arguments; such an
    /// object is invalid until attach() has returned.
    template <typename T, typename... Deps>
        requires attachable_with<T, Deps...>
    void attach(T& target, const scope_handle& s, deps_tag<Deps...>) {
        target.attach(detail::unerase_dep<Deps>(
            resolve_dependency(detail::make_dep_info<Deps>(), s))...);
    }

private:
    friend class registry;
    friend class scope_guard;

    struct impl;

    static std::shared_ptr<injector> create(registry&& root_bindings,
                                            build_options options,
                                            std::source_location loc);

    explicit injector(std::unique_ptr<impl> p_impl);

    std::shared_ptr<void> resolve_dependency(const dependency_info& dep,
                                             const scope_handle& s);

    std::unique_ptr<impl> impl_;
};

} // namespace scopedi
