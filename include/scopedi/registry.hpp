#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "erased_instance.hpp"
#include "exceptions.hpp"
#include "injector.hpp"
#include "options.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <vector>

namespace scopedi {

// ---------------------------------------------------------------
// Helpers: build factory closures at compile time
// ---------------------------------------------------------------
namespace detail {

template <typename TInterface, typename TImpl, typename... Deps, std::size_t... Is>
erased_instance construct_from(std::span<const std::shared_ptr<void>> args,
                               std::index_sequence<Is...>) {
    (void)args;
    return make_erased_as<TInterface, TImpl>(unerase_dep<Deps>(args[Is])...);
}

template <typename TInterface, typename TImpl, typename... Deps>
factory_fn constructor_factory() {
    return [](std::span<const std::shared_ptr<void>> args) -> erased_instance {
        return construct_from<TInterface, TImpl, Deps...>(
            args, std::index_sequence_for<Deps...>{});
    };
}

template <typename R>
struct shared_pointee { using type = void; };

template <typename X>
struct shared_pointee<std::shared_ptr<X>> { using type = X; };

template <typename TInterface, typename... Deps, typename Fn, std::size_t... Is>
erased_instance invoke_from(const Fn& fn, std::span<const std::shared_ptr<void>> args,
                            std::index_sequence<Is...>) {
    (void)args;
    auto result = std::invoke(fn, unerase_dep<Deps>(args[Is])...);
    using pointee = typename shared_pointee<decltype(result)>::type;
    if constexpr (!std::is_void_v<pointee> && std::is_base_of_v<TInterface, pointee>) {
        return erase_as<TInterface, pointee>(std::move(result));
    } else {
        return erase_as<TInterface, TInterface>(
            std::shared_ptr<TInterface>(std::move(result)));
    }
}

template <typename... Deps>
std::vector<dependency_info> make_dep_infos() {
    return { make_dep_info<Deps>()... };
}

} // namespace detail

// ---------------------------------------------------------------
// registry
// ---------------------------------------------------------------

/// Configuration-time table of bindings for one scope level.
///
/// A registry is sealed exactly once: either by build(), which creates the
/// injector and binds into its root scope, or by injector::open_scope(),
/// which binds into a child scope.  A moved-from registry rejects every
/// call with di_error.
class SCOPEDI_EXPORT registry {
public:
    explicit registry(registration_policy policy = registration_policy::single);
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    registration_policy policy() const;

    // ===============================================================
    // Constructor bindings
    // ===============================================================

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_singleton(deps_tag<Deps...> = {},
                            std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::singleton, {}, "add_singleton", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_singleton(std::string_view qualifier, deps_tag<Deps...> = {},
                            std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::singleton, qualifier, "add_singleton", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_scoped(deps_tag<Deps...> = {},
                         std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::scoped, {}, "add_scoped", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_scoped(std::string_view qualifier, deps_tag<Deps...> = {},
                         std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::scoped, qualifier, "add_scoped", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_transient(deps_tag<Deps...> = {},
                            std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::transient, {}, "add_transient", loc);
    }

    template <typename TInterface, typename TImpl, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    registry& add_transient(std::string_view qualifier, deps_tag<Deps...> = {},
                            std::source_location loc = std::source_location::current()) {
        return add_type<TInterface, TImpl, Deps...>(
            lifetime_kind::transient, qualifier, "add_transient", loc);
    }

    // ===============================================================
    // Factory-function bindings
    // ===============================================================

    /// `fn` receives the inject types of `Deps...` and returns a
    /// `std::shared_ptr` to TInterface (or to a type derived from it, whose
    /// on_release() hook is then honoured).
    template <typename TInterface, typename... Deps, typename Fn>
        requires factory_for<Fn, TInterface, Deps...>
    registry& add_factory(lifetime_kind lifetime, deps_tag<Deps...>, Fn fn,
                          std::source_location loc = std::source_location::current()) {
        return add_function<TInterface, Deps...>(lifetime, {}, std::move(fn), loc);
    }

    template <typename TInterface, typename... Deps, typename Fn>
        requires factory_for<Fn, TInterface, Deps...>
    registry& add_factory(std::string_view qualifier, lifetime_kind lifetime,
                          deps_tag<Deps...>, Fn fn,
                          std::source_location loc = std::source_location::current()) {
        return add_function<TInterface, Deps...>(lifetime, qualifier, std::move(fn), loc);
    }

    // ===============================================================
    // Pre-built instances
    // ===============================================================

    /// Bind an existing instance.  It behaves as a singleton of the owning
    /// scope; closing the scope drops the container's reference but does not
    /// call on_release(), since the container did not construct it.
    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
    registry& add_instance(std::shared_ptr<TImpl> instance,
                           std::source_location loc = std::source_location::current()) {
        return add_prebuilt<TInterface, TImpl>({}, std::move(instance), loc);
    }

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface>
    registry& add_instance(std::string_view qualifier, std::shared_ptr<TImpl> instance,
                           std::source_location loc = std::source_location::current()) {
        return add_prebuilt<TInterface, TImpl>(qualifier, std::move(instance), loc);
    }

    // ===============================================================
    // Build
    // ===============================================================

    /// Seal this registry into the root scope of a new injector.
    std::shared_ptr<injector> build(build_options options = {},
                                    std::source_location loc = std::source_location::current());

    /// Registered bindings, in registration order.
    const std::vector<binding>& bindings() const;

private:
    friend class injector;

    template <typename TInterface, typename TImpl, typename... Deps>
    registry& add_type(lifetime_kind lifetime, std::string_view qualifier,
                       const char* api_name, std::source_location loc) {
        static_assert(std::is_same_v<TInterface, TImpl>
                   || std::has_virtual_destructor_v<TInterface>,
            "TInterface must have a virtual destructor when TInterface != TImpl");
        binding b;
        b.key = binding_key(std::type_index(typeid(TInterface)), std::string(qualifier));
        b.lifetime = lifetime;
        b.factory = detail::constructor_factory<TInterface, TImpl, Deps...>();
        b.dependencies = detail::make_dep_infos<Deps...>();
        b.impl_type = std::type_index(typeid(TImpl));
        b.api_name = api_name;
        return register_binding(std::move(b), loc);
    }

    template <typename TInterface, typename... Deps, typename Fn>
    registry& add_function(lifetime_kind lifetime, std::string_view qualifier,
                           Fn fn, std::source_location loc) {
        binding b;
        b.key = binding_key(std::type_index(typeid(TInterface)), std::string(qualifier));
        b.lifetime = lifetime;
        b.factory = [fn = std::move(fn)](std::span<const std::shared_ptr<void>> args)
                -> erased_instance {
            return detail::invoke_from<TInterface, Deps...>(
                fn, args, std::index_sequence_for<Deps...>{});
        };
        b.dependencies = detail::make_dep_infos<Deps...>();
        b.api_name = "add_factory";
        return register_binding(std::move(b), loc);
    }

    template <typename TInterface, typename TImpl>
    registry& add_prebuilt(std::string_view qualifier, std::shared_ptr<TImpl> instance,
                           std::source_location loc) {
        if (!instance) {
            throw di_error("add_instance requires a non-null instance for "
                           + internal::demangle(typeid(TInterface)), loc);
        }
        std::shared_ptr<void> erased = std::static_pointer_cast<void>(
            std::static_pointer_cast<TInterface>(std::move(instance)));
        binding b;
        b.key = binding_key(std::type_index(typeid(TInterface)), std::string(qualifier));
        b.lifetime = lifetime_kind::singleton;
        b.factory = [erased = std::move(erased)](std::span<const std::shared_ptr<void>>)
                -> erased_instance {
            return erased_instance{erased, {}};
        };
        b.impl_type = std::type_index(typeid(TImpl));
        b.api_name = "add_instance";
        return register_binding(std::move(b), loc);
    }

    registry& register_binding(binding b, std::source_location loc);

    /// Mark this registry as consumed and hand over its bindings.
    std::vector<binding> seal(std::source_location loc);

    struct Impl;

    /// impl_, or di_error when this registry has been moved from.
    Impl& state(std::source_location loc) const;

    std::unique_ptr<Impl> impl_;
};

} // namespace scopedi
