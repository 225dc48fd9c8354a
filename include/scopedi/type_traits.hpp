#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace scopedi {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// The type declares a release hook, called when the owning scope closes.
template <typename T>
concept has_release_hook = requires(T& t) { t.on_release(); };

// ---------------------------------------------------------------
// Dependency list
// ---------------------------------------------------------------

/// A zero-size tag type that carries a compile-time dependency type list.
template <typename... Deps>
struct deps_tag {
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

// ---------------------------------------------------------------
// Qualifier literal
// ---------------------------------------------------------------

/// String literal usable as a template argument: `named<IDb, "replica">`.
template <std::size_t N>
struct fixed_string {
    char value[N] {};

    constexpr fixed_string(const char (&str)[N]) {
        std::copy_n(str, N, value);
    }

    constexpr std::string_view view() const noexcept { return {value, N - 1}; }
};

// ---------------------------------------------------------------
// Dependency wrapper tag types
// ---------------------------------------------------------------

/// Qualified dependency: resolves the binding registered under `Q`.
template <typename T, fixed_string Q>
struct named { using type = T; };

/// Deferred dependency.  The constructor receives a `provider_fn<T>` that
/// resolves `T` each time it is called.  Not an edge of the dependency graph.
template <typename T>
struct provider { using type = T; };

template <typename T>
using provider_fn = std::function<std::shared_ptr<T>()>;

// ---------------------------------------------------------------
// dep_traits: extract injection metadata from a dep declaration
// ---------------------------------------------------------------

/// Primary: bare `T` → unqualified, inject as `std::shared_ptr<T>`.
template <typename D>
struct dep_traits {
    using interface_type = D;
    using inject_type    = std::shared_ptr<D>;
    static constexpr bool is_provider = false;
    static constexpr std::string_view qualifier() noexcept { return {}; }
};

/// `named<T, Q>` → qualified, inject as `std::shared_ptr<T>`.
template <typename T, fixed_string Q>
struct dep_traits<named<T, Q>> {
    using interface_type = T;
    using inject_type    = std::shared_ptr<T>;
    static constexpr bool is_provider = false;
    static constexpr std::string_view qualifier() noexcept { return Q.view(); }
};

/// `provider<T>` → inject as `provider_fn<T>`.
template <typename T>
struct dep_traits<provider<T>> {
    using interface_type = T;
    using inject_type    = provider_fn<T>;
    static constexpr bool is_provider = true;
    static constexpr std::string_view qualifier() noexcept { return {}; }
};

/// `provider<named<T, Q>>` → qualified deferred dependency.
template <typename T, fixed_string Q>
struct dep_traits<provider<named<T, Q>>> {
    using interface_type = T;
    using inject_type    = provider_fn<T>;
    static constexpr bool is_provider = true;
    static constexpr std::string_view qualifier() noexcept { return Q.view(); }
};

/// Helper alias.
template <typename D>
using inject_type_t = typename dep_traits<D>::inject_type;

// ---------------------------------------------------------------
// Constructibility concepts
// ---------------------------------------------------------------

/// TImpl must be constructible from the injection types of all declared deps.
template <typename TImpl, typename... Deps>
concept constructible_from_deps =
    std::is_constructible_v<TImpl, inject_type_t<Deps>...>;

/// Fn must produce something convertible to `std::shared_ptr<TInterface>`.
template <typename Fn, typename TInterface, typename... Deps>
concept factory_for =
    std::is_invocable_r_v<std::shared_ptr<TInterface>, Fn, inject_type_t<Deps>...>;

/// Two-phase injection target: `t.attach(deps...)` is callable.
template <typename T, typename... Deps>
concept attachable_with = requires(T& t, inject_type_t<Deps>... d) {
    t.attach(std::move(d)...);
};

} // namespace scopedi
