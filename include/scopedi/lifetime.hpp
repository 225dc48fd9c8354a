#pragma once

#include <string_view>

namespace scopedi {

/// How long an instance produced by a binding lives.
///   singleton: cached in the scope that owns the binding
///   scoped:    cached in the scope the resolution was requested from
///   transient: never cached, one instance per injection point
enum class lifetime_kind {
    singleton,
    scoped,
    transient
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"singleton", "scoped", "transient"};
    return names[static_cast<int>(lt)];
}

constexpr bool is_cached(lifetime_kind lt) noexcept {
    return lt != lifetime_kind::transient;
}

} // namespace scopedi
