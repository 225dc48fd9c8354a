#pragma once

#include "type_traits.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace scopedi {

// ---------------------------------------------------------------
// erased_instance: type-erased shared instance plus its release hook
// ---------------------------------------------------------------

/// Type-erased instance as produced by a provider.  `ptr` always points at
/// the interface subobject, so `std::static_pointer_cast<TInterface>(ptr)`
/// round-trips correctly even under multiple inheritance.
struct erased_instance {
    std::shared_ptr<void> ptr;

    /// Called once when the owning scope releases the instance.  Empty when
    /// the implementation declares no `on_release()`.
    std::function<void()> release;

    explicit operator bool() const noexcept { return ptr != nullptr; }
};

/// Wrap an existing `std::shared_ptr<TImpl>` as an instance of `TInterface`.
/// The release hook is taken from TImpl when it declares `on_release()`.
template <typename TInterface, typename TImpl>
    requires std::is_base_of_v<TInterface, TImpl>
erased_instance erase_as(std::shared_ptr<TImpl> impl) {
    erased_instance out;
    if constexpr (has_release_hook<TImpl>) {
        if (impl) {
            out.release = [raw = impl.get()] { raw->on_release(); };
        }
    }
    out.ptr = std::static_pointer_cast<void>(
        std::static_pointer_cast<TInterface>(std::move(impl)));
    return out;
}

/// Create an erased_instance that owns a `TImpl(args...)`, stored as
/// `TInterface`.  Requires TInterface to have a virtual destructor when
/// TInterface != TImpl so that polymorphic use through the interface is safe.
template <typename TInterface, typename TImpl, typename... Args>
    requires std::is_base_of_v<TInterface, TImpl>
erased_instance make_erased_as(Args&&... args) {
    static_assert(std::is_same_v<TInterface, TImpl>
               || std::has_virtual_destructor_v<TInterface>,
        "TInterface must have a virtual destructor when TInterface != TImpl "
        "(required for correct polymorphic deletion via base pointer)");
    return erase_as<TInterface, TImpl>(
        std::make_shared<TImpl>(std::forward<Args>(args)...));
}

} // namespace scopedi
