#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "binding_key.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace scopedi {

class injector;

namespace internal {
struct scope_access;
} // namespace internal

/// A named lifetime boundary.  Owns the bindings registered for it, the
/// instances cached in it and the plans built for it.  Scopes form a tree;
/// every scope except the root keeps its parent alive.
///
/// Scopes are created and closed through the injector and handled as
/// `scope_handle` values.  A closed scope rejects every further operation
/// with already_closed.
class SCOPEDI_EXPORT scope : public std::enable_shared_from_this<scope> {
public:
    ~scope();

    scope(const scope&) = delete;
    scope& operator=(const scope&) = delete;

    const std::string& name() const noexcept;
    std::uint64_t id() const noexcept;

    bool is_root() const noexcept;
    bool is_open() const;

    std::shared_ptr<scope> parent() const noexcept;

    /// Nearest binding for `key`, walking from this scope up through its
    /// parents.  Throws unbound_key_error if none is found.
    const binding& lookup(const binding_key& key) const;

    /// Non-throwing lookup; nullptr if unbound.
    const binding* find(const binding_key& key) const noexcept;

    /// True when `key` is bound in this scope itself (parents ignored).
    bool binds_locally(const binding_key& key) const noexcept;

    /// Number of instances currently held in this scope's cache.
    std::size_t cached_count() const;

private:
    friend struct internal::scope_access;

    struct impl;
    explicit scope(std::unique_ptr<impl> p_impl);

    std::unique_ptr<impl> impl_;
};

using scope_handle = std::shared_ptr<scope>;

/// RAII scope object.  Closes its scope when destroyed unless it was
/// already closed through the injector.
class SCOPEDI_EXPORT scope_guard {
public:
    ~scope_guard();

    scope_guard(const scope_guard&) = delete;
    scope_guard& operator=(const scope_guard&) = delete;
    scope_guard(scope_guard&&) noexcept;
    scope_guard& operator=(scope_guard&&) noexcept;

    const scope_handle& handle() const noexcept { return scope_; }
    scope& operator*() const noexcept { return *scope_; }
    scope* operator->() const noexcept { return scope_.get(); }

    /// Close now.  Errors propagate, unlike in the destructor.
    void close();

private:
    friend class injector;
    scope_guard(std::shared_ptr<injector> owner, scope_handle handle);

    void close_quietly() noexcept;

    std::shared_ptr<injector> owner_;
    scope_handle scope_;
};

} // namespace scopedi
