#pragma once

// Internal scope state and the privileged operations the injector and the
// plan builder perform on it.  Not installed.

#include "binding_table.hpp"

#include "scopedi/binding.hpp"
#include "scopedi/binding_key.hpp"
#include "scopedi/erased_instance.hpp"
#include "scopedi/options.hpp"
#include "scopedi/plan.hpp"
#include "scopedi/scope.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace scopedi {

struct scope::impl {
    enum class state { open, closing, closed };

    struct cache_entry {
        bool ready = false;            // false while a thread constructs it
        erased_instance instance;
        std::uint64_t sequence = 0;    // creation order
        std::thread::id builder;       // thread constructing a pending entry
    };

    std::uint64_t id = 0;
    std::string name;
    std::shared_ptr<scope> parent;
    std::shared_ptr<const build_options> options;
    internal::binding_table bindings;

    // Guards everything below.  Lock order: parent before child.
    mutable std::mutex mutex;
    std::condition_variable changed;

    state current = state::open;
    std::size_t in_flight = 0;
    std::uint64_t next_sequence = 0;
    std::map<const binding*, cache_entry> cache;
    std::map<binding_key, std::shared_ptr<const resolution_plan>> plans;

    // Open children, not owned.  A child removes itself once closed or
    // destroyed; `raw` identifies it without locking `ref`.
    struct child_ref {
        const scope* raw = nullptr;
        std::weak_ptr<scope> ref;
    };
    std::vector<child_ref> children;
};

namespace internal {

struct located_binding {
    const binding* target = nullptr;
    scope* owner = nullptr;     // scope whose table holds target
};

struct scope_access {
    using released_list = std::vector<std::pair<std::uint64_t, erased_instance>>;

    static std::shared_ptr<scope> make(std::uint64_t id, std::string name,
                                       std::shared_ptr<scope> parent,
                                       std::shared_ptr<const build_options> options,
                                       binding_table bindings);

    static scope::impl& state(scope& s) noexcept { return *s.impl_; }
    static const scope::impl& state(const scope& s) noexcept { return *s.impl_; }

    /// Nearest binding for `key` starting at `from`.
    static located_binding locate(scope& from, const binding_key& key) noexcept;

    /// Throws already_closed unless `s` is open.
    static void ensure_open(const scope& s, std::string_view operation,
                            std::source_location loc);

    /// Register `child` with its parent; throws already_closed if the parent
    /// is no longer open.
    static void attach_child(scope& parent, const std::shared_ptr<scope>& child,
                             std::source_location loc);

    /// Open children of `s` that are still alive.
    static std::vector<std::shared_ptr<scope>> children(const scope& s);

    /// Single-flight "check cache, else construct and insert".  `construct`
    /// runs without the scope lock held.  A failed construction leaves no
    /// entry behind.
    static std::shared_ptr<void> get_or_create(scope& s, const binding& b,
                                               const std::function<erased_instance()>& construct);

    static std::shared_ptr<const resolution_plan> cached_plan(scope& s, const binding_key& key);

    /// Memoise `plan` unless another thread got there first; returns the
    /// plan that is now cached (or `plan` if the scope is closing).
    static std::shared_ptr<const resolution_plan> store_plan(
        scope& s, const binding_key& key, std::shared_ptr<const resolution_plan> plan);

    /// Close `s`: wait for in-flight constructions, then release cached
    /// instances in reverse creation order.
    static void close(scope& s, std::source_location loc);

    /// Move every constructed instance out of the cache, newest first.
    /// Caller holds the scope lock or is the only user of `st`.
    static released_list drain_cache(scope::impl& st);

    /// Run release hooks and drop the cache's references.  Every instance
    /// is released even if a hook throws; the first failure is returned.
    static std::exception_ptr release_all(const std::string& scope_name,
                                          released_list& released);

    /// Remove `child` and any expired entry from the children of `parent`.
    static void detach_child(scope& parent, const scope* child);
};

} // namespace internal
} // namespace scopedi
