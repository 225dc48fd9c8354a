#include "scope_impl.hpp"
#include "log.hpp"

#include "scopedi/exceptions.hpp"
#include "scopedi/injector.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scopedi {

namespace {

// ---------------------------------------------------------------
// wait_graph: which pending entry each blocked thread waits for
// ---------------------------------------------------------------

/// Process-wide record of threads blocked on an entry another thread is
/// constructing.  A thread about to wait follows the chain of builders; if
/// it leads back to itself the wait would never end, so it fails instead.
class wait_graph {
public:
    static wait_graph& instance() {
        static wait_graph graph;
        return graph;
    }

    /// Throws cyclic_dependency when `builder` waits, directly or through
    /// other threads, on the calling thread.
    void enter(std::thread::id builder, const binding_key& key) {
        const auto self = std::this_thread::get_id();
        std::lock_guard lock(mutex_);

        std::vector<binding_key> cycle{key};
        auto current = builder;
        for (std::size_t hops = 0; hops <= waiting_.size(); ++hops) {
            auto it = waiting_.find(current);
            if (it == waiting_.end()) break;
            cycle.push_back(it->second.key);
            current = it->second.builder;
            if (current == self) {
                cycle.push_back(key);
                throw cyclic_dependency(std::move(cycle));
            }
        }
        waiting_.insert_or_assign(self, edge{builder, key});
    }

    void leave() noexcept {
        std::lock_guard lock(mutex_);
        waiting_.erase(std::this_thread::get_id());
    }

private:
    struct edge {
        std::thread::id builder;
        binding_key key;
    };

    std::mutex mutex_;
    std::unordered_map<std::thread::id, edge> waiting_;
};

class wait_registration {
public:
    wait_registration(std::thread::id builder, const binding_key& key) {
        wait_graph::instance().enter(builder, key);
    }
    ~wait_registration() { wait_graph::instance().leave(); }

    wait_registration(const wait_registration&) = delete;
    wait_registration& operator=(const wait_registration&) = delete;
};

} // namespace

// ---------------------------------------------------------------
// scope
// ---------------------------------------------------------------

scope::scope(std::unique_ptr<impl> p_impl)
    : impl_(std::move(p_impl))
{}

scope::~scope() {
    if (!impl_ || impl_->current == impl::state::closed) return;
    // Only reachable when the last handle of a never-closed scope goes away,
    // so no other thread can touch the cache.
    auto released = internal::scope_access::drain_cache(*impl_);
    impl_->current = impl::state::closed;
    if (impl_->parent) {
        internal::scope_access::detach_child(*impl_->parent, this);
    }
    SCOPEDI_LOG_DEBUG << "scope '" << impl_->name << "' destroyed without close, releasing "
                      << released.size() << " instance(s)";
    if (internal::scope_access::release_all(impl_->name, released)) {
        SCOPEDI_LOG_WARNING << "scope '" << impl_->name
                            << "' destroyed without close; a release hook failed";
    }
}

const std::string& scope::name() const noexcept {
    return impl_->name;
}

std::uint64_t scope::id() const noexcept {
    return impl_->id;
}

bool scope::is_root() const noexcept {
    return impl_->parent == nullptr;
}

bool scope::is_open() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->current == impl::state::open;
}

std::shared_ptr<scope> scope::parent() const noexcept {
    return impl_->parent;
}

const binding* scope::find(const binding_key& key) const noexcept {
    for (const scope* s = this; s != nullptr; s = s->impl_->parent.get()) {
        if (const binding* b = s->impl_->bindings.find(key)) return b;
    }
    return nullptr;
}

const binding& scope::lookup(const binding_key& key) const {
    if (const binding* b = find(key)) return *b;
    throw unbound_key_error(key, "looked up from scope '" + impl_->name + "'");
}

bool scope::binds_locally(const binding_key& key) const noexcept {
    return impl_->bindings.find(key) != nullptr;
}

std::size_t scope::cached_count() const {
    std::lock_guard lock(impl_->mutex);
    return static_cast<std::size_t>(std::count_if(
        impl_->cache.begin(), impl_->cache.end(),
        [](const auto& entry) { return entry.second.ready; }));
}

// ---------------------------------------------------------------
// scope_access
// ---------------------------------------------------------------

namespace internal {

std::shared_ptr<scope> scope_access::make(std::uint64_t id, std::string name,
                                          std::shared_ptr<scope> parent,
                                          std::shared_ptr<const build_options> options,
                                          binding_table bindings) {
    auto st = std::make_unique<scope::impl>();
    st->id = id;
    st->name = std::move(name);
    st->parent = std::move(parent);
    st->options = std::move(options);
    st->bindings = std::move(bindings);
    return std::shared_ptr<scope>(new scope(std::move(st)));
}

located_binding scope_access::locate(scope& from, const binding_key& key) noexcept {
    for (scope* s = &from; s != nullptr; s = s->impl_->parent.get()) {
        if (const binding* b = s->impl_->bindings.find(key)) return {b, s};
    }
    return {};
}

void scope_access::ensure_open(const scope& s, std::string_view operation,
                               std::source_location loc) {
    std::lock_guard lock(s.impl_->mutex);
    if (s.impl_->current != scope::impl::state::open) {
        throw already_closed(s.impl_->name, operation, loc);
    }
}

void scope_access::attach_child(scope& parent, const std::shared_ptr<scope>& child,
                                std::source_location loc) {
    auto& st = *parent.impl_;
    std::lock_guard lock(st.mutex);
    if (st.current != scope::impl::state::open) {
        throw already_closed(st.name, "open_scope", loc);
    }
    st.children.push_back({child.get(), child});
}

void scope_access::detach_child(scope& parent, const scope* child) {
    auto& st = *parent.impl_;
    std::lock_guard lock(st.mutex);
    std::erase_if(st.children, [&](const scope::impl::child_ref& c) {
        return c.raw == child || c.ref.expired();
    });
}

std::vector<std::shared_ptr<scope>> scope_access::children(const scope& s) {
    std::vector<std::shared_ptr<scope>> alive;
    std::lock_guard lock(s.impl_->mutex);
    for (const auto& c : s.impl_->children) {
        if (auto child = c.ref.lock()) alive.push_back(std::move(child));
    }
    return alive;
}

scope_access::released_list scope_access::drain_cache(scope::impl& st) {
    released_list released;
    released.reserve(st.cache.size());
    for (auto& [target, entry] : st.cache) {
        if (entry.ready) {
            released.emplace_back(entry.sequence, std::move(entry.instance));
        }
    }
    st.cache.clear();
    st.plans.clear();
    std::sort(released.begin(), released.end(),
              [](const auto& a, const auto& b) { return a.first > b.first; });
    return released;
}

std::exception_ptr scope_access::release_all(const std::string& scope_name,
                                             released_list& released) {
    std::exception_ptr first_failure;
    for (auto& [sequence, instance] : released) {
        if (instance.release) {
            try {
                instance.release();
            } catch (const std::exception& e) {
                SCOPEDI_LOG_ERROR << "release hook failed in scope '" << scope_name
                                  << "': " << e.what();
                if (!first_failure) first_failure = std::current_exception();
            } catch (...) {
                SCOPEDI_LOG_ERROR << "release hook failed in scope '" << scope_name
                                  << "' with a non-standard exception";
                if (!first_failure) first_failure = std::current_exception();
            }
        }
        instance.ptr.reset();
    }
    return first_failure;
}

std::shared_ptr<void> scope_access::get_or_create(
        scope& s, const binding& b,
        const std::function<erased_instance()>& construct) {
    auto& st = *s.impl_;
    std::unique_lock lock(st.mutex);
    for (;;) {
        if (st.current != scope::impl::state::open) {
            throw already_closed(st.name, "resolve " + to_string(b.key));
        }
        auto it = st.cache.find(&b);
        if (it == st.cache.end()) break;
        if (it->second.ready) return it->second.instance.ptr;
        if (it->second.builder == std::this_thread::get_id()) {
            // A provider<T> called from inside the constructor it feeds.
            throw cyclic_dependency(std::vector<binding_key>{b.key, b.key});
        }
        // Another thread is constructing this entry; it either completes it
        // or erases it, after which we retry.
        wait_registration waiting(it->second.builder, b.key);
        st.changed.wait(lock);
    }

    st.cache[&b].builder = std::this_thread::get_id();
    ++st.in_flight;
    lock.unlock();

    erased_instance created;
    try {
        created = construct();
    } catch (...) {
        lock.lock();
        st.cache.erase(&b);
        --st.in_flight;
        lock.unlock();
        st.changed.notify_all();
        throw;
    }

    lock.lock();
    // close() waits for in_flight to drop, so the pending entry still exists.
    auto& entry = st.cache.at(&b);
    entry.instance = std::move(created);
    entry.ready = true;
    entry.sequence = st.next_sequence++;
    auto result = entry.instance.ptr;
    --st.in_flight;
    lock.unlock();
    st.changed.notify_all();
    return result;
}

std::shared_ptr<const resolution_plan> scope_access::cached_plan(scope& s,
                                                                 const binding_key& key) {
    std::lock_guard lock(s.impl_->mutex);
    auto it = s.impl_->plans.find(key);
    return it == s.impl_->plans.end() ? nullptr : it->second;
}

std::shared_ptr<const resolution_plan> scope_access::store_plan(
        scope& s, const binding_key& key, std::shared_ptr<const resolution_plan> plan) {
    std::lock_guard lock(s.impl_->mutex);
    if (s.impl_->current != scope::impl::state::open) return plan;
    auto [it, inserted] = s.impl_->plans.try_emplace(key, std::move(plan));
    return it->second;
}

void scope_access::close(scope& s, std::source_location loc) {
    auto& st = *s.impl_;
    released_list released;
    // Outlives the lock: dropping the last reference to a child takes the
    // child's destructor through this scope's mutex.
    std::vector<std::shared_ptr<scope>> alive;
    {
        std::unique_lock lock(st.mutex);
        if (st.current != scope::impl::state::open) {
            throw already_closed(st.name, "close_scope", loc);
        }
        for (const auto& c : st.children) {
            if (auto child = c.ref.lock()) alive.push_back(std::move(child));
        }
        for (const auto& child : alive) {
            if (child->is_open()) {
                throw scope_order_error(st.name, child->name(), loc);
            }
        }
        st.current = scope::impl::state::closing;
        st.changed.wait(lock, [&] { return st.in_flight == 0; });
        released = drain_cache(st);
        st.children.clear();
        st.current = scope::impl::state::closed;
    }
    st.changed.notify_all();

    // Detach from the parent outside our own lock to keep the parent→child
    // lock order.
    if (st.parent) {
        detach_child(*st.parent, &s);
    }

    SCOPEDI_LOG_DEBUG << "closing scope '" << st.name << "', releasing "
                      << released.size() << " instance(s)";

    if (auto failure = release_all(st.name, released)) {
        std::rethrow_exception(failure);
    }
}

} // namespace internal

} // namespace scopedi
