/// basic_usage.cpp: scopedi introductory example.
///
/// Demonstrates the core registration → build → resolve workflow:
///   1. Define interfaces and implementations (no framework base classes).
///   2. Register with lifetime, dependencies declared via deps<>.
///   3. Call build() to validate the dependency graph.
///   4. Resolve by interface; open scopes for per-order instances.

#include <scopedi.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace scopedi;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_lettuce {
    virtual ~i_lettuce() = default;
    virtual std::string name() const = 0;
};

struct i_bacon {
    virtual ~i_bacon() = default;
    virtual std::string name() const = 0;
};

struct i_sandwich {
    virtual ~i_sandwich() = default;
    virtual std::string describe() const = 0;
};

struct i_order {
    virtual ~i_order() = default;
    virtual int number() const = 0;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct lettuce : i_lettuce {
    std::string name() const override { return "lettuce"; }
};

struct bacon : i_bacon {
    std::string name() const override { return "bacon"; }
};

struct blt : i_sandwich {
    blt(std::shared_ptr<i_lettuce> l, std::shared_ptr<i_bacon> b)
        : lettuce_(std::move(l)), bacon_(std::move(b)) {}

    std::string describe() const override {
        return "BLT with " + lettuce_->name() + " and " + bacon_->name();
    }

private:
    std::shared_ptr<i_lettuce> lettuce_;
    std::shared_ptr<i_bacon> bacon_;
};

struct order : i_order {
    inline static int counter = 0;
    int number_;

    order() : number_(++counter) {}

    int number() const override { return number_; }

    void on_release() {
        std::cout << "order #" << number_ << " released\n";
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // ── Registration phase ────────────────────────────────────────────
    registry reg;

    reg.add_singleton<i_lettuce, lettuce>();
    reg.add_singleton<i_bacon, bacon>();

    // blt: transient, a fresh sandwich each time, sharing the singletons.
    reg.add_transient<i_sandwich, blt>(deps<i_lettuce, i_bacon>);

    // order: scoped, one instance per open scope.
    reg.add_scoped<i_order, order>();

    // ── Build phase (validates dependency graph) ──────────────────────
    auto inj = reg.build();

    // ── Resolution phase ──────────────────────────────────────────────
    const auto s1 = inj->resolve<i_sandwich>();
    const auto s2 = inj->resolve<i_sandwich>();
    assert(s1.get() != s2.get() && "transient must return a new instance");
    std::cout << s1->describe() << '\n';

    auto plan = inj->build_plan(key_of<i_sandwich>(), inj->root_scope());
    for (const auto& key : plan->construction_order()) {
        std::cout << "  step: " << to_string(key) << '\n';
    }

    {
        auto table1 = inj->enter_scope(inj->root_scope(), "table-1");
        auto table2 = inj->enter_scope(inj->root_scope(), "table-2");

        const auto o1a = inj->resolve<i_order>(table1.handle());
        const auto o1b = inj->resolve<i_order>(table1.handle());
        const auto o2  = inj->resolve<i_order>(table2.handle());

        // Same scope → same instance.
        assert(o1a.get() == o1b.get());
        // Sibling scopes → different instances.
        assert(o1a.get() != o2.get());

        std::cout << "table-1 order: " << o1a->number() << '\n';
        std::cout << "table-2 order: " << o2->number() << '\n';
    }
    // Guards closed both scopes here; on_release() ran for each order.

    std::cout << "Done.\n";
    return 0;
}
