#include <catch2/catch_test_macros.hpp>
#include <scopedi.hpp>
#include <memory>
#include <stdexcept>

namespace {

struct IA {
    virtual ~IA() = default;
};
struct A : IA {};

struct IB {
    virtual ~IB() = default;
};
struct B : IB {
    explicit B(std::shared_ptr<IA> /*a*/) {}
};

// Cyclic: X depends on Y depends on X
struct IX {
    virtual ~IX() = default;
};
struct IY {
    virtual ~IY() = default;
};
struct X : IX {
    static inline int constructed = 0;
    explicit X(std::shared_ptr<IY> /*y*/) { ++constructed; }
};
struct Y : IY {
    static inline int constructed = 0;
    explicit Y(std::shared_ptr<IX> /*x*/) { ++constructed; }
};

} // namespace

TEST_CASE("missing dependency detected", "[validation]") {
    scopedi::registry reg;
    // B depends on IA but IA is not registered
    reg.add_singleton<IB, B>(scopedi::deps<IA>);
    REQUIRE_THROWS_AS(reg.build(), scopedi::unbound_key_error);
}

TEST_CASE("all deps satisfied passes validation", "[validation]") {
    scopedi::registry reg;
    reg.add_singleton<IA, A>();
    reg.add_singleton<IB, B>(scopedi::deps<IA>);
    REQUIRE_NOTHROW(reg.build());
}

TEST_CASE("registration order does not matter", "[validation]") {
    scopedi::registry reg;
    reg.add_singleton<IB, B>(scopedi::deps<IA>);
    reg.add_singleton<IA, A>();
    REQUIRE_NOTHROW(reg.build());
}

TEST_CASE("cycle detected", "[validation]") {
    scopedi::registry reg;
    reg.add_singleton<IX, X>(scopedi::deps<IY>);
    reg.add_singleton<IY, Y>(scopedi::deps<IX>);
    REQUIRE_THROWS_AS(reg.build(), scopedi::cyclic_dependency);
}

TEST_CASE("cycle detected before any provider runs", "[validation]") {
    X::constructed = 0;
    Y::constructed = 0;

    scopedi::registry reg;
    reg.add_transient<IX, X>(scopedi::deps<IY>);
    reg.add_transient<IY, Y>(scopedi::deps<IX>);
    auto injector = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(injector->resolve<IX>(), scopedi::cyclic_dependency);
    REQUIRE(X::constructed == 0);
    REQUIRE(Y::constructed == 0);
}

TEST_CASE("self dependency is a cycle", "[validation]") {
    struct ISelf {
        virtual ~ISelf() = default;
    };
    struct Self : ISelf {
        explicit Self(std::shared_ptr<ISelf> /*self*/) {}
    };

    scopedi::registry reg;
    reg.add_transient<ISelf, Self>(scopedi::deps<ISelf>);
    REQUIRE_THROWS_AS(reg.build(), scopedi::cyclic_dependency);
}

TEST_CASE("validation can be disabled", "[validation]") {
    scopedi::registry reg;
    reg.add_singleton<IB, B>(scopedi::deps<IA>);
    auto injector = reg.build({.validate_on_build = false});

    REQUIRE(injector != nullptr);
    REQUIRE_THROWS_AS(injector->resolve<IB>(), scopedi::unbound_key_error);
}

TEST_CASE("lifetime mismatch: singleton depends on transient", "[validation]") {
    struct ISingleton {
        virtual ~ISingleton() = default;
    };
    struct ITransient {
        virtual ~ITransient() = default;
    };
    struct TransientImpl : ITransient {};
    struct SingletonImpl : ISingleton {
        explicit SingletonImpl(std::shared_ptr<ITransient> /*t*/) {}
    };

    scopedi::registry reg;
    reg.add_transient<ITransient, TransientImpl>();
    reg.add_singleton<ISingleton, SingletonImpl>(scopedi::deps<ITransient>);
    REQUIRE_THROWS_AS(
        reg.build({.validate_lifetimes = true}),
        scopedi::lifetime_mismatch);
}

TEST_CASE("lifetime mismatch: singleton depends on scoped", "[validation]") {
    struct IScoped {
        virtual ~IScoped() = default;
    };
    struct ScopedImpl : IScoped {};
    struct ISingleton {
        virtual ~ISingleton() = default;
    };
    struct SingletonImpl : ISingleton {
        explicit SingletonImpl(std::shared_ptr<IScoped> /*s*/) {}
    };

    scopedi::registry reg;
    reg.add_scoped<IScoped, ScopedImpl>();
    reg.add_singleton<ISingleton, SingletonImpl>(scopedi::deps<IScoped>);

    try {
        reg.build({.validate_lifetimes = true});
        FAIL("Expected lifetime_mismatch");
    } catch (const scopedi::lifetime_mismatch& e) {
        REQUIRE(e.consumer() == scopedi::key_of<ISingleton>());
        REQUIRE(e.dependency() == scopedi::key_of<IScoped>());
    }
}

TEST_CASE("lifetime mismatch is off by default", "[validation]") {
    struct ITransient {
        virtual ~ITransient() = default;
    };
    struct TransientImpl : ITransient {};
    struct ISingleton {
        virtual ~ISingleton() = default;
    };
    struct SingletonImpl : ISingleton {
        explicit SingletonImpl(std::shared_ptr<ITransient> /*t*/) {}
    };

    scopedi::registry reg;
    reg.add_transient<ITransient, TransientImpl>();
    reg.add_singleton<ISingleton, SingletonImpl>(scopedi::deps<ITransient>);
    REQUIRE_NOTHROW(reg.build());
}

TEST_CASE("child scope is validated when opened", "[validation]") {
    scopedi::registry reg;
    auto injector = reg.build();

    scopedi::registry child;
    child.add_scoped<IB, B>(scopedi::deps<IA>);
    REQUIRE_THROWS_AS(
        injector->open_scope(injector->root_scope(), "child", std::move(child)),
        scopedi::unbound_key_error);

    // The rejected scope does not block closing the root.
    REQUIRE(injector->root_scope()->is_open());
    auto other = injector->open_scope(injector->root_scope(), "other");
    injector->close_scope(other);
}

TEST_CASE("child scope may depend on parent bindings", "[validation]") {
    scopedi::registry reg;
    reg.add_singleton<IA, A>();
    auto injector = reg.build();

    scopedi::registry child;
    child.add_scoped<IB, B>(scopedi::deps<IA>);
    auto scope = injector->open_scope(injector->root_scope(), "child", std::move(child));
    REQUIRE(injector->resolve<IB>(scope) != nullptr);
    injector->close_scope(scope);
}

TEST_CASE("root binding whose dependency lives only in a child scope is rejected",
          "[validation]") {
    scopedi::registry reg;
    reg.add_scoped<IB, B>(scopedi::deps<IA>);
    REQUIRE_THROWS_AS(reg.build(), scopedi::unbound_key_error);

    scopedi::registry lenient;
    lenient.add_scoped<IB, B>(scopedi::deps<IA>);
    auto injector = lenient.build({.validate_on_build = false});

    scopedi::registry child;
    child.add_scoped<IA, A>();
    auto scope = injector->open_scope(injector->root_scope(), "child", std::move(child));
    REQUIRE(injector->resolve<IB>(scope) != nullptr);
    injector->close_scope(scope);
}

TEST_CASE("eager singleton failure surfaces from build", "[validation]") {
    struct IBroken {
        virtual ~IBroken() = default;
    };
    struct Broken : IBroken {
        Broken() { throw std::runtime_error("cannot start"); }
    };

    scopedi::registry reg;
    reg.add_singleton<IBroken, Broken>();
    REQUIRE_THROWS_AS(reg.build({.eager_singletons = true}), scopedi::provider_failure);
}
