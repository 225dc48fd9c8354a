#include <catch2/catch_test_macros.hpp>
#include <scopedi.hpp>
#include <memory>
#include <vector>

using namespace scopedi;

// ---------------------------------------------------------------
// Test interfaces: IApp -> {IRepo, ICache} -> IConfig
// ---------------------------------------------------------------

namespace {

struct IConfig {
    virtual ~IConfig() = default;
};
struct Config : IConfig {};

struct IRepo {
    virtual ~IRepo() = default;
};
struct Repo : IRepo {
    explicit Repo(std::shared_ptr<IConfig>) {}
};

struct ICache {
    virtual ~ICache() = default;
};
struct Cache : ICache {
    explicit Cache(std::shared_ptr<IConfig>) {}
};

struct IApp {
    virtual ~IApp() = default;
};
struct App : IApp {
    App(std::shared_ptr<IRepo>, std::shared_ptr<ICache>) {}
};

struct ICounted {
    virtual ~ICounted() = default;
};
struct Counted : ICounted {
    static inline int instances = 0;
    Counted() { ++instances; }
};

void register_diamond(registry& registry, lifetime_kind config_lifetime) {
    switch (config_lifetime) {
        case lifetime_kind::singleton: registry.add_singleton<IConfig, Config>(); break;
        case lifetime_kind::scoped:    registry.add_scoped<IConfig, Config>(); break;
        case lifetime_kind::transient: registry.add_transient<IConfig, Config>(); break;
    }
    registry.add_singleton<IRepo, Repo>(deps<IConfig>);
    registry.add_singleton<ICache, Cache>(deps<IConfig>);
    registry.add_singleton<IApp, App>(deps<IRepo, ICache>);
}

} // namespace

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Plan: dependencies precede their dependents", "[plan]") {
    registry registry;
    register_diamond(registry, lifetime_kind::singleton);
    auto injector = registry.build();

    auto plan = injector->build_plan(key_of<IApp>(), injector->root_scope());
    REQUIRE(plan->root == key_of<IApp>());
    REQUIRE(plan->construction_order() == std::vector<binding_key>{
        key_of<IConfig>(), key_of<IRepo>(), key_of<ICache>(), key_of<IApp>()});

    for (std::size_t i = 0; i < plan->steps.size(); ++i) {
        for (const auto& input : plan->steps[i].inputs) {
            REQUIRE_FALSE(input.is_deferred());
            REQUIRE(input.step < i);
        }
    }
}

TEST_CASE("Plan: shared singleton appears once", "[plan]") {
    registry registry;
    register_diamond(registry, lifetime_kind::singleton);
    auto injector = registry.build();

    auto plan = injector->build_plan(key_of<IApp>(), injector->root_scope());
    REQUIRE(plan->size() == 4);
    REQUIRE(plan->steps[1].inputs[0].step == plan->steps[2].inputs[0].step);
}

TEST_CASE("Plan: transient dependency gets one step per injection point", "[plan]") {
    registry registry;
    register_diamond(registry, lifetime_kind::transient);
    auto injector = registry.build();

    auto plan = injector->build_plan(key_of<IApp>(), injector->root_scope());
    REQUIRE(plan->construction_order() == std::vector<binding_key>{
        key_of<IConfig>(), key_of<IRepo>(), key_of<IConfig>(), key_of<ICache>(),
        key_of<IApp>()});
    REQUIRE(plan->steps[0].cache_owner == nullptr);
}

TEST_CASE("Plan: cache owner follows the lifetime", "[plan]") {
    registry registry;
    register_diamond(registry, lifetime_kind::scoped);
    auto injector = registry.build();

    auto scope = injector->open_scope(injector->root_scope(), "request");
    auto plan = injector->build_plan(key_of<ICache>(), scope);

    REQUIRE(plan->size() == 2);
    // Singleton cache lives where the binding is registered...
    REQUIRE(plan->steps[1].cache_owner == injector->root_scope().get());
    // ...and a singleton looks up its dependencies from there too.
    REQUIRE(plan->steps[0].cache_owner == injector->root_scope().get());

    injector->close_scope(scope);
}

TEST_CASE("Plan: plans are memoised per scope", "[plan]") {
    registry registry;
    register_diamond(registry, lifetime_kind::singleton);
    auto injector = registry.build();

    auto scope = injector->open_scope(injector->root_scope(), "request");

    auto a = injector->build_plan(key_of<IApp>(), injector->root_scope());
    auto b = injector->build_plan(key_of<IApp>(), injector->root_scope());
    auto c = injector->build_plan(key_of<IApp>(), scope);
    REQUIRE(a.get() == b.get());
    REQUIRE(a.get() != c.get());
    REQUIRE(a->construction_order() == c->construction_order());

    injector->close_scope(scope);
}

TEST_CASE("Plan: ordering is identical across identical registries", "[plan]") {
    auto build_order = [] {
        registry registry;
        register_diamond(registry, lifetime_kind::transient);
        auto injector = registry.build();
        return injector->build_plan(key_of<IApp>(), injector->root_scope())
            ->construction_order();
    };

    auto first = build_order();
    for (int i = 0; i < 5; ++i) {
        REQUIRE(build_order() == first);
    }
}

TEST_CASE("Plan: building a plan constructs nothing", "[plan]") {
    registry registry;
    registry.add_singleton<ICounted, Counted>();
    auto injector = registry.build({.validate_on_build = false});

    auto plan = injector->build_plan(key_of<ICounted>(), injector->root_scope());
    REQUIRE(plan->size() == 1);
    REQUIRE(Counted::instances == 0);
    REQUIRE(injector->root_scope()->cached_count() == 0);
}

TEST_CASE("Plan: unbound root key throws unbound_key_error", "[plan]") {
    registry registry;
    auto injector = registry.build();

    REQUIRE_THROWS_AS(
        injector->build_plan(key_of<IApp>(), injector->root_scope()),
        unbound_key_error);
}

TEST_CASE("Plan: provider dependency is an input but not a step", "[plan]") {
    struct ILazy {
        virtual ~ILazy() = default;
    };
    struct Lazy : ILazy {
        explicit Lazy(provider_fn<IConfig>) {}
    };

    registry registry;
    registry.add_singleton<IConfig, Config>();
    registry.add_transient<ILazy, Lazy>(deps<provider<IConfig>>);
    auto injector = registry.build();

    auto plan = injector->build_plan(key_of<ILazy>(), injector->root_scope());
    REQUIRE(plan->size() == 1);
    REQUIRE(plan->steps[0].inputs.size() == 1);
    REQUIRE(plan->steps[0].inputs[0].is_deferred());
    REQUIRE(plan->steps[0].inputs[0].key == key_of<IConfig>());
}
