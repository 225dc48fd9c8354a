#include <catch2/catch_test_macros.hpp>
#include <scopedi.hpp>
#include <memory>
#include <utility>

using namespace scopedi;

// ---------------------------------------------------------------
// Test interfaces and implementations
// ---------------------------------------------------------------

namespace {

struct ISimple {
    virtual ~ISimple() = default;
    virtual int Value() const = 0;
};

struct SimpleImpl : ISimple {
    int Value() const override { return 42; }
};

struct AnotherImpl : ISimple {
    int Value() const override { return 99; }
};

} // namespace

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Registration: register and build succeeds", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto injector = registry.build();
    REQUIRE(injector != nullptr);
    REQUIRE(injector->root_scope()->binds_locally(key_of<ISimple>()));
}

TEST_CASE("Registration: empty registry build succeeds", "[registration]") {
    registry registry;
    auto injector = registry.build();
    REQUIRE(injector != nullptr);
    REQUIRE(injector->root_scope()->is_root());
}

TEST_CASE("Registration: duplicate key throws conflict_error by default", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    REQUIRE(registry.policy() == registration_policy::single);
    REQUIRE_THROWS_AS(
        (registry.add_singleton<ISimple, AnotherImpl>()),
        conflict_error);
}

TEST_CASE("Registration: duplicate across lifetimes still conflicts", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    REQUIRE_THROWS_AS(
        (registry.add_transient<ISimple, AnotherImpl>()),
        conflict_error);
}

TEST_CASE("Registration: replace policy keeps the last registration", "[registration]") {
    registry registry(registration_policy::replace);
    registry.add_singleton<ISimple, SimpleImpl>();
    registry.add_singleton<ISimple, AnotherImpl>();
    REQUIRE(registry.bindings().size() == 1);

    auto injector = registry.build();
    REQUIRE(injector->resolve<ISimple>()->Value() == 99);
}

TEST_CASE("Registration: skip policy keeps the first registration", "[registration]") {
    registry registry(registration_policy::skip);
    registry.add_singleton<ISimple, SimpleImpl>();
    registry.add_singleton<ISimple, AnotherImpl>();
    REQUIRE(registry.bindings().size() == 1);

    auto injector = registry.build();
    REQUIRE(injector->resolve<ISimple>()->Value() == 42);
}

TEST_CASE("Registration: bindings are recorded in registration order", "[registration]") {
    struct IOther {
        virtual ~IOther() = default;
    };
    struct Other : IOther {};

    registry registry;
    registry.add_transient<IOther, Other>();
    registry.add_singleton<ISimple, SimpleImpl>();

    const auto& bindings = registry.bindings();
    REQUIRE(bindings.size() == 2);
    REQUIRE(bindings[0].key == key_of<IOther>());
    REQUIRE(bindings[0].lifetime == lifetime_kind::transient);
    REQUIRE(bindings[0].sequence == 0);
    REQUIRE(bindings[1].key == key_of<ISimple>());
    REQUIRE(bindings[1].lifetime == lifetime_kind::singleton);
    REQUIRE(bindings[1].sequence == 1);
    REQUIRE(bindings[1].impl_type == std::type_index(typeid(SimpleImpl)));
    REQUIRE(bindings[1].api_name == "add_singleton");
}

TEST_CASE("Registration: factory binding", "[registration]") {
    registry registry;
    registry.add_factory<ISimple>(lifetime_kind::singleton, deps<>,
                                  [] { return std::make_shared<AnotherImpl>(); });
    auto injector = registry.build();

    auto a = injector->resolve<ISimple>();
    auto b = injector->resolve<ISimple>();
    REQUIRE(a->Value() == 99);
    REQUIRE(a.get() == b.get());
}

TEST_CASE("Registration: pre-built instance binding", "[registration]") {
    auto prebuilt = std::make_shared<SimpleImpl>();

    registry registry;
    registry.add_instance<ISimple>(prebuilt);
    auto injector = registry.build();

    auto resolved = injector->resolve<ISimple>();
    REQUIRE(resolved.get() == static_cast<ISimple*>(prebuilt.get()));
}

TEST_CASE("Registration: null instance is rejected", "[registration]") {
    registry registry;
    REQUIRE_THROWS_AS(
        registry.add_instance<ISimple>(std::shared_ptr<SimpleImpl>{}),
        di_error);
}

TEST_CASE("Registration: cannot register after build", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto injector = registry.build();

    auto fn = [&]{ registry.add_transient<ISimple, AnotherImpl>(); };
    REQUIRE_THROWS_AS(fn(), di_error);
}

TEST_CASE("Registration: cannot build twice", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto injector = registry.build();

    REQUIRE_THROWS_AS(
        registry.build(),
        di_error);
}

TEST_CASE("Registration: registry consumed by open_scope cannot be reused", "[registration]") {
    registry root;
    auto injector = root.build();

    registry child;
    child.add_scoped<ISimple, SimpleImpl>();
    auto scope = injector->open_scope(injector->root_scope(), "child", std::move(child));
    REQUIRE(scope->binds_locally(key_of<ISimple>()));

    auto fn = [&]{ child.add_scoped<ISimple, AnotherImpl>(); };
    REQUIRE_THROWS_AS(fn(), di_error);
}

TEST_CASE("Registration: moved-from registry rejects further use", "[registration]") {
    registry source(registration_policy::replace);
    source.add_singleton<ISimple, SimpleImpl>();

    registry target = std::move(source);
    REQUIRE(target.policy() == registration_policy::replace);
    REQUIRE(target.bindings().size() == 1);

    auto add = [&]{ source.add_singleton<ISimple, AnotherImpl>(); };
    REQUIRE_THROWS_AS(add(), di_error);
    REQUIRE_THROWS_AS(source.policy(), di_error);
    REQUIRE_THROWS_AS(source.bindings(), di_error);
    REQUIRE_THROWS_AS(source.build(), di_error);
}
