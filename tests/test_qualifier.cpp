#include <catch2/catch_test_macros.hpp>
#include <scopedi.hpp>
#include <memory>
#include <string>

using namespace scopedi;

// ---------------------------------------------------------------
// Test interfaces
// ---------------------------------------------------------------

namespace {

struct IDatabase {
    virtual ~IDatabase() = default;
    virtual std::string Role() const = 0;
};
struct PrimaryDb : IDatabase {
    std::string Role() const override { return "primary"; }
};
struct ReplicaDb : IDatabase {
    std::string Role() const override { return "replica"; }
};

struct IReport {
    virtual ~IReport() = default;
};
struct Report : IReport {
    Report(std::shared_ptr<IDatabase> w, std::shared_ptr<IDatabase> r)
        : writer(std::move(w)), reader(std::move(r)) {}
    std::shared_ptr<IDatabase> writer;
    std::shared_ptr<IDatabase> reader;
};

} // namespace

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Qualifier: qualified and unqualified bindings coexist", "[qualifier]") {
    registry registry;
    registry.add_singleton<IDatabase, PrimaryDb>();
    registry.add_singleton<IDatabase, ReplicaDb>("replica");
    auto injector = registry.build();

    REQUIRE(injector->resolve<IDatabase>()->Role() == "primary");
    REQUIRE(injector->resolve<IDatabase>(injector->root_scope(), "replica")->Role()
            == "replica");
    REQUIRE(injector->resolve<IDatabase>().get()
            != injector->resolve<IDatabase>(injector->root_scope(), "replica").get());
}

TEST_CASE("Qualifier: named<> dependency selects the qualified binding", "[qualifier]") {
    registry registry;
    registry.add_singleton<IDatabase, PrimaryDb>();
    registry.add_singleton<IDatabase, ReplicaDb>("replica");
    registry.add_transient<IReport, Report>(deps<IDatabase, named<IDatabase, "replica">>);
    auto injector = registry.build();

    auto report = std::static_pointer_cast<Report>(injector->resolve<IReport>());
    REQUIRE(report->writer->Role() == "primary");
    REQUIRE(report->reader->Role() == "replica");
}

TEST_CASE("Qualifier: same qualifier twice conflicts", "[qualifier]") {
    registry registry;
    registry.add_singleton<IDatabase, ReplicaDb>("replica");
    REQUIRE_THROWS_AS(
        (registry.add_transient<IDatabase, PrimaryDb>("replica")),
        conflict_error);
}

TEST_CASE("Qualifier: missing qualified binding is unbound", "[qualifier]") {
    registry registry;
    registry.add_singleton<IDatabase, PrimaryDb>();
    auto injector = registry.build();

    REQUIRE_THROWS_AS(
        injector->resolve<IDatabase>(injector->root_scope(), "replica"),
        unbound_key_error);
    REQUIRE(injector->try_resolve<IDatabase>(injector->root_scope(), "replica") == nullptr);
}

TEST_CASE("Qualifier: qualified factory and instance bindings", "[qualifier]") {
    auto replica = std::make_shared<ReplicaDb>();

    registry registry;
    registry.add_instance<IDatabase>("replica", replica);
    registry.add_factory<IDatabase>("primary", lifetime_kind::scoped, deps<>,
                                    [] { return std::make_shared<PrimaryDb>(); });
    auto injector = registry.build();

    auto scope = injector->open_scope(injector->root_scope(), "request");
    REQUIRE(injector->resolve<IDatabase>(scope, "replica").get() == replica.get());
    REQUIRE(injector->resolve<IDatabase>(scope, "primary")->Role() == "primary");
    REQUIRE(injector->try_resolve<IDatabase>(scope) == nullptr);
    injector->close_scope(scope);
}

TEST_CASE("Qualifier: key formatting shows the qualifier", "[qualifier]") {
    auto plain = to_string(key_of<IDatabase>());
    auto qualified = to_string(key_of<IDatabase>("replica"));

    REQUIRE(plain.find("IDatabase") != std::string::npos);
    REQUIRE(plain.find('[') == std::string::npos);
    REQUIRE(qualified.find("[\"replica\"]") != std::string::npos);
    REQUIRE(key_of<IDatabase>() != key_of<IDatabase>("replica"));
    REQUIRE(key_of<IDatabase>() < key_of<IDatabase>("replica"));
}
