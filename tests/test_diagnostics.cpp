#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <wheatgrass.hpp>
#include <memory>
#include <stdexcept>
#include <string>

using namespace wheatgrass;

namespace {

struct IService {
    virtual ~IService() = default;
};
struct ServiceImpl : IService {};

struct Engine {};
struct Car {
    std::shared_ptr<Engine> engine;
};

struct Garage {
    std::shared_ptr<Engine> engine() { throw std::runtime_error("engine on fire"); }
    std::shared_ptr<Car> car(std::shared_ptr<Engine> e) {
        return std::make_shared<Car>(Car{std::move(e)});
    }

    static void describe_members(members<Garage>& m) {
        m.provides("engine", &Garage::engine).provides("car", &Garage::car);
    }
};

struct Parts {
    std::shared_ptr<Car> car(std::shared_ptr<Engine> e) {
        return std::make_shared<Car>(Car{std::move(e)});
    }

    static void describe_members(members<Parts>& m) {
        m.provides("car", &Parts::car);
    }
};

struct Pair {
    std::string left = "L";
    std::string right = "R";

    static void describe_members(members<Pair>& m) {
        m.field("left", &Pair::left).field("right", &Pair::right);
    }
};

std::size_t count_arrows(const std::string& msg) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while ((pos = msg.find(" -> ", pos)) != std::string::npos) {
        ++count;
        pos += 4;
    }
    return count;
}

} // namespace

TEST_CASE("unresolved_binding includes type name", "[diagnostics]") {
    auto inj = new_injector().build();
    try {
        inj->get<IService>();
        FAIL("Expected unresolved_binding");
    } catch (const unresolved_binding& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("IService"));
    }
}

TEST_CASE("unresolved_binding lists bindings of the same type", "[diagnostics]") {
    auto inj = new_injector().with_members(std::make_shared<Pair>()).build();
    try {
        inj->get<std::string>("middle");
        FAIL("Expected unresolved_binding");
    } catch (const unresolved_binding& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("bindings of this type exist under"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("name=\"left\""));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("name=\"right\""));
    }
}

TEST_CASE("duplicate_binding includes type name", "[diagnostics]") {
    auto builder = new_injector();
    builder.with_constant<IService>(std::make_shared<ServiceImpl>())
           .with_constant<IService>(std::make_shared<ServiceImpl>());
    try {
        builder.build({.collisions = collision_policy::reject});
        FAIL("Expected duplicate_binding");
    } catch (const duplicate_binding& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("IService"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::StartsWith("Configuration error"));
    }
}

TEST_CASE("cyclic_binding message format is correct", "[diagnostics]") {
    struct X {};
    struct Y {};
    struct Knot {
        X x(const Y&) { return {}; }
        Y y(const X&) { return {}; }

        static void describe_members(members<Knot>& m) {
            m.provides("x", &Knot::x).provides("y", &Knot::y);
        }
    };

    auto builder = new_injector();
    builder.with_members(std::make_shared<Knot>());
    try {
        builder.build({.validate_on_build = true});
        FAIL("Expected cyclic_binding");
    } catch (const cyclic_binding& e) {
        // Cycle path is [x -> y -> x], not [x -> y -> x -> x]
        REQUIRE(e.cycle().size() == 3);
        REQUIRE(count_arrows(e.what()) == 2);
    }
}

TEST_CASE("foreign exceptions are wrapped in resolution_error", "[diagnostics]") {
    auto inj = new_injector().with_members(std::make_shared<Garage>()).build();
    try {
        inj->get<Engine>("engine");
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE(e.bound_key() == key::named<Engine>("engine"));
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("engine on fire"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("registered at"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("test_diagnostics.cpp"));
    }
}

TEST_CASE("errors carry the chain of keys being resolved", "[diagnostics]") {
    auto inj = new_injector().with_members(std::make_shared<Garage>()).build();
    try {
        inj->get<Car>("car");
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("(while resolving"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("Car (name=\"car\")"));
    }
}

TEST_CASE("resolution chain lists keys innermost first", "[diagnostics]") {
    struct Wheel {};
    struct Axle {
        std::shared_ptr<Wheel> wheel;
    };
    struct Workshop {
        std::shared_ptr<Axle> axle(std::shared_ptr<Wheel> w) {
            return std::make_shared<Axle>(Axle{std::move(w)});
        }
        std::shared_ptr<Car> car(std::shared_ptr<Axle>) { return std::make_shared<Car>(); }

        static void describe_members(members<Workshop>& m) {
            m.provides("axle", &Workshop::axle).provides("car", &Workshop::car);
        }
    };

    auto inj = new_injector().with_members(std::make_shared<Workshop>()).build();
    try {
        inj->get<Car>("car");
        FAIL("Expected unresolved_binding");
    } catch (const unresolved_binding& e) {
        REQUIRE(e.requested_key() == key::of<Wheel>());
        REQUIRE(e.resolution_chain().size() == 2);
        REQUIRE(e.resolution_chain()[0] == key::named<Axle>("axle"));
        REQUIRE(e.resolution_chain()[1] == key::named<Car>("car"));

        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::EndsWith(
            "(while resolving " + e.resolution_chain()[0].to_string()
            + " -> " + e.resolution_chain()[1].to_string() + ")"));
        // what() is stable across calls.
        REQUIRE(msg == e.what());
    }
}

TEST_CASE("what() is the bare message without a resolution chain", "[diagnostics]") {
    unresolved_binding e(key::of<Engine>());
    REQUIRE(e.resolution_chain().empty());
    REQUIRE_THAT(std::string(e.what()), !Catch::Matchers::ContainsSubstring("while resolving"));
}

TEST_CASE("missing dependency at resolution names the dependent key", "[diagnostics]") {
    auto inj = new_injector().with_members(std::make_shared<Parts>()).build();
    try {
        inj->get<Car>("car");
        FAIL("Expected unresolved_binding");
    } catch (const unresolved_binding& e) {
        REQUIRE(e.requested_key() == key::of<Engine>());
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("while resolving"));
    }
}

TEST_CASE("full_diagnostic starts with what()", "[diagnostics]") {
    auto inj = new_injector().build();
    try {
        inj->get<IService>();
        FAIL("Expected unresolved_binding");
    } catch (const wheatgrass_error& e) {
        REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::StartsWith(e.what()));
    }
}

TEST_CASE("configuration errors report the call site", "[diagnostics]") {
    std::shared_ptr<ServiceImpl> none;
    auto builder = new_injector();
    try {
        builder.with_constant<IService>(none);
        FAIL("Expected configuration_error");
    } catch (const configuration_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("test_diagnostics.cpp"));
        REQUIRE(std::string(e.location().file_name()).find("test_diagnostics.cpp")
                != std::string::npos);
    }
}

TEST_CASE("binding_kind names", "[diagnostics]") {
    REQUIRE(to_string(binding_kind::value) == "value");
    REQUIRE(to_string(binding_kind::provider) == "provider");
}
