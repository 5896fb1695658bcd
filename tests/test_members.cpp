#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <wheatgrass.hpp>
#include <memory>
#include <string>

using namespace wheatgrass;

namespace {

struct primary {};

struct Config {
    int port = 8080;
};

struct Connection {
    explicit Connection(int p) : port(p) {}
    int port;
};

struct Greeting {
    std::string name = "hello";

    static void describe_members(members<Greeting>& m) {
        m.field("name", &Greeting::name);
    }
};

struct Shared {
    std::shared_ptr<Config> config = std::make_shared<Config>();

    static void describe_members(members<Shared>& m) {
        m.field("config", &Shared::config);
    }
};

struct NullField {
    std::shared_ptr<Config> config;

    static void describe_members(members<NullField>& m) {
        m.field("config", &NullField::config);
    }
};

struct Qualified {
    int port = 9090;

    static void describe_members(members<Qualified>& m) {
        m.field("port", &Qualified::port, qualifiers<primary>);
    }
};

struct Counter {
    int calls = 0;
    std::shared_ptr<provider<int>> next =
        make_provider<int>([this] { return ++calls; });

    static void describe_members(members<Counter>& m) {
        m.field("next", &Counter::next);
    }
};

struct Factories {
    int built = 0;

    std::shared_ptr<Connection> connect(const Config& cfg) {
        ++built;
        return std::make_shared<Connection>(cfg.port);
    }

    std::string label(std::shared_ptr<Connection> c) const {
        return "conn:" + std::to_string(c->port);
    }

    static void describe_members(members<Factories>& m) {
        m.provides("connection", &Factories::connect)
         .provides("label", &Factories::label);
    }
};

struct Owned {
    Config held{1234};

    Config& config() { return held; }

    static void describe_members(members<Owned>& m) {
        m.provides("config", &Owned::config);
    }
};

struct Picker {
    const Config& pick(const Config& cfg) { return cfg; }

    static void describe_members(members<Picker>& m) {
        m.provides("picked", &Picker::pick);
    }
};

struct ExplicitKeys {
    int sum(int a, int b) { return a + b; }

    static void describe_members(members<ExplicitKeys>& m) {
        m.provides("sum", &ExplicitKeys::sum,
                   args(key::named<int>("a"), key::named<int>("b")));
    }
};

struct Numbers {
    int a = 2;
    int b = 40;

    static void describe_members(members<Numbers>& m) {
        m.field("a", &Numbers::a).field("b", &Numbers::b);
    }
};

struct WrongArity {
    int twice(int a) { return 2 * a; }

    static void describe_members(members<WrongArity>& m) {
        m.provides("twice", &WrongArity::twice,
                   args(key::named<int>("a"), key::named<int>("b")));
    }
};

struct WrongType {
    int twice(int a) { return 2 * a; }

    static void describe_members(members<WrongType>& m) {
        m.provides("twice", &WrongType::twice, args(key::named<std::string>("a")));
    }
};

struct Ticket {
    int id;
};

struct TicketDesk {
    int issued = 0;

    std::shared_ptr<provider<Ticket>> tickets() {
        ++issued;
        return make_provider<Ticket>([n = 0]() mutable { return Ticket{++n}; });
    }

    static void describe_members(members<TicketDesk>& m) {
        m.provides("ticket", &TicketDesk::tickets);
    }
};

struct LazyConsumer {
    std::shared_ptr<provider<Config>> seen;

    int consume(std::shared_ptr<provider<Config>> config) {
        seen = config;
        return 0;
    }

    static void describe_members(members<LazyConsumer>& m) {
        m.provides("consumer", &LazyConsumer::consume);
    }
};

struct Ignored {
    void reset() {}
    int add(int a, int b) { return a + b; }
    std::string describe(int) { return {}; }

    static void describe_members(members<Ignored>& m) {
        m.method("reset", &Ignored::reset)
         .method("add", &Ignored::add)
         .method("describe", &Ignored::describe);
    }
};

struct NoSelfDescription {
    std::string tag = "external";
};

} // namespace

namespace wheatgrass {
template <>
struct introspect<NoSelfDescription> {
    static void describe(members<NoSelfDescription>& m) {
        m.field("tag", &NoSelfDescription::tag);
    }
};
} // namespace wheatgrass

TEST_CASE("field value resolves by name", "[members]") {
    auto inj = new_injector().with_members(std::make_shared<Greeting>()).build();
    REQUIRE(*inj->get<std::string>("name") == "hello");
}

TEST_CASE("plain field aliases the field in the owning object", "[members]") {
    auto g = std::make_shared<Greeting>();
    auto inj = new_injector().with_members(g).build();

    auto name = inj->get<std::string>("name");
    REQUIRE(name.get() == &g->name);
    g.reset();
    // The alias keeps the owner alive.
    REQUIRE(*name == "hello");
}

TEST_CASE("shared_ptr field is keyed by its element type", "[members]") {
    auto s = std::make_shared<Shared>();
    auto inj = new_injector().with_members(s).build();

    REQUIRE(inj->get<Config>("config") == s->config);
    REQUIRE(inj->get<Config>()->port == 8080);
}

TEST_CASE("null shared_ptr field is rejected", "[members]") {
    auto builder = new_injector();
    REQUIRE_THROWS_AS(builder.with_members(std::make_shared<NullField>()),
                      configuration_error);
}

TEST_CASE("with_members rejects a null object", "[members]") {
    std::shared_ptr<Greeting> none;
    auto builder = new_injector();
    REQUIRE_THROWS_AS(builder.with_members(none), configuration_error);
}

TEST_CASE("field qualifiers are part of the key", "[members]") {
    auto inj = new_injector().with_members(std::make_shared<Qualified>()).build();

    auto exact = key::named<int>("port").qualified<primary>();
    REQUIRE(*inj->get<int>(exact) == 9090);
    REQUIRE_FALSE(inj->contains(key::named<int>("port")));
    // Unnamed lookups match bindings carrying at least the requested qualifiers.
    REQUIRE(*inj->get<int>(key::of<int>().qualified<primary>()) == 9090);
    REQUIRE(*inj->get<int>() == 9090);
}

TEST_CASE("provider field is bound to the provided type", "[members]") {
    auto c = std::make_shared<Counter>();
    auto inj = new_injector().with_members(c).build();

    REQUIRE(c->calls == 0);
    REQUIRE(*inj->get<int>("next") == 1);
    REQUIRE(*inj->get<int>("next") == 2);
    REQUIRE(inj->get_provider<int>("next") == c->next);
    REQUIRE(c->calls == 2);

    const auto* b = inj->find(key::named<int>("next"));
    REQUIRE(b != nullptr);
    REQUIRE(b->kind == binding_kind::provider);
}

TEST_CASE("provides-method runs once with injected arguments", "[members]") {
    auto f = std::make_shared<Factories>();
    auto inj = new_injector()
        .with_constants(std::make_shared<Config>(Config{7000}))
        .with_members(f)
        .build();

    REQUIRE(f->built == 0);
    auto c1 = inj->get<Connection>("connection");
    auto c2 = inj->get<Connection>("connection");
    REQUIRE(c1 == c2);
    REQUIRE(c1->port == 7000);
    REQUIRE(f->built == 1);

    REQUIRE(*inj->get<std::string>("label") == "conn:7000");
}

TEST_CASE("provides-method returning a reference aliases the owner", "[members]") {
    auto o = std::make_shared<Owned>();
    auto inj = new_injector().with_members(o).build();

    auto cfg = inj->get<Config>("config");
    REQUIRE(cfg.get() == &o->held);
    REQUIRE(cfg->port == 1234);
}

TEST_CASE("reference into an argument outlives the injector", "[members]") {
    auto inj = new_injector()
        .with_constants(std::make_shared<Config>(Config{4321}))
        .with_members(std::make_shared<Picker>())
        .build();

    auto picked = inj->get<Config>("picked");
    REQUIRE(picked.get() == inj->get<Config>().get());

    inj.reset();
    REQUIRE(picked->port == 4321);
}

TEST_CASE("provides-method arguments bind to explicit keys", "[members]") {
    auto inj = new_injector()
        .with_members(std::make_shared<Numbers>(), std::make_shared<ExplicitKeys>())
        .build();
    REQUIRE(*inj->get<int>("sum") == 42);
}

TEST_CASE("explicit keys must match the method signature", "[members]") {
    SECTION("arity") {
        auto builder = new_injector();
        REQUIRE_THROWS_AS(builder.with_members(std::make_shared<WrongArity>()),
                          configuration_error);
    }
    SECTION("type") {
        auto builder = new_injector();
        try {
            builder.with_members(std::make_shared<WrongType>());
            FAIL("expected configuration_error");
        } catch (const configuration_error& e) {
            REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("twice"));
        }
    }
}

TEST_CASE("provides-method returning a provider is a provider binding", "[members]") {
    auto desk = std::make_shared<TicketDesk>();
    auto inj = new_injector().with_members(desk).build();

    REQUIRE(inj->get<Ticket>("ticket")->id == 1);
    REQUIRE(inj->get<Ticket>("ticket")->id == 2);
    // The method itself yields the provider once.
    REQUIRE(desk->issued == 1);

    auto p = inj->get_provider<Ticket>("ticket");
    REQUIRE(p->get()->id == 3);
    REQUIRE(desk->issued == 1);
}

TEST_CASE("provider arguments are injected unevaluated", "[members]") {
    auto consumer = std::make_shared<LazyConsumer>();
    int made = 0;
    struct ConfigSource {
        int* made;
        std::shared_ptr<Config> make() {
            ++*made;
            return std::make_shared<Config>(Config{5});
        }
        static void describe_members(members<ConfigSource>& m) {
            m.provides("config", &ConfigSource::make);
        }
    };
    auto inj = new_injector()
        .with_members(consumer, std::make_shared<ConfigSource>(ConfigSource{&made}))
        .build();

    inj->get<int>("consumer");
    REQUIRE(consumer->seen != nullptr);
    REQUIRE(made == 0);
    REQUIRE(consumer->seen->get()->port == 5);
    REQUIRE(made == 1);
}

TEST_CASE("methods matching no rule are ignored", "[members]") {
    auto inj = new_injector().with_members(std::make_shared<Ignored>()).build();
    REQUIRE(inj->empty());
}

TEST_CASE("introspect can be specialized for foreign types", "[members]") {
    auto inj = new_injector().with_members(std::make_shared<NoSelfDescription>()).build();
    REQUIRE(*inj->get<std::string>("tag") == "external");
}

TEST_CASE("scanned bindings record how they were registered", "[members]") {
    auto inj = new_injector().with_members(std::make_shared<Factories>()).build();

    const auto* b = inj->find(key::named<Connection>("connection"));
    REQUIRE(b != nullptr);
    REQUIRE(b->kind == binding_kind::value);
    REQUIRE_THAT(b->api_name, Catch::Matchers::ContainsSubstring("provides \"connection\""));
    REQUIRE(b->dependencies.size() == 1);
    REQUIRE(b->dependencies[0].target == key::of<Config>());
    REQUIRE_FALSE(b->dependencies[0].deferred);
}
