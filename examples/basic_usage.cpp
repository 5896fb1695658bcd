/// basic_usage.cpp: wheatgrass introductory example.
///
/// Demonstrates the core builder → build → resolve workflow:
///   1. Bind constants by runtime class or by an explicit base type.
///   2. Expose an object's fields and provides-methods through
///      describe_members().
///   3. Compose a child context into the root injector.
///   4. Resolve values (cached) and providers (fresh on every get()).

#include <wheatgrass.hpp>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

using namespace wheatgrass;

// -----------------------------------------------------------------------
// Domain interfaces
// -----------------------------------------------------------------------

struct i_logger {
    virtual ~i_logger() = default;
    virtual void log(const std::string& message) = 0;
};

struct i_greeter {
    virtual ~i_greeter() = default;
    virtual std::string greet(const std::string& name) = 0;
};

struct request_id {
    int value;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::cout << "[LOG] " << message << '\n';
    }
};

struct greeter : i_greeter {
    greeter(std::shared_ptr<i_logger> logger, std::string salutation)
        : logger_(std::move(logger)), salutation_(std::move(salutation)) {}

    std::string greet(const std::string& name) override {
        const auto msg = salutation_ + ", " + name + '!';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
    std::string salutation_;
};

// -----------------------------------------------------------------------
// A module: fields and provides-methods exposed to the injector
// -----------------------------------------------------------------------

struct greeting_module {
    std::string salutation = "Hello";
    std::shared_ptr<provider<request_id>> next_request =
        make_provider<request_id>([n = 0]() mutable { return request_id{++n}; });

    std::shared_ptr<i_greeter> make_greeter(std::shared_ptr<i_logger> logger,
                                            const std::string& text) {
        return std::make_shared<greeter>(std::move(logger), text);
    }

    static void describe_members(members<greeting_module>& m) {
        m.field("salutation", &greeting_module::salutation)
         .field("request", &greeting_module::next_request)
         .provides("greeter", &greeting_module::make_greeter,
                   args(key::of<i_logger>(), key::named<std::string>("salutation")));
    }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // ── A child context with the logger bound to its interface ────────
    auto logging = new_injector()
        .with_constant<i_logger>(std::make_shared<console_logger>())
        .build_context();

    // ── The root injector ─────────────────────────────────────────────
    auto inj = new_injector()
        .with_context(logging)
        .with_members(std::make_shared<greeting_module>())
        .build();

    // ── Resolution phase ──────────────────────────────────────────────

    // Provides-methods run once; the value is cached.
    const auto g1 = inj->get<i_greeter>("greeter");
    const auto g2 = inj->get<i_greeter>("greeter");
    assert(g1.get() == g2.get() && "value bindings return the same instance");
    std::cout << g1->greet("World") << '\n';

    // Provider fields run on every resolution.
    const auto r1 = inj->get<request_id>("request");
    const auto r2 = inj->get<request_id>("request");
    assert(r1->value != r2->value);
    std::cout << "Request ids: " << r1->value << ", " << r2->value << '\n';

    // The provider itself is handed out unevaluated.
    auto requests = inj->get_provider<request_id>("request");
    std::cout << "Next request id: " << requests->get()->value << '\n';

    std::cout << "Done.\n";
    return 0;
}
