#include <catch2/catch_test_macros.hpp>
#include <depsolve.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace depsolve;

namespace {

struct ILogger {
    virtual ~ILogger() = default;
    virtual std::string tag() const = 0;
};
struct ConsoleLogger : ILogger {
    std::string tag() const override { return "console"; }
};

struct Settings {
    int port = 0;
    explicit Settings(int p) : port(p) {}
};

struct Server {
    std::shared_ptr<ILogger> logger;
    std::shared_ptr<Settings> settings;
};

argument_list args_of(std::vector<instance> values) {
    return argument_list(std::move(values));
}

} // namespace

TEST_CASE("builder: key, scope and sharing come from the options", "[builder]") {
    auto d = make_dependant<ILogger, ConsoleLogger>(
        [] { return std::make_shared<ConsoleLogger>(); },
        {.name = "audit", .scope = "app", .shared = false});

    REQUIRE(d->id == key::of<ILogger>("audit"));
    REQUIRE(d->scope == "app");
    REQUIRE_FALSE(d->shared);
    REQUIRE(d->parameters.empty());
}

TEST_CASE("builder: definition site is recorded", "[builder]") {
    auto d = make_dependant<Server>([] { return Server{}; });
    REQUIRE(d->location.line() > 0);
    REQUIRE(std::string(d->location.file_name()).find("test_builder") != std::string::npos);
}

TEST_CASE("builder: parameters follow the declared order", "[builder]") {
    auto d = make_dependant<Server>(deps<ILogger, depsolve::optional<Settings>>,
        [](std::shared_ptr<ILogger> l, std::shared_ptr<Settings> s) {
            return Server{std::move(l), std::move(s)};
        });

    REQUIRE(d->parameters.size() == 2);
    REQUIRE(d->parameters[0].target == key::of<ILogger>());
    REQUIRE(d->parameters[0].required);
    REQUIRE(d->parameters[1].target == key::of<Settings>());
    REQUIRE_FALSE(d->parameters[1].required);
}

TEST_CASE("builder: factory receives typed arguments", "[builder]") {
    auto d = make_dependant<Server>(deps<ILogger, Settings>,
        [](std::shared_ptr<ILogger> l, std::shared_ptr<Settings> s) {
            return Server{std::move(l), std::move(s)};
        });

    std::shared_ptr<ILogger> logger = std::make_shared<ConsoleLogger>();
    auto settings = std::make_shared<Settings>(8080);
    auto p = d->factory(args_of({logger, settings}));
    auto server = std::static_pointer_cast<Server>(p.value);
    REQUIRE(server->logger->tag() == "console");
    REQUIRE(server->settings->port == 8080);
    REQUIRE_FALSE(p.cleanup);
}

TEST_CASE("builder: value results are moved into a shared instance", "[builder]") {
    auto d = make_dependant<Settings>([] { return Settings(9000); });
    auto p = d->factory(argument_list{});
    REQUIRE(std::static_pointer_cast<Settings>(p.value)->port == 9000);
}

TEST_CASE("builder: implementation is stored as the interface", "[builder]") {
    auto d = make_dependant<ILogger, ConsoleLogger>(
        [] { return std::make_shared<ConsoleLogger>(); });
    auto p = d->factory(argument_list{});
    auto logger = std::static_pointer_cast<ILogger>(p.value);
    REQUIRE(logger->tag() == "console");
}

TEST_CASE("builder: product factories carry a cleanup", "[builder]") {
    bool cleaned = false;
    auto d = make_dependant<Settings>([&] {
        return make_product(std::make_shared<Settings>(1), [&] { cleaned = true; });
    });
    auto p = d->factory(argument_list{});
    REQUIRE(p.cleanup);
    p.cleanup();
    REQUIRE(cleaned);
}

TEST_CASE("builder: defaults attach to the matching parameter", "[builder]") {
    auto logger = make_dependant<ILogger, ConsoleLogger>(
        [] { return std::make_shared<ConsoleLogger>(); });
    auto d = make_dependant<Server>(deps<Settings, ILogger>,
        [](std::shared_ptr<Settings> s, std::shared_ptr<ILogger> l) {
            return Server{std::move(l), std::move(s)};
        },
        {.defaults = {logger}});

    REQUIRE(d->parameters[0].fallback == nullptr);
    REQUIRE(d->parameters[1].fallback == logger);
}

TEST_CASE("builder: default matching no parameter is rejected", "[builder]") {
    auto stray = make_dependant<Settings>([] { return Settings(1); });
    REQUIRE_THROWS_AS(
        make_dependant<Server>(deps<ILogger>,
            [](std::shared_ptr<ILogger> l) { return Server{std::move(l), nullptr}; },
            {.defaults = {stray}}),
        di_error);
}

TEST_CASE("builder: value_dependant always yields the same value", "[builder]") {
    auto settings = std::make_shared<Settings>(443);
    auto d = value_dependant(settings, {.scope = "app"});
    REQUIRE(d->id == key::of<Settings>());
    REQUIRE(d->factory(argument_list{}).value == settings);
    REQUIRE(d->factory(argument_list{}).value == settings);
}

TEST_CASE("builder: placeholder_dependant has no factory", "[builder]") {
    auto d = placeholder_dependant<Settings>({.name = "incoming", .scope = "request"});
    REQUIRE(d->id == key::of<Settings>("incoming"));
    REQUIRE_FALSE(d->factory);
    REQUIRE(d->scope == "request");
}

TEST_CASE("builder: argument_list bounds checking", "[builder]") {
    auto list = args_of({std::make_shared<Settings>(1), nullptr});
    REQUIRE(list.size() == 2);
    REQUIRE(list.get<Settings>(0)->port == 1);
    REQUIRE(list[1] == nullptr);
    REQUIRE_THROWS_AS(list.at(2), std::out_of_range);
}
