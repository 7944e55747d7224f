#include <catch2/catch_test_macros.hpp>
#include <depsolve.hpp>

#include <memory>

using namespace depsolve;
using depsolve::logging::log_level;

namespace {

struct Probe {};

/// Restores the global level when a test case ends.
struct level_guard {
    log_level saved = logging::level();
    ~level_guard() { logging::set_level(saved); }
};

} // namespace

TEST_CASE("logging: level names parse case-insensitively", "[logging]") {
    REQUIRE(logging::level_from_string("trace") == log_level::trace);
    REQUIRE(logging::level_from_string("DEBUG") == log_level::debug);
    REQUIRE(logging::level_from_string("Info") == log_level::info);
    REQUIRE(logging::level_from_string("warning") == log_level::warning);
    REQUIRE(logging::level_from_string("warn") == log_level::warning);
    REQUIRE(logging::level_from_string("error") == log_level::error);
    REQUIRE(logging::level_from_string("fatal") == log_level::fatal);
    REQUIRE(logging::level_from_string("OFF") == log_level::off);
}

TEST_CASE("logging: unknown level name falls back to info", "[logging]") {
    REQUIRE(logging::level_from_string("verbose") == log_level::info);
    REQUIRE(logging::level_from_string("") == log_level::info);
}

TEST_CASE("logging: set_level round-trips", "[logging]") {
    level_guard guard;
    logging::set_level(log_level::error);
    REQUIRE(logging::level() == log_level::error);
    logging::set_level(log_level::off);
    REQUIRE(logging::level() == log_level::off);
}

TEST_CASE("logging: resolution works at every level", "[logging]") {
    level_guard guard;
    auto d = make_dependant<Probe>([] { return Probe{}; });
    binding_table table;

    for (auto lvl : {log_level::trace, log_level::debug, log_level::off}) {
        logging::set_level(lvl);
        auto plan = solve(d, table, solve_options{.scopes = {"app"}});
        scope_stack stack;
        auto app = stack.enter("app");
        REQUIRE(execute(plan, stack) != nullptr);
        app.exit();
    }
}
