#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <depsolve.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using namespace depsolve;

namespace {

struct NodeA {};
struct NodeB {};
struct NodeC {};
struct NodeD {};

const solve_options two_scopes{.scopes = {"app", "request"}};

// A(B, C), B(C)
dependant_ptr triangle(dependant_ptr* c_out = nullptr) {
    auto c = make_dependant<NodeC>([] { return std::make_shared<NodeC>(); });
    auto b = make_dependant<NodeB>(deps<NodeC>,
        [](std::shared_ptr<NodeC>) { return std::make_shared<NodeB>(); },
        {.defaults = {c}});
    if (c_out) *c_out = c;
    return make_dependant<NodeA>(deps<NodeB, NodeC>,
        [](std::shared_ptr<NodeB>, std::shared_ptr<NodeC>) {
            return std::make_shared<NodeA>();
        },
        {.defaults = {b, c}});
}

} // namespace

TEST_CASE("solver: A(B, C), B(C) gives stages {C}, {B}, {A}", "[solver]") {
    binding_table table;
    auto plan = solve(triangle(), table, two_scopes);

    auto stages = plan.stage_keys();
    REQUIRE(stages.size() == 3);
    REQUIRE(stages[0] == std::vector<key>{key::of<NodeC>()});
    REQUIRE(stages[1] == std::vector<key>{key::of<NodeB>()});
    REQUIRE(stages[2] == std::vector<key>{key::of<NodeA>()});
    REQUIRE(plan.root_node().id == key::of<NodeA>());
}

TEST_CASE("solver: every node comes after its parameters", "[solver]") {
    auto d = make_dependant<NodeD>([] { return std::make_shared<NodeD>(); });
    auto c = make_dependant<NodeC>(deps<NodeD>,
        [](std::shared_ptr<NodeD>) { return std::make_shared<NodeC>(); },
        {.defaults = {d}});
    auto b = make_dependant<NodeB>(deps<NodeD>,
        [](std::shared_ptr<NodeD>) { return std::make_shared<NodeB>(); },
        {.defaults = {d}});
    auto a = make_dependant<NodeA>(deps<NodeB, NodeC, NodeD>,
        [](std::shared_ptr<NodeB>, std::shared_ptr<NodeC>, std::shared_ptr<NodeD>) {
            return std::make_shared<NodeA>();
        },
        {.defaults = {b, c, d}});

    binding_table table;
    auto plan = solve(a, table, two_scopes);
    for (const auto& node : plan.nodes) {
        for (const auto& arg : node.arguments) {
            REQUIRE(arg.has_value());
            REQUIRE(plan.node(*arg).stage < node.stage);
        }
    }

    std::size_t total = 0;
    for (const auto& stage : plan.stages) total += stage.nodes.size();
    REQUIRE(total == plan.nodes.size());
}

TEST_CASE("solver: ties keep first-discovery order", "[solver]") {
    auto b = make_dependant<NodeB>([] { return std::make_shared<NodeB>(); });
    auto c = make_dependant<NodeC>([] { return std::make_shared<NodeC>(); });
    auto d = make_dependant<NodeD>([] { return std::make_shared<NodeD>(); });
    auto a = make_dependant<NodeA>(deps<NodeD, NodeB, NodeC>,
        [](std::shared_ptr<NodeD>, std::shared_ptr<NodeB>, std::shared_ptr<NodeC>) {
            return std::make_shared<NodeA>();
        },
        {.defaults = {b, c, d}});

    binding_table table;
    auto plan = solve(a, table, two_scopes);
    auto stages = plan.stage_keys();
    REQUIRE(stages.size() == 2);
    REQUIRE(stages[0] == std::vector<key>{key::of<NodeD>(), key::of<NodeB>(), key::of<NodeC>()});
}

TEST_CASE("solver: identical graphs give identical plans", "[solver]") {
    binding_table table;
    auto root = triangle();
    auto first = solve(root, table, two_scopes);
    auto second = solve(root, table, two_scopes);
    REQUIRE(first.stage_keys() == second.stage_keys());
    REQUIRE(first.describe() == second.describe());
}

TEST_CASE("solver: empty scope tag uses the innermost declared scope", "[solver]") {
    binding_table table;
    auto plan = solve(make_dependant<NodeA>([] { return std::make_shared<NodeA>(); }),
                      table, two_scopes);
    REQUIRE(plan.root_node().scope == "request");
    REQUIRE(plan.root_node().scope_depth == 1);
    REQUIRE(plan.scopes == std::vector<std::string>{"request"});
}

TEST_CASE("solver: explicit default scope", "[solver]") {
    binding_table table;
    solve_options opts{.scopes = {"app", "request"}, .default_scope = "app"};
    auto plan = solve(make_dependant<NodeA>([] { return std::make_shared<NodeA>(); }),
                      table, opts);
    REQUIRE(plan.root_node().scope == "app");
    REQUIRE(plan.root_node().scope_depth == 0);
}

TEST_CASE("solver: plan lists used scopes outermost first", "[solver]") {
    auto c = make_dependant<NodeC>([] { return std::make_shared<NodeC>(); },
                                   {.scope = "app"});
    auto a = make_dependant<NodeA>(deps<NodeC>,
        [](std::shared_ptr<NodeC>) { return std::make_shared<NodeA>(); },
        {.scope = "request", .defaults = {c}});

    binding_table table;
    solve_options opts{.scopes = {"app", "session", "request"}};
    auto plan = solve(a, table, opts);
    REQUIRE(plan.scopes == std::vector<std::string>{"app", "request"});
    REQUIRE(plan.stages[0].scopes == std::vector<std::string>{"app"});
    REQUIRE(plan.stages[1].scopes == std::vector<std::string>{"request"});
}

TEST_CASE("solver: describe prints one line per stage", "[solver]") {
    binding_table table;
    auto plan = solve(triangle(), table, two_scopes);
    auto text = plan.describe();
    REQUIRE(std::count(text.begin(), text.end(), '\n') == 3);
    REQUIRE_THAT(text, Catch::Matchers::StartsWith("0: {"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("NodeC"));
    REQUIRE_THAT(text, Catch::Matchers::ContainsSubstring("[request]"));
}

TEST_CASE("solver: find returns a node handle", "[solver]") {
    binding_table table;
    auto plan = solve(triangle(), table, two_scopes);
    auto handle = plan.find(key::of<NodeB>());
    REQUIRE(handle.has_value());
    REQUIRE(plan.node(*handle).id == key::of<NodeB>());
    REQUIRE_FALSE(plan.find(key::of<NodeD>()).has_value());
}

TEST_CASE("solver: absent optional parameter is kept as an empty argument", "[solver]") {
    auto a = make_dependant<NodeA>(deps<depsolve::optional<NodeB>>,
        [](std::shared_ptr<NodeB>) { return std::make_shared<NodeA>(); });
    binding_table table;
    auto plan = solve(a, table, two_scopes);
    REQUIRE(plan.nodes.size() == 1);
    REQUIRE(plan.root_node().arguments.size() == 1);
    REQUIRE_FALSE(plan.root_node().arguments[0].has_value());
}

TEST_CASE("solver: no declared scopes is rejected", "[solver]") {
    binding_table table;
    REQUIRE_THROWS_AS(solve(triangle(), table, solve_options{}), di_error);
}

TEST_CASE("solver: duplicate scope declaration is rejected", "[solver]") {
    binding_table table;
    solve_options opts{.scopes = {"app", "app"}};
    REQUIRE_THROWS_AS(solve(triangle(), table, opts), di_error);
}

TEST_CASE("solver: empty graph is rejected", "[solver]") {
    REQUIRE_THROWS_AS(solve(dependency_graph{}, two_scopes), di_error);
}

TEST_CASE("solver: very deep linear chain is solved", "[solver]") {
    constexpr std::size_t depth = 20000;
    binding_table table;
    for (std::size_t i = 0; i < depth; ++i) {
        auto d = std::make_shared<dependant>();
        d->id = key::of<NodeD>(std::to_string(i));
        if (i + 1 < depth) {
            d->parameters.push_back(parameter{key::of<NodeD>(std::to_string(i + 1)), true, nullptr});
        }
        table.bind(d);
    }

    auto plan = solve(table.find(key::of<NodeD>("0")), table, two_scopes);
    REQUIRE(plan.nodes.size() == depth);
    REQUIRE(plan.stages.size() == depth);
    REQUIRE(plan.root_node().stage == depth - 1);
    REQUIRE(plan.stages.front().nodes.size() == 1);
}
