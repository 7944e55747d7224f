#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <depsolve.hpp>

#include <memory>
#include <string>

using namespace depsolve;

namespace {

struct GraphRoot {};
struct GraphLeft {};
struct GraphRight {};
struct GraphLeaf {};

struct IStore {
    virtual ~IStore() = default;
    virtual std::string name() const = 0;
};
struct MemoryStore : IStore {
    std::string name() const override { return "memory"; }
};
struct DiskStore : IStore {
    std::string name() const override { return "disk"; }
};

dependant_ptr leaf(dependant_options opts = {}) {
    return make_dependant<GraphLeaf>([] { return std::make_shared<GraphLeaf>(); },
                                     std::move(opts));
}

} // namespace

TEST_CASE("graph: root is node 0 and nodes follow breadth-first discovery", "[graph]") {
    auto leaf_dep = leaf();
    auto left = make_dependant<GraphLeft>(deps<GraphLeaf>,
        [](std::shared_ptr<GraphLeaf>) { return std::make_shared<GraphLeft>(); },
        {.defaults = {leaf_dep}});
    auto right = make_dependant<GraphRight>(
        [] { return std::make_shared<GraphRight>(); });
    auto root = make_dependant<GraphRoot>(deps<GraphLeft, GraphRight>,
        [](std::shared_ptr<GraphLeft>, std::shared_ptr<GraphRight>) {
            return std::make_shared<GraphRoot>();
        },
        {.defaults = {left, right}});

    auto g = build_graph(root, binding_map{});
    REQUIRE(g.size() == 4);
    REQUIRE(g.at(0).id == key::of<GraphRoot>());
    REQUIRE(g.at(1).id == key::of<GraphLeft>());
    REQUIRE(g.at(2).id == key::of<GraphRight>());
    REQUIRE(g.at(3).id == key::of<GraphLeaf>());

    REQUIRE(g.root().edges.size() == 2);
    REQUIRE(g.root().edges[0] == 1);
    REQUIRE(g.root().edges[1] == 2);
    REQUIRE(g.find(key::of<GraphLeaf>()) == 3);
    REQUIRE_FALSE(g.find(key::of<IStore>()).has_value());
}

TEST_CASE("graph: repeated references collapse to one node", "[graph]") {
    auto leaf_dep = leaf();
    auto left = make_dependant<GraphLeft>(deps<GraphLeaf>,
        [](std::shared_ptr<GraphLeaf>) { return std::make_shared<GraphLeft>(); },
        {.defaults = {leaf_dep}});
    auto root = make_dependant<GraphRoot>(deps<GraphLeft, GraphLeaf>,
        [](std::shared_ptr<GraphLeft>, std::shared_ptr<GraphLeaf>) {
            return std::make_shared<GraphRoot>();
        },
        {.defaults = {left, leaf_dep}});

    auto g = build_graph(root, binding_map{});
    REQUIRE(g.size() == 3);
    auto leaf_idx = g.find(key::of<GraphLeaf>());
    REQUIRE(leaf_idx.has_value());
    REQUIRE(g.root().edges[1] == leaf_idx);
    REQUIRE(g.nodes()[*g.find(key::of<GraphLeft>())].edges[0] == leaf_idx);
}

TEST_CASE("graph: binding overrides the parameter default", "[graph]") {
    auto memory = make_dependant<IStore, MemoryStore>(
        [] { return std::make_shared<MemoryStore>(); });
    auto disk = make_dependant<IStore, DiskStore>(
        [] { return std::make_shared<DiskStore>(); });
    auto root = make_dependant<GraphRoot>(deps<IStore>,
        [](std::shared_ptr<IStore>) { return std::make_shared<GraphRoot>(); },
        {.defaults = {memory}});

    binding_table table;
    table.bind(key::of<IStore>(), disk);

    auto g = build_graph(root, table);
    REQUIRE(g.size() == 2);
    REQUIRE(g.nodes()[1].source == disk);
}

TEST_CASE("graph: the root itself may be overridden", "[graph]") {
    auto memory = make_dependant<IStore, MemoryStore>(
        [] { return std::make_shared<MemoryStore>(); });
    auto disk = make_dependant<IStore, DiskStore>(
        [] { return std::make_shared<DiskStore>(); });

    binding_table table;
    table.bind(disk);

    auto g = build_graph(memory, table);
    REQUIRE(g.size() == 1);
    REQUIRE(g.root().source == disk);
}

TEST_CASE("graph: bindings are applied once, not transitively", "[graph]") {
    auto special = make_dependant<IStore, DiskStore>(
        [] { return std::make_shared<DiskStore>(); }, {.name = "special"});
    auto other = make_dependant<IStore, MemoryStore>(
        [] { return std::make_shared<MemoryStore>(); }, {.name = "special"});
    auto root = make_dependant<GraphRoot>(deps<IStore>,
        [](std::shared_ptr<IStore>) { return std::make_shared<GraphRoot>(); });

    binding_map bindings;
    bindings.emplace(key::of<IStore>(), special);
    bindings.emplace(key::of<IStore>("special"), other);

    auto g = build_graph(root, bindings);
    REQUIRE(g.size() == 2);
    REQUIRE(g.nodes()[1].source == special);
    REQUIRE(g.at(1).id == key::of<IStore>("special"));
}

TEST_CASE("graph: optional parameter without provider is absent", "[graph]") {
    auto root = make_dependant<GraphRoot>(deps<depsolve::optional<IStore>>,
        [](std::shared_ptr<IStore>) { return std::make_shared<GraphRoot>(); });

    auto g = build_graph(root, binding_map{});
    REQUIRE(g.size() == 1);
    REQUIRE(g.root().edges.size() == 1);
    REQUIRE_FALSE(g.root().edges[0].has_value());
}

TEST_CASE("graph: optional parameter still uses a binding when present", "[graph]") {
    auto root = make_dependant<GraphRoot>(deps<depsolve::optional<IStore>>,
        [](std::shared_ptr<IStore>) { return std::make_shared<GraphRoot>(); });
    binding_table table;
    table.bind(make_dependant<IStore, MemoryStore>(
        [] { return std::make_shared<MemoryStore>(); }));

    auto g = build_graph(root, table);
    REQUIRE(g.size() == 2);
    REQUIRE(g.root().edges[0] == 1);
}

TEST_CASE("graph: missing required parameter", "[graph]") {
    auto root = make_dependant<GraphRoot>(deps<IStore>,
        [](std::shared_ptr<IStore>) { return std::make_shared<GraphRoot>(); });

    try {
        build_graph(root, binding_map{});
        FAIL("Expected missing_binding");
    } catch (const missing_binding& e) {
        REQUIRE(e.component() == key::of<IStore>());
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("required by"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("GraphRoot"));
    }
}

TEST_CASE("graph: same key with different scope conflicts", "[graph]") {
    auto app_leaf = leaf({.scope = "app"});
    auto request_leaf = leaf({.scope = "request"});
    auto left = make_dependant<GraphLeft>(deps<GraphLeaf>,
        [](std::shared_ptr<GraphLeaf>) { return std::make_shared<GraphLeft>(); },
        {.defaults = {request_leaf}});
    auto root = make_dependant<GraphRoot>(deps<GraphLeaf, GraphLeft>,
        [](std::shared_ptr<GraphLeaf>, std::shared_ptr<GraphLeft>) {
            return std::make_shared<GraphRoot>();
        },
        {.defaults = {app_leaf, left}});

    REQUIRE_THROWS_AS(build_graph(root, binding_map{}), conflicting_dependant);
}

TEST_CASE("graph: equivalent dependants under one key do not conflict", "[graph]") {
    auto first = leaf({.scope = "app"});
    auto second = leaf({.scope = "app"});
    auto left = make_dependant<GraphLeft>(deps<GraphLeaf>,
        [](std::shared_ptr<GraphLeaf>) { return std::make_shared<GraphLeft>(); },
        {.defaults = {second}});
    auto root = make_dependant<GraphRoot>(deps<GraphLeaf, GraphLeft>,
        [](std::shared_ptr<GraphLeaf>, std::shared_ptr<GraphLeft>) {
            return std::make_shared<GraphRoot>();
        },
        {.defaults = {first, left}});

    auto g = build_graph(root, binding_map{});
    REQUIRE(g.size() == 3);
    REQUIRE(g.nodes()[*g.find(key::of<GraphLeaf>())].source == first);
}

TEST_CASE("graph: null root is rejected", "[graph]") {
    REQUIRE_THROWS_AS(build_graph(nullptr, binding_map{}), di_error);
}
