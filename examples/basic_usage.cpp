/// basic_usage.cpp — depsolve introductory example.
///
/// Demonstrates the define → solve → execute workflow:
///   1. Describe each component as a dependant: factory, parameters, scope.
///   2. Solve the root once into a staged execution plan.
///   3. Enter an "app" scope for long-lived values and a "request" scope per
///      request, then execute the plan; request data is supplied per call.

#include <depsolve.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace depsolve;

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

// Supplied by the "framework" for every request.
struct incoming_request {
    std::string user;
};

// -----------------------------------------------------------------------
// Implementations
// -----------------------------------------------------------------------

struct console_logger : i_logger {
    void log(const std::string& message) override {
        std::lock_guard lock(mutex_);
        std::cout << "[LOG] " << message << '\n';
    }

private:
    std::mutex mutex_;
};

struct greeter : i_greeter {
    explicit greeter(std::shared_ptr<i_logger> logger)
        : logger_(std::move(logger)) {}

    std::string greet(const std::string& name) override {
        const auto msg = "Hello, " + name + '!';
        logger_->log(msg);
        return msg;
    }

private:
    std::shared_ptr<i_logger> logger_;
};

struct request_handler {
    std::shared_ptr<i_greeter> greeting;
    std::shared_ptr<incoming_request> request;

    std::string handle() { return greeting->greet(request->user); }
};

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main() {
    // ── Definition phase ──────────────────────────────────────────────

    // console_logger: app scope, closed when the app scope exits.
    auto logger = make_dependant<i_logger, console_logger>(
        [] {
            std::shared_ptr<i_logger> l = std::make_shared<console_logger>();
            return make_product(std::move(l), [] { std::cout << "logger closed\n"; });
        },
        {.scope = "app"});

    // greeter: app scope, depends on i_logger.
    auto greeting = make_dependant<i_greeter, greeter>(deps<i_logger>,
        [](std::shared_ptr<i_logger> l) { return std::make_shared<greeter>(std::move(l)); },
        {.scope = "app", .defaults = {logger}});

    // incoming_request: no factory, the caller supplies it per request.
    auto request = placeholder_dependant<incoming_request>({.scope = "request"});

    // request_handler: one per request.
    auto handler = make_dependant<request_handler>(deps<i_greeter, incoming_request>,
        [](std::shared_ptr<i_greeter> g, std::shared_ptr<incoming_request> r) {
            return request_handler{std::move(g), std::move(r)};
        },
        {.scope = "request", .defaults = {greeting, request}});

    // ── Solve phase (cycles, scopes, missing bindings) ────────────────
    container app_container({.scopes = {"app", "request"}, .self_scope = "app"});
    auto plan = app_container.solve(handler);
    std::cout << plan->describe();

    // ── Execution phase ───────────────────────────────────────────────
    const std::vector<std::string> users{"Alice", "Bob", "Carol"};
    std::vector<std::jthread> workers;
    for (const auto& user : users) {
        workers.emplace_back([&, user] {
            // Each worker gets its own request scope on top of the shared app scope.
            auto local = app_container.scopes().branch();
            auto scope = local.enter("request");

            execute_options opts{.policy = execution_policy::parallel};
            opts.values.emplace(key::of<incoming_request>(),
                                std::make_shared<incoming_request>(incoming_request{user}));
            auto h = execute_as<request_handler>(*plan, local, opts);
            h->handle();
            scope.exit();
        });
    }
    workers.clear();

    std::cout << "Done.\n";
    return 0;
}
