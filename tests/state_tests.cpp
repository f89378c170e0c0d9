#include <catch2/catch_test_macros.hpp>
#include "../src/conditions.hpp"
#include "../src/events.hpp"
#include "../src/fixed_timestep.hpp"
#include "../src/stage.hpp"
#include "../src/state.hpp"
#include <ecs/ecs.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sched;
using namespace std::chrono_literals;

enum class Phase { A, B, C, D };

static std::string name(Phase p) {
    switch (p) {
        case Phase::A: return "A";
        case Phase::B: return "B";
        case Phase::C: return "C";
        case Phase::D: return "D";
    }
    return "?";
}

// Builder with logging enter/exit hooks on every Phase value.
static StateTransitionMachine<Phase>::Builder logging_builder(std::vector<std::string>& log,
                                                              Phase initial = Phase::A) {
    StateTransitionMachine<Phase>::Builder builder(initial);
    for (Phase p : {Phase::A, Phase::B, Phase::C, Phase::D}) {
        builder.on_enter(p, [&log, p](ecs::World&) { log.push_back("enter " + name(p)); });
        builder.on_exit(p,  [&log, p](ecs::World&) { log.push_back("exit "  + name(p)); });
    }
    return builder;
}

// ---------------------------------------------------------------------------
// Initial transition
// ---------------------------------------------------------------------------

TEST_CASE("StateTransitionMachine — CurrentState is absent before the first run", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();

    CHECK(machine.status() == StateTransitionMachine<Phase>::Status::Uninitialized);
    CHECK(current_state<Phase>(world) == nullptr);
    CHECK(log.empty());
}

TEST_CASE("StateTransitionMachine — first run enters the initial state once", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();

    CHECK(machine.run(world) == 1);
    CHECK(machine.status() == StateTransitionMachine<Phase>::Status::Settled);
    REQUIRE(current_state<Phase>(world));
    CHECK(*current_state<Phase>(world) == Phase::A);
    CHECK(log == std::vector<std::string>{"enter A"});

    SECTION("Later runs with nothing pending do nothing") {
        CHECK(machine.run(world) == 0);
        CHECK(machine.run(world) == 0);
        CHECK(log == std::vector<std::string>{"enter A"});
    }
}

TEST_CASE("StateTransitionMachine — request before the first run applies after the initial enter", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();

    request_state(world, Phase::C);
    CHECK(machine.run(world) == 2);
    CHECK(*current_state<Phase>(world) == Phase::C);
    CHECK(log == std::vector<std::string>{"enter A", "exit A", "enter C"});
}

// ---------------------------------------------------------------------------
// Transition protocol
// ---------------------------------------------------------------------------

TEST_CASE("StateTransitionMachine — requesting the current value runs nothing", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();
    machine.run(world);
    log.clear();

    request_state(world, Phase::A);
    CHECK(machine.run(world) == 0);
    CHECK(log.empty());
    CHECK(*current_state<Phase>(world) == Phase::A);
    CHECK_FALSE(world.resource<NextState<Phase>>().value.has_value());
}

TEST_CASE("StateTransitionMachine — exit, assign, enter in that order", "[state]") {
    ecs::World world;
    std::vector<std::string> log;

    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_exit(Phase::A, [&](ecs::World& w) {
        log.push_back("exit A while " + name(*current_state<Phase>(w)));
    });
    builder.on_enter(Phase::B, [&](ecs::World& w) {
        log.push_back("enter B while " + name(*current_state<Phase>(w)));
    });
    auto machine = std::move(builder).build();
    machine.run(world);

    request_state(world, Phase::B);
    CHECK(machine.run(world) == 1);
    CHECK(log == std::vector<std::string>{"exit A while A", "enter B while B"});
    CHECK(*current_state<Phase>(world) == Phase::B);
}

TEST_CASE("StateTransitionMachine — request is consumed", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();
    machine.run(world);

    request_state(world, Phase::B);
    machine.run(world);
    log.clear();

    CHECK(machine.run(world) == 0);
    CHECK(log.empty());
}

TEST_CASE("StateTransitionMachine — later request in a frame replaces an earlier one", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();
    machine.run(world);
    log.clear();

    request_state(world, Phase::B);
    request_state(world, Phase::C);
    machine.run(world);

    CHECK(log == std::vector<std::string>{"exit A", "enter C"});
}

TEST_CASE("StateTransitionMachine — states without hooks transition silently", "[state]") {
    ecs::World world;
    auto machine = StateTransitionMachine<Phase>::Builder(Phase::A).build();

    machine.run(world);
    request_state(world, Phase::D);
    CHECK(machine.run(world) == 1);
    CHECK(*current_state<Phase>(world) == Phase::D);
}

TEST_CASE("StateTransitionMachine — several stages per hook run in registration order", "[state]") {
    ecs::World world;
    std::vector<int> order;

    Stage first;
    first.add_system([&](ecs::World&) { order.push_back(1); })
         .add_system([&](ecs::World&) { order.push_back(2); });
    Stage second;
    second.add_system([&](ecs::World&) { order.push_back(3); });

    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_enter(Phase::A, std::move(first)).on_enter(Phase::A, std::move(second));
    auto machine = std::move(builder).build();
    machine.run(world);

    CHECK(order == std::vector<int>{1, 2, 3});
}

// ---------------------------------------------------------------------------
// Cascading transitions
// ---------------------------------------------------------------------------

TEST_CASE("StateTransitionMachine — enter stage request cascades in the same run", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto builder = logging_builder(log);
    builder.on_enter(Phase::B, [](ecs::World& w) { request_state(w, Phase::C); });
    auto machine = std::move(builder).build();
    machine.run(world);
    log.clear();

    request_state(world, Phase::B);
    CHECK(machine.run(world) == 2);
    CHECK(log == std::vector<std::string>{"exit A", "enter B", "exit B", "enter C"});
    CHECK(*current_state<Phase>(world) == Phase::C);
}

TEST_CASE("StateTransitionMachine — exit stage request is applied after the enter", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto builder = logging_builder(log);
    builder.on_exit(Phase::A, [](ecs::World& w) { request_state(w, Phase::D); });
    auto machine = std::move(builder).build();
    machine.run(world);
    log.clear();

    request_state(world, Phase::B);
    machine.run(world);
    CHECK(log == std::vector<std::string>{"exit A", "enter B", "exit B", "enter D"});
    CHECK(*current_state<Phase>(world) == Phase::D);
}

TEST_CASE("StateTransitionMachine — initial enter may cascade", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto builder = logging_builder(log);
    builder.on_enter(Phase::A, [](ecs::World& w) { request_state(w, Phase::B); });
    auto machine = std::move(builder).build();

    CHECK(machine.run(world) == 2);
    CHECK(log == std::vector<std::string>{"enter A", "exit A", "enter B"});
}

TEST_CASE("StateTransitionMachine — cascade cap defers the pending request", "[state]") {
    ecs::World world;
    std::vector<std::string> log;

    // A -> B -> C -> D -> A ... each enter requests the next value.
    auto builder = logging_builder(log);
    builder.on_enter(Phase::B, [](ecs::World& w) { request_state(w, Phase::C); })
           .on_enter(Phase::C, [](ecs::World& w) { request_state(w, Phase::D); })
           .max_transitions_per_run(2);
    auto machine = std::move(builder).build();
    machine.run(world);
    log.clear();

    request_state(world, Phase::B);
    CHECK(machine.run(world) == 2);
    CHECK(*current_state<Phase>(world) == Phase::C);
    REQUIRE(world.resource<NextState<Phase>>().value.has_value());
    CHECK(*world.resource<NextState<Phase>>().value == Phase::D);

    CHECK(machine.run(world) == 1);
    CHECK(*current_state<Phase>(world) == Phase::D);
    CHECK(log == std::vector<std::string>{"exit A", "enter B", "exit B", "enter C",
                                          "exit C", "enter D"});
}

// ---------------------------------------------------------------------------
// Faults and forced changes
// ---------------------------------------------------------------------------

TEST_CASE("StateTransitionMachine — enter fault leaves CurrentState updated", "[state]") {
    ecs::World world;
    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_enter(Phase::B, [](ecs::World&) { throw std::runtime_error("enter B"); });
    auto machine = std::move(builder).build();
    machine.run(world);

    request_state(world, Phase::B);
    CHECK_THROWS_AS(machine.run(world), std::runtime_error);
    CHECK(*current_state<Phase>(world) == Phase::B);
}

TEST_CASE("StateTransitionMachine — exit fault leaves CurrentState unchanged", "[state]") {
    ecs::World world;
    bool entered = false;
    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_exit(Phase::A, [](ecs::World&) { throw std::runtime_error("exit A"); })
           .on_enter(Phase::B, [&](ecs::World&) { entered = true; });
    auto machine = std::move(builder).build();
    machine.run(world);

    request_state(world, Phase::B);
    CHECK_THROWS_AS(machine.run(world), std::runtime_error);
    CHECK(*current_state<Phase>(world) == Phase::A);
    CHECK_FALSE(entered);
}

TEST_CASE("StateTransitionMachine — initial enter fault still settles the machine", "[state]") {
    ecs::World world;
    int enters = 0;
    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_enter(Phase::A, [&](ecs::World&) {
        ++enters;
        throw std::runtime_error("enter A");
    });
    auto machine = std::move(builder).build();

    CHECK_THROWS_AS(machine.run(world), std::runtime_error);
    CHECK(machine.status() == StateTransitionMachine<Phase>::Status::Settled);
    REQUIRE(current_state<Phase>(world));
    CHECK(*current_state<Phase>(world) == Phase::A);

    // Initialization is not retried.
    CHECK(machine.run(world) == 0);
    CHECK(enters == 1);
}

TEST_CASE("force_state — changes CurrentState without running hooks", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();
    machine.run(world);
    log.clear();

    force_state(world, Phase::C);
    CHECK(*current_state<Phase>(world) == Phase::C);
    CHECK(machine.run(world) == 0);
    CHECK(log.empty());

    SECTION("The next transition exits the forced value") {
        request_state(world, Phase::B);
        machine.run(world);
        CHECK(log == std::vector<std::string>{"exit C", "enter B"});
    }
}

TEST_CASE("force_state — before the first run skips the initial enter", "[state]") {
    ecs::World world;
    std::vector<std::string> log;
    auto machine = logging_builder(log).build();

    force_state(world, Phase::D);
    CHECK(machine.run(world) == 0);
    CHECK(*current_state<Phase>(world) == Phase::D);
    CHECK(log.empty());
}

// ---------------------------------------------------------------------------
// Events and composition
// ---------------------------------------------------------------------------

TEST_CASE("StateTransitionMachine — transitions are reported as events", "[state]") {
    ecs::World world;
    EventRegistry reg;
    reg.register_queue<StateTransition<Phase>>(world);

    auto builder = StateTransitionMachine<Phase>::Builder(Phase::A);
    builder.on_enter(Phase::B, [](ecs::World& w) { request_state(w, Phase::C); });
    auto machine = std::move(builder).build();

    request_state(world, Phase::B);
    machine.run(world);

    const auto& events = world.resource<Events<StateTransition<Phase>>>().read();
    REQUIRE(events.size() == 3);
    CHECK_FALSE(events[0].from.has_value());
    CHECK(events[0].to == Phase::A);
    CHECK(*events[1].from == Phase::A);
    CHECK(events[1].to == Phase::B);
    CHECK(*events[2].from == Phase::B);
    CHECK(events[2].to == Phase::C);
}

TEST_CASE("StateTransitionMachine — in_state gates follow the machine", "[state]") {
    ecs::World world;
    int a_runs = 0, b_runs = 0;
    System in_a = run_if([&](ecs::World&) { ++a_runs; }, in_state(Phase::A));
    System in_b = run_if([&](ecs::World&) { ++b_runs; }, in_state(Phase::B));
    System machine = StateTransitionMachine<Phase>::Builder(Phase::A).build().into_system();

    auto frame = [&] { machine(world); in_a(world); in_b(world); };

    frame();
    request_state(world, Phase::B);
    frame();
    frame();

    CHECK(a_runs == 1);
    CHECK(b_runs == 2);
}

TEST_CASE("StateTransitionMachine — enter stage can hold a fixed timestep", "[state]") {
    ecs::World world;
    int ticks = 0;

    FixedTimestepRunner::Builder fixed(10ms);
    fixed.with_system([&](ecs::World&) { ++ticks; });
    auto runner = std::make_shared<FixedTimestepRunner>(std::move(fixed).build());

    StateTransitionMachine<Phase>::Builder builder(Phase::A);
    builder.on_enter(Phase::B, [runner](ecs::World& w) { runner->advance(35ms, w); });
    auto machine = std::move(builder).build();
    machine.run(world);

    request_state(world, Phase::B);
    machine.run(world);
    CHECK(ticks == 3);
    CHECK(runner->accumulator().accumulated() == 5ms);
}
