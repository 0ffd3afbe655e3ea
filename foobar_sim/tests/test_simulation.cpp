#include <catch2/catch_test_macros.hpp>
#include "engine/Simulation.hpp"
#include "TestSupport.hpp"
#include <stdexcept>

using namespace foobar;
using namespace foobar::test;

namespace {

    // Quiet simulation with a fixed seed
    void prepare(Simulation& sim, uint32_t seed) {
        sim.getRuntimeConfig().simulation.seed = seed;
        sim.getRuntimeConfig().simulation.statusEveryTicks = 0;
        sim.getEventLog().setEcho(false);
    }

    void checkConservation(const WorldState& world) {
        const auto& m = world.getMetrics();
        Committed c = countCommitted(world);

        REQUIRE(m.foosMined == world.getFoos().size() + c.foos + m.foosDiscarded
                               + m.foosSpentOnRobots + m.foobarsAssembled);
        REQUIRE(m.barsMined == world.getBars().size() + c.bars + m.foobarsAssembled);
        REQUIRE(m.foobarsAssembled == world.getFoobars().size() + c.foobars + m.foobarsSold);
        REQUIRE(world.getMoney() == static_cast<Money>(m.foobarsSold) * FOOBAR_PRICE
                                    - static_cast<Money>(m.robotsBought) * ROBOT_PRICE);
        REQUIRE(world.getMoney() >= 0);
        REQUIRE(world.getFleetSize() == INITIAL_ROBOTS + m.robotsBought);
    }

}

// ============================================================
// Scenarios
// ============================================================

TEST_CASE("Simulation: Two fresh robots mine two foos in the first ten ticks", "[simulation]") {
    WorldState world;
    DispatchPolicy policy(world, constantDraw(0.0));
    ProgressEngine engine(world, constantDraw(0.0));

    policy.dispatch();
    for (int i = 0; i < 10; ++i) {
        engine.advance();
    }

    REQUIRE(world.getFoos().size() == 2);
    for (const auto& robot : world.getRobots()) {
        REQUIRE(robot.isIdle());
        REQUIRE(robot.getPreviousAction() == ActionKind::MINING_FOO);
    }
}

TEST_CASE("Simulation: Robots go straight back to mining foo", "[simulation]") {
    Simulation sim;
    prepare(sim, 1);
    sim.setSuccessDraw(constantDraw(0.0));
    sim.initialize();

    for (int i = 0; i < 11; ++i) {
        REQUIRE(sim.step());
    }

    const auto& world = sim.getWorld();
    REQUIRE(world.getFoos().size() == 2);
    REQUIRE(world.getTick() == 11);
    for (const auto& robot : world.getRobots()) {
        REQUIRE(robot.getAction().getKind() == ActionKind::MINING_FOO);
        REQUIRE(robot.getAction().getRemaining() == 10);
    }
    REQUIRE(world.getMetrics().taskSwitches == 0);
}

// ============================================================
// Full runs
// ============================================================

TEST_CASE("Simulation: A seeded run grows the fleet to thirty robots", "[simulation][slow]") {
    Simulation sim;
    prepare(sim, 42);
    sim.initialize();

    const Tick limit = 2'000'000;
    while (sim.step()) {
        checkConservation(sim.getWorld());
        REQUIRE(sim.getCurrentTick() < limit);
    }

    const auto& world = sim.getWorld();
    REQUIRE(sim.isFinished());
    // Purchases finishing on the same tick can carry the fleet past the target
    REQUIRE(world.getFleetSize() >= TARGET_FLEET_SIZE);
    REQUIRE(world.getMetrics().totalTicks == world.getTick());
    checkConservation(world);

    const auto& events = sim.getEventLog();
    REQUIRE(events.count(EventType::SIMULATION_FINISHED) == 1);
    REQUIRE(events.getEvents().back().type == EventType::SIMULATION_FINISHED);
    REQUIRE(events.getEvents().back().amount == static_cast<int64_t>(world.getFleetSize()));
    REQUIRE(events.count(EventType::ROBOT_BOUGHT) == world.getMetrics().robotsBought);

    // Finished simulations don't move
    Tick end = sim.getCurrentTick();
    REQUIRE_FALSE(sim.step());
    REQUIRE(sim.getCurrentTick() == end);
}

TEST_CASE("Simulation: The same seed gives the same run", "[simulation][slow]") {
    Simulation a;
    Simulation b;
    prepare(a, 7);
    prepare(b, 7);

    a.initialize();
    while (a.step()) {}
    b.initialize();
    while (b.step()) {}

    REQUIRE(a.getCurrentTick() == b.getCurrentTick());
    REQUIRE(a.getWorld().getMoney() == b.getWorld().getMoney());
    REQUIRE(a.getEventLog().size() == b.getEventLog().size());
}

TEST_CASE("Simulation: run() stops at maxTicks", "[simulation]") {
    Simulation sim;
    prepare(sim, 3);
    sim.getRuntimeConfig().simulation.maxTicks = 500;
    sim.initialize();

    sim.run();

    REQUIRE(sim.getCurrentTick() == 500);
    REQUIRE_FALSE(sim.isRunning());
    REQUIRE_FALSE(sim.isFinished());
}

TEST_CASE("Simulation: Reinitializing starts a fresh world", "[simulation]") {
    Simulation sim;
    prepare(sim, 5);
    sim.initialize();
    for (int i = 0; i < 100; ++i) {
        sim.step();
    }

    sim.initialize();

    REQUIRE(sim.getCurrentTick() == 0);
    REQUIRE(sim.getWorld().getFoos().empty());
    REQUIRE(sim.getEventLog().size() == 0);
}

// ============================================================
// Errors and configuration
// ============================================================

TEST_CASE("Simulation: Stepping before initialize is a logic error", "[simulation]") {
    Simulation sim;

    REQUIRE_THROWS_AS(sim.step(), std::logic_error);
    REQUIRE_THROWS_AS(sim.getWorld(), std::logic_error);
    REQUIRE(sim.getCurrentTick() == 0);
}

TEST_CASE("Simulation: loadConfig applies the JSON sections", "[simulation][config]") {
    Simulation sim;
    nlohmann::json config = {
        {"simulation", {{"seed", 11}, {"maxTicks", 250}}},
        {"report", {{"summaryPath", "run.json"}}}
    };

    sim.loadConfig(config);

    REQUIRE(sim.getRuntimeConfig().simulation.seed == 11);
    REQUIRE(sim.getRuntimeConfig().simulation.maxTicks == 250);
    REQUIRE(sim.getRuntimeConfig().simulation.tickRateMs == 0);
    REQUIRE(sim.getRuntimeConfig().report.summaryPath == "run.json");
}

TEST_CASE("Simulation: A missing config file keeps the defaults", "[simulation][config]") {
    Simulation sim;

    sim.loadConfig(std::string("does_not_exist.json"));

    REQUIRE(sim.getRuntimeConfig().simulation.seed == 0);
    REQUIRE(sim.getRuntimeConfig().simulation.statusEveryTicks == 1000);
}

// ============================================================
// JSON views
// ============================================================

TEST_CASE("Simulation: State JSON lists every robot", "[simulation][json]") {
    Simulation sim;
    prepare(sim, 9);
    sim.setSuccessDraw(constantDraw(0.0));
    sim.initialize();
    sim.step();

    auto state = sim.getStateJson();

    REQUIRE(state["tick"] == 1);
    REQUIRE(state["fleetSize"] == 2);
    REQUIRE(state["money"] == 0);
    REQUIRE(state["finished"] == false);
    REQUIRE(state["robots"].size() == 2);
    REQUIRE(state["robots"][0]["action"] == "MiningFoo");
    REQUIRE(state["robots"][0]["remaining"] == 10);
    REQUIRE(state["robots"][0]["lastCompleted"] == "none");
}

TEST_CASE("Simulation: Summary JSON holds state, metrics and config", "[simulation][json]") {
    Simulation sim;
    prepare(sim, 9);
    sim.setSuccessDraw(constantDraw(0.0));
    sim.initialize();
    for (int i = 0; i < 11; ++i) {
        sim.step();
    }

    auto summary = sim.getSummaryJson();

    REQUIRE(summary.contains("state"));
    REQUIRE(summary["metrics"]["foosMined"] == 2);
    REQUIRE(summary["metrics"]["totalTicks"] == 11);
    REQUIRE(summary["config"]["simulation"]["seed"] == 9);
    REQUIRE(summary["events"]["FOO_MINED"] == 2);
}
