#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <optional>

namespace foobar {

    using Tick = uint64_t;
    using SerialId = uint64_t;
    using Money = int64_t;

    // Source of uniform samples in [0, 1)
    using SuccessDraw = std::function<double()>;

    // ---- Economy constants ----------------------------------------------------
    constexpr Tick TICK_MS = 100;

    constexpr Tick CHANGING_TASK_TICKS = 50;
    constexpr Tick MINING_FOO_TICKS = 10;
    constexpr Tick MINING_BAR_MIN_TICKS = 5;
    constexpr double MINING_BAR_SPREAD_TICKS = 15.0;
    constexpr Tick ASSEMBLING_TICKS = 20;
    constexpr Tick SELLING_TICKS = 100;
    constexpr Tick BUYING_ROBOT_TICKS = 100;

    constexpr double ASSEMBLY_SUCCESS_RATE = 0.6;
    constexpr size_t MAX_FOOBARS_PER_SALE = 5;
    constexpr Money FOOBAR_PRICE = 1;
    constexpr Money ROBOT_PRICE = 3;
    constexpr size_t FOOS_PER_ROBOT = 6;

    // Mine foo while the projected foo surplus over bars stays below this
    constexpr double FOO_SURPLUS_TARGET = 6.0;

    constexpr size_t INITIAL_ROBOTS = 2;
    constexpr size_t TARGET_FLEET_SIZE = 30;

    struct Foo {
        SerialId id;

        bool operator==(const Foo& other) const { return id == other.id; }
    };

    struct Bar {
        SerialId id;

        bool operator==(const Bar& other) const { return id == other.id; }
    };

    struct Foobar {
        Foo foo;
        Bar bar;
    };

    enum class ActionKind {
        IDLE,
        CHANGING_TASK,
        MINING_FOO,
        MINING_BAR,
        ASSEMBLING_FOOBAR,
        SELLING_FOOBARS,
        BUYING_ROBOT
    };

    enum class EventType {
        FOO_MINED,
        BAR_MINED,
        FOOBAR_ASSEMBLED,
        ASSEMBLY_FAILED,
        FOOBARS_SOLD,
        ROBOT_BOUGHT,
        SIMULATION_FINISHED
    };

    struct SimEvent {
        Tick tick;
        EventType type;
        size_t robot;           // Index of the robot that caused the event
        int64_t amount;         // Serial, count or money depending on type
        std::string detail;
    };

    struct SimulationMetrics {
        uint64_t totalTicks = 0;
        uint64_t foosMined = 0;
        uint64_t barsMined = 0;
        uint64_t foobarsAssembled = 0;
        uint64_t assemblyFailures = 0;
        uint64_t foosDiscarded = 0;
        uint64_t foobarsSold = 0;
        uint64_t foosSpentOnRobots = 0;
        uint64_t robotsBought = 0;
        Money moneyEarned = 0;
        Money moneySpent = 0;
        uint64_t taskSwitches = 0;
    };

    inline std::string toString(ActionKind kind) {
        switch (kind) {
        case ActionKind::IDLE: return "Idle";
        case ActionKind::CHANGING_TASK: return "ChangingTask";
        case ActionKind::MINING_FOO: return "MiningFoo";
        case ActionKind::MINING_BAR: return "MiningBar";
        case ActionKind::ASSEMBLING_FOOBAR: return "AssemblingFoobar";
        case ActionKind::SELLING_FOOBARS: return "SellingFoobars";
        case ActionKind::BUYING_ROBOT: return "BuyingRobot";
        }
        return "Unknown";
    }

    inline std::string toString(const std::optional<ActionKind>& kind) {
        return kind ? toString(*kind) : "none";
    }

    inline std::string toString(EventType type) {
        switch (type) {
        case EventType::FOO_MINED: return "FOO_MINED";
        case EventType::BAR_MINED: return "BAR_MINED";
        case EventType::FOOBAR_ASSEMBLED: return "FOOBAR_ASSEMBLED";
        case EventType::ASSEMBLY_FAILED: return "ASSEMBLY_FAILED";
        case EventType::FOOBARS_SOLD: return "FOOBARS_SOLD";
        case EventType::ROBOT_BOUGHT: return "ROBOT_BOUGHT";
        case EventType::SIMULATION_FINISHED: return "SIMULATION_FINISHED";
        }
        return "UNKNOWN";
    }

} // namespace foobar
