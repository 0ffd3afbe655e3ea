#pragma once

#include "Types.hpp"
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace foobar {

    class Action;

    struct IdleAction {
        std::optional<ActionKind> previous;
    };

    // Pending successor of a task switch. Special members live in Action.cpp
    // where Action is complete.
    struct ChangingTaskAction {
        explicit ChangingTaskAction(Action action);
        ChangingTaskAction(ChangingTaskAction&& other) noexcept;
        ChangingTaskAction& operator=(ChangingTaskAction&& other) noexcept;
        ~ChangingTaskAction();

        std::unique_ptr<Action> next;
    };

    struct MiningFooAction {};

    struct MiningBarAction {};

    struct AssemblingFoobarAction {
        Foo foo;
        Bar bar;
    };

    struct SellingFoobarsAction {
        std::vector<Foobar> foobars;
    };

    struct BuyingRobotAction {
        std::vector<Foo> foos;
    };

    // What a robot is doing and for how many more ticks
    class Action {
    public:
        using Payload = std::variant<
            IdleAction,
            ChangingTaskAction,
            MiningFooAction,
            MiningBarAction,
            AssemblingFoobarAction,
            SellingFoobarsAction,
            BuyingRobotAction>;

        static Action idle(std::optional<ActionKind> previous = std::nullopt);
        static Action changingTask(Action next);
        static Action miningFoo();
        // Duration is round(draw * 15) + 5 ticks
        static Action miningBar(double draw);
        static Action assemblingFoobar(Foo foo, Bar bar);
        // Throws std::invalid_argument for more than MAX_FOOBARS_PER_SALE
        static Action sellingFoobars(std::vector<Foobar> foobars);
        // Throws std::invalid_argument unless exactly FOOS_PER_ROBOT foos
        static Action buyingRobot(std::vector<Foo> foos);

        ActionKind getKind() const;
        Tick getRemaining() const { return remaining_; }
        bool isIdle() const { return std::holds_alternative<IdleAction>(payload_); }
        bool isDone() const { return remaining_ == 0; }

        // Decrement by one tick, never below zero. Returns true once done.
        bool tickDown();

        // The action that will actually run: the wrapped action of a
        // ChangingTask, otherwise this action itself
        const Action& pending() const;
        ActionKind getPendingKind() const { return pending().getKind(); }

        const Payload& getPayload() const { return payload_; }
        Payload& getMutablePayload() { return payload_; }

        template<typename T>
        const T* as() const { return std::get_if<T>(&payload_); }

        template<typename T>
        T* as() { return std::get_if<T>(&payload_); }

        std::string describe() const;

    private:
        Action(Payload payload, Tick remaining);

        Payload payload_;
        Tick remaining_ = 0;
    };

} // namespace foobar
