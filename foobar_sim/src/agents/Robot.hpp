#pragma once

#include "core/Types.hpp"
#include "core/Action.hpp"
#include <optional>
#include <utility>

namespace foobar {

    // A robot is identified by its slot in the world's robot list and is always
    // doing exactly one Action.
    class Robot {
    public:
        Robot();

        const Action& getAction() const { return action_; }
        Action& getMutableAction() { return action_; }
        void setAction(Action action) { action_ = std::move(action); }

        bool isIdle() const { return action_.isIdle(); }

        // What the robot finished most recently, kept while it works on
        // something else
        std::optional<ActionKind> getLastCompleted() const { return lastCompleted_; }

        // Idle.previous when idle, nothing otherwise
        std::optional<ActionKind> getPreviousAction() const;

        // Record a finished action and go idle
        void complete(ActionKind kind);

    private:
        Action action_;
        std::optional<ActionKind> lastCompleted_;
    };

} // namespace foobar
