#include "Robot.hpp"

namespace foobar {

    Robot::Robot()
        : action_(Action::idle())
    {
    }

    std::optional<ActionKind> Robot::getPreviousAction() const {
        if (auto* idle = action_.as<IdleAction>()) {
            return idle->previous;
        }
        return std::nullopt;
    }

    void Robot::complete(ActionKind kind) {
        lastCompleted_ = kind;
        action_ = Action::idle(kind);
    }

} // namespace foobar
