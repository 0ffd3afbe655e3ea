#include "WorldState.hpp"
#include <stdexcept>
#include <string>

namespace foobar {

    WorldState::WorldState(size_t initialRobots)
        : robots_(initialRobots)
    {
    }

    void WorldState::addRobot() {
        robots_.emplace_back();
    }

    Foo WorldState::mintFoo() {
        Foo foo{ nextFooId_++ };
        foos_.push_back(foo);
        metrics_.foosMined++;
        return foo;
    }

    Bar WorldState::mintBar() {
        Bar bar{ nextBarId_++ };
        bars_.push_back(bar);
        metrics_.barsMined++;
        return bar;
    }

    Foo WorldState::takeFoo() {
        if (foos_.empty()) {
            throw std::logic_error("Foo pool is empty");
        }
        Foo foo = foos_.back();
        foos_.pop_back();
        return foo;
    }

    Bar WorldState::takeBar() {
        if (bars_.empty()) {
            throw std::logic_error("Bar pool is empty");
        }
        Bar bar = bars_.back();
        bars_.pop_back();
        return bar;
    }

    std::vector<Foo> WorldState::takeFoos(size_t count) {
        if (foos_.size() < count) {
            throw std::logic_error("Cannot take " + std::to_string(count) +
                " foos from a pool of " + std::to_string(foos_.size()));
        }
        std::vector<Foo> taken;
        taken.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            taken.push_back(foos_.back());
            foos_.pop_back();
        }
        return taken;
    }

    std::vector<Foobar> WorldState::takeFoobars(size_t count) {
        if (foobars_.size() < count) {
            throw std::logic_error("Cannot take " + std::to_string(count) +
                " foobars from a pool of " + std::to_string(foobars_.size()));
        }
        std::vector<Foobar> taken;
        taken.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            taken.push_back(foobars_.back());
            foobars_.pop_back();
        }
        return taken;
    }

    void WorldState::credit(Money amount) {
        money_ += amount;
        metrics_.moneyEarned += amount;
    }

    void WorldState::debit(Money amount) {
        money_ -= amount;
        metrics_.moneySpent += amount;
    }

} // namespace foobar
