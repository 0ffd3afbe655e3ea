#pragma once

#include "core/Types.hpp"
#include <random>
#include <cstdint>

namespace foobar {

class Random {
public:
    // Get singleton random engine
    static std::mt19937& engine() {
        static std::mt19937 gen(std::random_device{}());
        return gen;
    }

    // Set seed for reproducibility
    static void seed(unsigned int s) {
        engine().seed(s);
    }

    // Uniform distribution [0, 1)
    static double uniform01() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine());
    }

    // Draw source backed by the singleton engine
    static SuccessDraw successDraw() {
        return [] { return uniform01(); };
    }
};

} // namespace foobar
