#pragma once

#include "core/RuntimeConfig.hpp"
#include "engine/WorldState.hpp"
#include "engine/EventLog.hpp"
#include "engine/ProgressEngine.hpp"
#include "engine/DispatchPolicy.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace foobar {

    // Drives the world tick by tick until the fleet reaches TARGET_FLEET_SIZE.
    // Each tick: progress all robots, dispatch the idle ones, check for the
    // end, advance the clock.
    class Simulation {
    public:
        Simulation();
        ~Simulation();

        // Load configuration
        void loadConfig(const std::string& configPath);
        void loadConfig(const nlohmann::json& config);

        // Replace the random source; takes effect on the next initialize()
        void setSuccessDraw(SuccessDraw draw) { successDraw_ = std::move(draw); }

        // Fresh world with INITIAL_ROBOTS idle robots
        void initialize();

        // Run one tick. Returns false once the simulation has finished.
        bool step();

        // Step until finished, maxTicks is hit or stop() is called
        void run();
        void stop() { running_ = false; }

        // Status
        bool isRunning() const { return running_.load(); }
        bool isFinished() const { return finished_; }
        bool hasReachedTargetFleet() const;
        Tick getCurrentTick() const;

        // RuntimeConfig access
        RuntimeConfig& getRuntimeConfig() { return rtConfig_; }
        const RuntimeConfig& getRuntimeConfig() const { return rtConfig_; }

        // World and event access
        WorldState& getWorld();
        const WorldState& getWorld() const;
        EventLog& getEventLog() { return eventLog_; }
        const EventLog& getEventLog() const { return eventLog_; }

        // Get state as JSON
        nlohmann::json getStateJson() const;
        nlohmann::json getMetricsJson() const;
        nlohmann::json getSummaryJson() const;

        // Write the outputs named in RuntimeConfig::report. Returns false if any failed.
        bool writeReports() const;
        bool writeSummary(const std::string& path) const;

    private:
        RuntimeConfig rtConfig_;
        nlohmann::json config_;

        std::unique_ptr<WorldState> world_;
        EventLog eventLog_;
        std::unique_ptr<ProgressEngine> progress_;
        std::unique_ptr<DispatchPolicy> dispatch_;
        SuccessDraw successDraw_;

        std::atomic<bool> running_{ false };
        bool finished_ = false;

        void finish();
    };

} // namespace foobar
