#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace foobar {

    Simulation::Simulation() {}

    Simulation::~Simulation() {
        stop();
    }

    void Simulation::loadConfig(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", configPath);
            return;
        }

        try {
            config_ = nlohmann::json::parse(file);
            loadConfig(config_);
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse config: {}", e.what());
        }
    }

    void Simulation::loadConfig(const nlohmann::json& config) {
        config_ = config;
        rtConfig_.fromJson(config);

        // Logging settings (not in RuntimeConfig – keeps Logger decoupled)
        if (config.contains("logging")) {
            auto& log = config["logging"];
            Logger::init(
                log.value("file", "foobar_sim.log"),
                log.value("level", "info"),
                log.value("console", true)
            );
        }

        Logger::info("Configuration loaded (seed {}, max ticks {})",
            rtConfig_.simulation.seed, rtConfig_.simulation.maxTicks);
    }

    void Simulation::initialize() {
        Logger::info("Initializing simulation...");

        if (rtConfig_.simulation.seed != 0) {
            Random::seed(rtConfig_.simulation.seed);
        }
        if (!successDraw_) {
            successDraw_ = Random::successDraw();
        }

        world_ = std::make_unique<WorldState>(INITIAL_ROBOTS);
        eventLog_.clear();
        progress_ = std::make_unique<ProgressEngine>(*world_, successDraw_, &eventLog_);
        dispatch_ = std::make_unique<DispatchPolicy>(*world_, successDraw_);
        finished_ = false;

        Logger::info("Simulation initialized with {} robots, target fleet {}",
            world_->getFleetSize(), TARGET_FLEET_SIZE);
    }

    bool Simulation::step() {
        if (!world_) {
            throw std::logic_error("Simulation::step() called before initialize()");
        }
        if (finished_) {
            return false;
        }

        progress_->advance();
        dispatch_->dispatch();

        if (hasReachedTargetFleet()) {
            finish();
            return false;
        }

        Tick tick = world_->getClock().tick();
        world_->getMutableMetrics().totalTicks = tick;

        uint64_t every = rtConfig_.simulation.statusEveryTicks;
        if (every > 0 && tick % every == 0) {
            Logger::info("Tick {} ({}): {} robots, {} foos, {} bars, {} foobars, {} money",
                tick, world_->getClock().currentElapsedString(), world_->getFleetSize(),
                world_->getFoos().size(), world_->getBars().size(),
                world_->getFoobars().size(), world_->getMoney());
        }

        return true;
    }

    void Simulation::run() {
        if (running_.load()) {
            Logger::warn("Simulation already running");
            return;
        }

        running_ = true;
        Logger::info("Simulation started (tick rate: {}ms)", rtConfig_.simulation.tickRateMs);

        uint64_t maxTicks = rtConfig_.simulation.maxTicks;
        while (running_.load() && step()) {
            if (maxTicks > 0 && getCurrentTick() >= maxTicks) {
                Logger::warn("Reached max ticks ({}) with {} robots, stopping",
                    maxTicks, world_->getFleetSize());
                break;
            }

            if (rtConfig_.simulation.tickRateMs > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(rtConfig_.simulation.tickRateMs));
            }
        }

        running_ = false;
        Logger::info("Simulation stopped at tick {}", getCurrentTick());
    }

    bool Simulation::hasReachedTargetFleet() const {
        return world_ && world_->getFleetSize() >= TARGET_FLEET_SIZE;
    }

    Tick Simulation::getCurrentTick() const {
        return world_ ? world_->getTick() : 0;
    }

    WorldState& Simulation::getWorld() {
        if (!world_) {
            throw std::logic_error("Simulation not initialized");
        }
        return *world_;
    }

    const WorldState& Simulation::getWorld() const {
        if (!world_) {
            throw std::logic_error("Simulation not initialized");
        }
        return *world_;
    }

    void Simulation::finish() {
        finished_ = true;
        Tick tick = world_->getTick();
        world_->getMutableMetrics().totalTicks = tick;

        eventLog_.record(tick, EventType::SIMULATION_FINISHED, 0,
            static_cast<int64_t>(world_->getFleetSize()),
            fmt::format("after {} ticks ({} simulated)", tick, world_->getClock().currentElapsedString()));
    }

    nlohmann::json Simulation::getStateJson() const {
        const auto& world = getWorld();

        nlohmann::json state;
        state["tick"] = world.getTick();
        state["elapsedSeconds"] = world.getClock().getElapsedSeconds();
        state["elapsed"] = world.getClock().currentElapsedString();
        state["finished"] = finished_;
        state["fleetSize"] = world.getFleetSize();
        state["foos"] = world.getFoos().size();
        state["bars"] = world.getBars().size();
        state["foobars"] = world.getFoobars().size();
        state["money"] = world.getMoney();

        nlohmann::json robots = nlohmann::json::array();
        const auto& list = world.getRobots();
        for (size_t i = 0; i < list.size(); ++i) {
            const auto& action = list[i].getAction();
            robots.push_back({
                {"index", i},
                {"action", toString(action.getKind())},
                {"pending", toString(action.getPendingKind())},
                {"remaining", action.getRemaining()},
                {"lastCompleted", toString(list[i].getLastCompleted())}
            });
        }
        state["robots"] = robots;

        return state;
    }

    nlohmann::json Simulation::getMetricsJson() const {
        const auto& m = getWorld().getMetrics();

        nlohmann::json j;
        j["totalTicks"] = m.totalTicks;
        j["foosMined"] = m.foosMined;
        j["barsMined"] = m.barsMined;
        j["foobarsAssembled"] = m.foobarsAssembled;
        j["assemblyFailures"] = m.assemblyFailures;
        j["foosDiscarded"] = m.foosDiscarded;
        j["foobarsSold"] = m.foobarsSold;
        j["foosSpentOnRobots"] = m.foosSpentOnRobots;
        j["robotsBought"] = m.robotsBought;
        j["moneyEarned"] = m.moneyEarned;
        j["moneySpent"] = m.moneySpent;
        j["taskSwitches"] = m.taskSwitches;
        return j;
    }

    nlohmann::json Simulation::getSummaryJson() const {
        nlohmann::json summary;
        summary["state"] = getStateJson();
        summary["metrics"] = getMetricsJson();
        summary["config"] = rtConfig_.toJson();

        nlohmann::json counts;
        for (auto type : { EventType::FOO_MINED, EventType::BAR_MINED, EventType::FOOBAR_ASSEMBLED,
                           EventType::ASSEMBLY_FAILED, EventType::FOOBARS_SOLD, EventType::ROBOT_BOUGHT }) {
            counts[toString(type)] = eventLog_.count(type);
        }
        summary["events"] = counts;

        return summary;
    }

    bool Simulation::writeSummary(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::error("Could not open {} for writing", path);
            return false;
        }

        file << getSummaryJson().dump(2) << "\n";
        Logger::info("Wrote summary to {}", path);
        return true;
    }

    bool Simulation::writeReports() const {
        bool ok = true;
        const auto& report = rtConfig_.report;

        if (!report.eventLogPath.empty()) {
            ok = eventLog_.exportToJson(report.eventLogPath) && ok;
        }
        if (!report.eventCsvDir.empty()) {
            ok = eventLog_.exportToCsv(report.eventCsvDir) && ok;
        }
        if (!report.summaryPath.empty()) {
            ok = writeSummary(report.summaryPath) && ok;
        }

        return ok;
    }

} // namespace foobar
