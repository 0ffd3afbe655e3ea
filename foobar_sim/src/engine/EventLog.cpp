#include "EventLog.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace foobar {

    void EventLog::record(SimEvent event) {
        if (echo_) {
            Logger::info("{}", format(event));
        }
        counts_[event.type]++;
        events_.push_back(std::move(event));

        if (eventCallback_) {
            eventCallback_(events_.back());
        }
    }

    void EventLog::record(Tick tick, EventType type, size_t robot, int64_t amount, std::string detail) {
        record(SimEvent{ tick, type, robot, amount, std::move(detail) });
    }

    size_t EventLog::count(EventType type) const {
        auto it = counts_.find(type);
        return it != counts_.end() ? it->second : 0;
    }

    void EventLog::clear() {
        events_.clear();
        counts_.clear();
    }

    std::string EventLog::format(const SimEvent& event) {
        std::string line = fmt::format("[tick {:>6}] ", event.tick);

        switch (event.type) {
        case EventType::FOO_MINED:
            line += fmt::format("robot {} mined foo #{}", event.robot, event.amount);
            break;
        case EventType::BAR_MINED:
            line += fmt::format("robot {} mined bar #{}", event.robot, event.amount);
            break;
        case EventType::FOOBAR_ASSEMBLED:
            line += fmt::format("robot {} assembled foobar {}", event.robot, event.detail);
            break;
        case EventType::ASSEMBLY_FAILED:
            line += fmt::format("robot {} failed to assemble {}", event.robot, event.detail);
            break;
        case EventType::FOOBARS_SOLD:
            line += fmt::format("robot {} sold {} foobars", event.robot, event.amount);
            break;
        case EventType::ROBOT_BOUGHT:
            line += fmt::format("robot {} bought a robot, fleet is now {}", event.robot, event.amount);
            break;
        case EventType::SIMULATION_FINISHED:
            line += fmt::format("finished with {} robots {}", event.amount, event.detail);
            break;
        }

        return line;
    }

    nlohmann::json EventLog::toJson(size_t maxEvents) const {
        size_t limit = (maxEvents > 0) ? std::min(maxEvents, events_.size()) : events_.size();

        nlohmann::json events = nlohmann::json::array();
        for (size_t i = 0; i < limit; ++i) {
            const auto& e = events_[i];
            events.push_back({
                {"tick", e.tick},
                {"type", toString(e.type)},
                {"robot", e.robot},
                {"amount", e.amount},
                {"detail", e.detail}
            });
        }

        nlohmann::json counts;
        for (const auto& [type, n] : counts_) {
            counts[toString(type)] = n;
        }

        return {
            {"totalEvents", events_.size()},
            {"counts", counts},
            {"events", events}
        };
    }

    bool EventLog::exportToJson(const std::string& filepath, size_t maxEvents) const {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            Logger::error("Could not open {} for writing", filepath);
            return false;
        }

        auto j = toJson(maxEvents);
        file << j.dump(2) << "\n";
        Logger::info("Exported {} events to {}", j["events"].size(), filepath);
        return true;
    }

    bool EventLog::exportToCsv(const std::string& directory) const {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            Logger::error("Could not create {}: {}", directory, ec.message());
            return false;
        }

        std::map<EventType, std::ofstream> files;
        for (const auto& e : events_) {
            auto it = files.find(e.type);
            if (it == files.end()) {
                auto path = std::filesystem::path(directory) / (toString(e.type) + ".csv");
                std::ofstream out(path);
                if (!out.is_open()) {
                    Logger::error("Could not open {} for writing", path.string());
                    return false;
                }
                out << "tick,robot,amount,detail\n";
                it = files.emplace(e.type, std::move(out)).first;
            }
            it->second << e.tick << ',' << e.robot << ',' << e.amount << ",\"" << e.detail << "\"\n";
        }

        Logger::info("Exported {} event types as CSV to {}", files.size(), directory);
        return true;
    }

} // namespace foobar
