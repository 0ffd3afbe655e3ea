#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace foobar {

    // Records what happened during a run. Every event is also written to the
    // log as one line.
    class EventLog {
    public:
        using EventCallback = std::function<void(const SimEvent&)>;

        EventLog() = default;

        void record(SimEvent event);
        void record(Tick tick, EventType type, size_t robot, int64_t amount, std::string detail = "");

        const std::vector<SimEvent>& getEvents() const { return events_; }
        size_t size() const { return events_.size(); }
        size_t count(EventType type) const;
        void clear();

        // When false, events are recorded but not logged
        void setEcho(bool echo) { echo_ = echo; }

        void setEventCallback(EventCallback cb) { eventCallback_ = std::move(cb); }

        // The log line for an event
        static std::string format(const SimEvent& event);

        nlohmann::json toJson(size_t maxEvents = 0) const;

        // maxEvents = 0 exports everything. Returns false if the file can't be written.
        bool exportToJson(const std::string& filepath, size_t maxEvents = 0) const;

        // One CSV file per event type inside directory
        bool exportToCsv(const std::string& directory) const;

    private:
        std::vector<SimEvent> events_;
        std::map<EventType, size_t> counts_;
        bool echo_ = true;
        EventCallback eventCallback_;
    };

} // namespace foobar
