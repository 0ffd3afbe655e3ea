#include <catch2/catch_test_macros.hpp>
#include "engine/EventLog.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace foobar;
namespace fs = std::filesystem;

class EventLogTestFixture {
public:
    EventLogTestFixture() {
        testDir_ = fs::temp_directory_path() / "foobar_eventlog_test";
        fs::create_directories(testDir_);
        log_.setEcho(false);
    }

    ~EventLogTestFixture() {
        fs::remove_all(testDir_);
    }

    fs::path testDir_;
    EventLog log_;
};

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Initial state", "[eventlog]") {
    REQUIRE(log_.size() == 0);
    REQUIRE(log_.getEvents().empty());
    REQUIRE(log_.count(EventType::FOO_MINED) == 0);
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Record keeps order and counts per type", "[eventlog]") {
    log_.record(10, EventType::FOO_MINED, 0, 0);
    log_.record(10, EventType::FOO_MINED, 1, 1);
    log_.record(15, EventType::BAR_MINED, 0, 0);

    REQUIRE(log_.size() == 3);
    REQUIRE(log_.count(EventType::FOO_MINED) == 2);
    REQUIRE(log_.count(EventType::BAR_MINED) == 1);
    REQUIRE(log_.count(EventType::ROBOT_BOUGHT) == 0);
    REQUIRE(log_.getEvents()[1].robot == 1);
    REQUIRE(log_.getEvents()[2].tick == 15);
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Clear drops events and counts", "[eventlog]") {
    log_.record(1, EventType::FOOBARS_SOLD, 0, 5);
    log_.clear();

    REQUIRE(log_.size() == 0);
    REQUIRE(log_.count(EventType::FOOBARS_SOLD) == 0);
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Callback sees every recorded event", "[eventlog]") {
    int calls = 0;
    EventType lastType = EventType::FOO_MINED;
    log_.setEventCallback([&](const SimEvent& e) {
        calls++;
        lastType = e.type;
    });

    log_.record(3, EventType::BAR_MINED, 0, 0);
    log_.record(4, EventType::ROBOT_BOUGHT, 1, 3);

    REQUIRE(calls == 2);
    REQUIRE(lastType == EventType::ROBOT_BOUGHT);
}

TEST_CASE("EventLog: Format names the robot and what it did", "[eventlog]") {
    std::string line = EventLog::format(SimEvent{ 120, EventType::FOOBARS_SOLD, 4, 5, "" });

    REQUIRE(line.find("tick") != std::string::npos);
    REQUIRE(line.find("120") != std::string::npos);
    REQUIRE(line.find("robot 4 sold 5 foobars") != std::string::npos);
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: JSON holds totals, counts and events", "[eventlog]") {
    for (int i = 0; i < 5; ++i) {
        log_.record(static_cast<Tick>(i), EventType::FOO_MINED, 0, i);
    }
    log_.record(9, EventType::SIMULATION_FINISHED, 0, 30, "done");

    auto j = log_.toJson();
    REQUIRE(j["totalEvents"] == 6);
    REQUIRE(j["counts"]["FOO_MINED"] == 5);
    REQUIRE(j["counts"]["SIMULATION_FINISHED"] == 1);
    REQUIRE(j["events"].size() == 6);
    REQUIRE(j["events"][5]["detail"] == "done");

    auto limited = log_.toJson(2);
    REQUIRE(limited["totalEvents"] == 6);
    REQUIRE(limited["events"].size() == 2);
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Export to JSON file", "[eventlog]") {
    log_.record(1, EventType::FOO_MINED, 0, 0);
    log_.record(2, EventType::BAR_MINED, 1, 0);

    auto path = testDir_ / "events.json";
    REQUIRE(log_.exportToJson(path.string()));
    REQUIRE(fs::exists(path));

    std::ifstream in(path);
    auto j = nlohmann::json::parse(in);
    REQUIRE(j["events"].size() == 2);
    REQUIRE(j["events"][1]["type"] == "BAR_MINED");
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Export to JSON fails on a bad path", "[eventlog]") {
    auto path = testDir_ / "missing" / "dir" / "events.json";
    REQUIRE_FALSE(log_.exportToJson(path.string()));
}

TEST_CASE_METHOD(EventLogTestFixture, "EventLog: Export to CSV writes one file per type", "[eventlog]") {
    log_.record(1, EventType::FOO_MINED, 0, 0);
    log_.record(2, EventType::FOO_MINED, 1, 1);
    log_.record(3, EventType::ASSEMBLY_FAILED, 0, 0, "foo #1 + bar #0");

    auto dir = testDir_ / "csv";
    REQUIRE(log_.exportToCsv(dir.string()));

    REQUIRE(fs::exists(dir / "FOO_MINED.csv"));
    REQUIRE(fs::exists(dir / "ASSEMBLY_FAILED.csv"));
    REQUIRE_FALSE(fs::exists(dir / "BAR_MINED.csv"));

    std::ifstream in(dir / "FOO_MINED.csv");
    std::string header;
    std::getline(in, header);
    REQUIRE(header == "tick,robot,amount,detail");

    int rows = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) rows++;
    }
    REQUIRE(rows == 2);
}
