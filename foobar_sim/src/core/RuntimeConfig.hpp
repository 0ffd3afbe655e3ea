#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <type_traits>

namespace foobar {

    /// JSON-serialisable run settings. The economy itself (durations, prices,
    /// fleet target) is fixed in Types.hpp; this only covers how a run is
    /// driven and what it writes out.

    struct RuntimeConfig {

        // ---- Simulation lifecycle ------------------------------------------------
        struct SimulationParams {
            uint32_t seed = 0;             // 0 = seed from std::random_device
            uint64_t maxTicks = 0;         // 0 = unlimited
            int      tickRateMs = 0;       // 0 = as fast as possible
            uint64_t statusEveryTicks = 1000;
        } simulation;

        // ---- Output files (empty = disabled) -------------------------------------
        struct ReportParams {
            std::string eventLogPath;
            std::string eventCsvDir;
            std::string summaryPath;
        } report;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["simulation"] = {
                {"seed",             simulation.seed},
                {"maxTicks",         simulation.maxTicks},
                {"tickRateMs",       simulation.tickRateMs},
                {"statusEveryTicks", simulation.statusEveryTicks}
            };

            j["report"] = {
                {"eventLogPath", report.eventLogPath},
                {"eventCsvDir",  report.eventCsvDir},
                {"summaryPath",  report.summaryPath}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("simulation")) {
                auto& s = j["simulation"];
                get(s, "seed", simulation.seed);
                get(s, "maxTicks", simulation.maxTicks);
                get(s, "tickRateMs", simulation.tickRateMs);
                get(s, "statusEveryTicks", simulation.statusEveryTicks);
            }

            if (j.contains("report")) {
                auto& r = j["report"];
                get(r, "eventLogPath", report.eventLogPath);
                get(r, "eventCsvDir", report.eventCsvDir);
                get(r, "summaryPath", report.summaryPath);
            }
        }
    };

} // namespace foobar
