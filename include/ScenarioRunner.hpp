#pragma once

#include "KinematicWorld.hpp"
#include "MapService.hpp"
#include "MetricExtractor.hpp"
#include "RunConfig.hpp"
#include "ScenarioManager.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    inline constexpr const char *RUN_CONFIG_KEY = "run_config";

    struct RunReport
    {
        bool ok = false;
        ScenarioOutcome outcome;
        std::optional<std::vector<MetricSample>> metric;
        std::string error;
    };

    // Builds the road and world described by a RunConfig, spawns the ego and
    // runs the configured scenario, optionally recording it and writing the
    // lateral deviation metric afterwards.
    class ScenarioRunner
    {
    public:
        explicit ScenarioRunner(RunConfig config);

        RunReport run();
        void requestStop() { manager.requestStop(); }

        const RunConfig &config() const { return run_config; }
        const StraightRoadMap &map() const { return road_map; }
        KinematicWorld &world() { return kinematic_world; }

    private:
        RunConfig run_config;
        StraightRoadMap road_map;
        KinematicWorld kinematic_world;
        ScenarioManager manager;
    };

    // Rebuilds the road from the configuration stored in the recording and
    // extracts the ego's lateral deviation.
    std::optional<std::vector<MetricSample>> extractRecordingMetric(const std::string &recording_path,
                                                                     std::string *error = nullptr);

} // namespace trafficscenario
