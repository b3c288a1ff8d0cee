#include "ScenarioRunner.hpp"

#include "ActorPool.hpp"
#include "LaneKeepingAgent.hpp"
#include "RunConfigJson.hpp"
#include "Scenarios.hpp"
#include "db/RecordingDatabase.hpp"

#include <memory>
#include <utility>

namespace trafficscenario
{
    ScenarioRunner::ScenarioRunner(RunConfig config)
        : run_config(std::move(config)),
          road_map(run_config.road),
          kinematic_world(road_map),
          manager(kinematic_world, run_config.time_step)
    {
    }

    RunReport ScenarioRunner::run()
    {
        RunReport report;
        report.outcome.scenario = run_config.scenario;
        report.outcome.behavior_status = Status::Failure;

        std::unique_ptr<Scenario> scenario = makeScenario(run_config.scenario, kinematic_world, road_map);
        if (!scenario)
        {
            report.error = "unknown scenario: " + run_config.scenario;
            return report;
        }
        if (run_config.timeout.has_value())
        {
            scenario->setTimeout(*run_config.timeout);
        }

        auto spawn = road_map.waypointAt(run_config.ego.lane_id, run_config.ego.spawn_s);
        if (!spawn.has_value())
        {
            report.error = "ego spawn point is not on the road";
            return report;
        }

        ActorPool ego_pool(kinematic_world);
        auto ego = ego_pool.requestActor(run_config.ego.blueprint, spawn->pose(), EGO_ROLE, &report.error);
        if (!ego.has_value())
        {
            return report;
        }

        std::unique_ptr<db::RecordingDatabase> recording;
        if (!run_config.recording_path.empty())
        {
            recording = std::make_unique<db::RecordingDatabase>(run_config.recording_path);
            if (!recording->open(&report.error) || !recording->clear(&report.error) ||
                !recording->setMetadata(RUN_CONFIG_KEY, runConfigToJson(run_config), &report.error))
            {
                return report;
            }
        }

        std::string setup_error;
        if (!scenario->setup(*ego, &setup_error))
        {
            report.outcome.setup_error = setup_error;
            report.error = setup_error;
            return report;
        }

        AgentConfig agent_config;
        agent_config.cruise_speed = run_config.ego.cruise_speed;
        LaneKeepingAgent agent(kinematic_world, *ego, agent_config);

        manager.setAgent(&agent);
        manager.setRecorder(recording.get());
        report.outcome = manager.run(*scenario);
        manager.setAgent(nullptr);
        manager.setRecorder(nullptr);

        if (!report.outcome.recording_error.empty())
        {
            report.error = "recording failed: " + report.outcome.recording_error;
            return report;
        }

        if (recording && !run_config.metric_output.empty())
        {
            report.metric = extractLateralDeviation(*recording, road_map, &report.error);
            if (!report.metric.has_value() ||
                !writeMetricJson(run_config.metric_output, *report.metric, &report.error))
            {
                return report;
            }
        }

        report.ok = true;
        return report;
    }

    std::optional<std::vector<MetricSample>> extractRecordingMetric(const std::string &recording_path,
                                                                     std::string *error)
    {
        db::RecordingDatabase recording(recording_path);
        if (!recording.open(error))
        {
            return std::nullopt;
        }

        std::string load_error;
        auto stored = recording.metadata(RUN_CONFIG_KEY, &load_error);
        if (!stored.has_value())
        {
            if (error)
            {
                *error = load_error.empty() ? "recording has no run configuration" : load_error;
            }
            return std::nullopt;
        }

        ConfigParseResult parsed = runConfigFromJson(*stored);
        if (!parsed.ok)
        {
            if (error)
            {
                *error = "stored run configuration is invalid: " + parsed.errors.front();
            }
            return std::nullopt;
        }

        StraightRoadMap map(parsed.config.road);
        return extractLateralDeviation(recording, map, error);
    }

} // namespace trafficscenario
