#include <catch2/catch_all.hpp>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Criteria.hpp"
#include "KinematicWorld.hpp"
#include "LaneKeepingAgent.hpp"
#include "MapService.hpp"
#include "ScenarioManager.hpp"
#include "ScenarioRunner.hpp"
#include "Scenarios.hpp"
#include "db/RecordingDatabase.hpp"

using namespace trafficscenario;

namespace
{
    RunConfig configFor(const std::string &scenario)
    {
        RunConfig config = makeDefaultRunConfig();
        config.scenario = scenario;
        return config;
    }

    std::string tempPath(const std::string &name)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
        return path.string();
    }

    // Removes the observed actor after a number of updates, as if the
    // simulator had lost it mid-run.
    class DestroyActorAfter : public Criterion
    {
    public:
        DestroyActorAfter(IWorld &world, ActorId actor, int updates)
            : Criterion("DestroyActorAfter", actor, 0.0), world(world), remaining(updates)
        {
        }

    protected:
        Status evaluate(double &) override
        {
            if (--remaining == 0)
            {
                REQUIRE(world.destroyActor(result().actor));
            }
            return Status::Running;
        }

    private:
        IWorld &world;
        int remaining;
    };

    class VanishingEgoCrossing : public StationaryObjectCrossing
    {
    public:
        using StationaryObjectCrossing::StationaryObjectCrossing;

        std::vector<std::unique_ptr<Criterion>> createCriteria() override
        {
            auto criteria = StationaryObjectCrossing::createCriteria();
            criteria.push_back(std::make_unique<DestroyActorAfter>(world, ego(), 10));
            return criteria;
        }
    };
}

TEST_CASE("Scenario factory knows every scenario by name", "[scenario]")
{
    StraightRoadMap map;
    KinematicWorld world(map);

    for (const auto &name : scenarioNames())
    {
        auto scenario = makeScenario(name, world, map);
        REQUIRE(scenario != nullptr);
        REQUIRE(scenario->name() == name);
        REQUIRE_FALSE(scenario->isReady());
    }
    REQUIRE(makeScenario("FollowLeadingVehicle", world, map) == nullptr);
}

TEST_CASE("Stationary crossing places the cyclist across the ego lane", "[scenario]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    REQUIRE(ego.has_value());

    StationaryObjectCrossing scenario(world, map);
    std::string error;
    REQUIRE(scenario.setup(*ego, &error));
    REQUIRE(scenario.isReady());
    REQUIRE(scenario.otherActors().size() == 1);

    const ActorId cyclist = scenario.otherActors().front();
    REQUIRE(world.blueprintOf(cyclist).value() == "vehicle.diamondback.century");
    auto pose = world.getPose(cyclist);
    REQUIRE(pose->location.x == Catch::Approx(60.0));
    REQUIRE(pose->location.y == Catch::Approx(1.75 + 0.2 * 3.5));
    REQUIRE(pose->rotation.yaw == Catch::Approx(-90.0));

    REQUIRE(scenario.releaseActors() == 1);
    REQUIRE_FALSE(world.isAlive(cyclist));
    REQUIRE(world.isAlive(*ego));
}

TEST_CASE("Failed setup releases the actors already spawned", "[scenario]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    // Occupies the spot of the oncoming vehicle.
    auto blocker = world.spawnActor("vehicle.audi.tt", map.waypointAt(1, 110.0)->pose());
    REQUIRE(ego.has_value());
    REQUIRE(blocker.has_value());

    ManeuverOppositeDirection scenario(world, map);
    std::string error;
    REQUIRE_FALSE(scenario.setup(*ego, &error));
    REQUIRE(error.rfind("ManeuverOppositeDirection: ", 0) == 0);
    REQUIRE_FALSE(scenario.isReady());
    REQUIRE(scenario.otherActors().empty());
    REQUIRE(world.actorIds().size() == 2);
}

TEST_CASE("Opposite direction maneuver needs enough road ahead", "[scenario]")
{
    RoadConfig road;
    road.length = 100.0;
    StraightRoadMap map(road);
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    REQUIRE(ego.has_value());

    ManeuverOppositeDirection scenario(world, map);
    std::string error;
    REQUIRE_FALSE(scenario.setup(*ego, &error));
    REQUIRE(error == "ManeuverOppositeDirection: road ahead of the ego is too short");
    REQUIRE(world.actorIds().size() == 1);
}

TEST_CASE("Setup fails for a missing ego", "[scenario]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    DynamicObjectCrossing scenario(world, map);

    std::string error;
    REQUIRE_FALSE(scenario.setup(42, &error));
    REQUIRE(error == "ego actor 42 does not exist");
}

TEST_CASE("Manager refuses a scenario that was not set up", "[manager]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    ScenarioManager manager(world);
    StationaryObjectCrossing scenario(world, map);

    ScenarioOutcome outcome = manager.run(scenario);
    REQUIRE_FALSE(outcome.runnable);
    REQUIRE_FALSE(outcome.passed());
    REQUIRE(outcome.behavior_status == Status::Failure);
    REQUIRE(outcome.frames == 0);
}

TEST_CASE("Stationary object crossing passes with the lane keeping agent", "[scenario][run]")
{
    ScenarioRunner runner(configFor("StationaryObjectCrossing"));
    RunReport report = runner.run();

    REQUIRE(report.ok);
    REQUIRE(report.outcome.passed());
    REQUIRE(report.outcome.duration == Catch::Approx(55.0).margin(0.1));
    REQUIRE(report.outcome.criteria.size() == 1);
    REQUIRE(report.outcome.criteria.front().status == Status::Success);
    // The ego goes with the run; scenario actors are released before that.
    REQUIRE(runner.world().actorIds().empty());
}

TEST_CASE("Dynamic object crossing passes with the lane keeping agent", "[scenario][run]")
{
    ScenarioRunner runner(configFor("DynamicObjectCrossing"));
    RunReport report = runner.run();

    REQUIRE(report.ok);
    REQUIRE(report.outcome.passed());
    REQUIRE_FALSE(report.outcome.timed_out);
    REQUIRE(report.outcome.duration < 60.0);
}

TEST_CASE("Opposite direction maneuver passes with the lane keeping agent", "[scenario][run]")
{
    ScenarioRunner runner(configFor("ManeuverOppositeDirection"));
    RunReport report = runner.run();

    REQUIRE(report.ok);
    REQUIRE(report.outcome.passed());
    REQUIRE(report.outcome.duration < 120.0);
}

TEST_CASE("Timeout override stops the run", "[scenario][run]")
{
    RunConfig config = configFor("StationaryObjectCrossing");
    config.timeout = 2.0;
    ScenarioRunner runner(config);
    RunReport report = runner.run();

    REQUIRE(report.ok);
    REQUIRE(report.outcome.timed_out);
    REQUIRE_FALSE(report.outcome.passed());
    REQUIRE(report.outcome.behavior_status == Status::Failure);
    REQUIRE(report.outcome.frames == 40);
    REQUIRE(report.outcome.duration == Catch::Approx(2.0));
}

TEST_CASE("A stop request cancels the run before the first tick", "[scenario][run]")
{
    ScenarioRunner runner(configFor("DynamicObjectCrossing"));
    runner.requestStop();
    RunReport report = runner.run();

    REQUIRE(report.outcome.cancelled);
    REQUIRE_FALSE(report.outcome.passed());
    REQUIRE(report.outcome.behavior_status == Status::Failure);
    REQUIRE(report.outcome.frames == 0);
}

TEST_CASE("Runner reports unknown scenarios and off-road egos", "[scenario][run]")
{
    ScenarioRunner unknown(configFor("FollowLeadingVehicle"));
    RunReport unknown_report = unknown.run();
    REQUIRE_FALSE(unknown_report.ok);
    REQUIRE(unknown_report.error == "unknown scenario: FollowLeadingVehicle");

    RunConfig config = configFor("StationaryObjectCrossing");
    config.ego.lane_id = 3;
    ScenarioRunner off_road(config);
    RunReport off_road_report = off_road.run();
    REQUIRE_FALSE(off_road_report.ok);
    REQUIRE(off_road_report.error == "ego spawn point is not on the road");
}

TEST_CASE("Recorded run yields the lateral deviation metric", "[scenario][run][metric]")
{
    RunConfig config = configFor("DynamicObjectCrossing");
    config.recording_path = tempPath("trafficscenario_run_test.db");
    config.metric_output = tempPath("trafficscenario_run_metric.json");

    ScenarioRunner runner(config);
    RunReport report = runner.run();
    REQUIRE(report.ok);
    REQUIRE(report.metric.has_value());
    REQUIRE(report.metric->size() == report.outcome.frames);
    REQUIRE(report.metric->front().frame == 1);
    for (const auto &sample : *report.metric)
    {
        // The agent keeps the ego on its lane center.
        REQUIRE(std::abs(sample.offset) < 1e-6);
        REQUIRE(sample.lane_half_width == Catch::Approx(1.75));
    }
    REQUIRE(std::filesystem::exists(config.metric_output));

    std::string error;
    auto reloaded = extractRecordingMetric(config.recording_path, &error);
    REQUIRE(reloaded.has_value());
    REQUIRE(reloaded->size() == report.metric->size());
    REQUIRE(reloaded->back().frame == report.metric->back().frame);

    std::filesystem::remove(config.recording_path);
    std::filesystem::remove(config.metric_output);
}

TEST_CASE("Metric extraction needs the stored run configuration", "[metric]")
{
    const std::string path = tempPath("trafficscenario_empty_test.db");
    {
        db::RecordingDatabase recording(path);
        REQUIRE(recording.open());
    }

    std::string error;
    REQUIRE_FALSE(extractRecordingMetric(path, &error).has_value());
    REQUIRE(error == "recording has no run configuration");
    std::filesystem::remove(path);
}

TEST_CASE("Outcome JSON carries status and criteria", "[manager][json]")
{
    ScenarioOutcome outcome;
    outcome.scenario = "DynamicObjectCrossing";
    outcome.runnable = true;
    outcome.behavior_status = Status::Success;
    CriterionResult collision;
    collision.name = "CollisionTest";
    collision.actor = 1;
    collision.status = Status::Success;
    outcome.criteria.push_back(collision);

    auto parsed = nlohmann::json::parse(scenarioOutcomeToJson(outcome));
    REQUIRE(parsed["passed"] == true);
    REQUIRE(parsed["status"] == toString(Status::Success));
    REQUIRE(parsed["criteria"].size() == 1);
    REQUIRE(parsed["criteria"][0]["name"] == "CollisionTest");
    REQUIRE_FALSE(parsed.contains("abort_reason"));
}

TEST_CASE("A failed collision criterion ends the run early", "[manager]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    REQUIRE(ego.has_value());

    StationaryObjectCrossing scenario(world, map);
    REQUIRE(scenario.setup(*ego));
    // Nobody brakes: the ego runs straight into the cyclist.
    REQUIRE(world.setTargetSpeed(*ego, 10.0));

    ScenarioManager manager(world);
    ScenarioOutcome outcome = manager.run(scenario);

    REQUIRE(outcome.runnable);
    REQUIRE(outcome.behavior_status == Status::Failure);
    REQUIRE_FALSE(outcome.passed());
    REQUIRE_FALSE(outcome.timed_out);
    REQUIRE_FALSE(outcome.cancelled);
    REQUIRE(outcome.criteria.size() == 1);
    REQUIRE(outcome.criteria.front().status == Status::Failure);
    REQUIRE(outcome.criteria.front().actual_value == Catch::Approx(1.0));
    REQUIRE(outcome.frames < 100);
    REQUIRE(outcome.duration < StationaryObjectCrossing::RUN_TIME);
    REQUIRE(outcome.behavior_tree.find("StationaryObjectCrossing [FAILURE]") != std::string::npos);

    REQUIRE(world.actorIds().size() == 1);
    REQUIRE(world.isAlive(*ego));
}

TEST_CASE("Losing the ego aborts the run", "[manager]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    REQUIRE(ego.has_value());

    VanishingEgoCrossing scenario(world, map);
    REQUIRE(scenario.setup(*ego));
    LaneKeepingAgent agent(world, *ego);

    ScenarioManager manager(world);
    manager.setAgent(&agent);
    ScenarioOutcome outcome = manager.run(scenario);

    REQUIRE(outcome.abort_reason == "ego actor can no longer be driven");
    REQUIRE(outcome.behavior_status == Status::Failure);
    REQUIRE_FALSE(outcome.passed());
    REQUIRE_FALSE(outcome.timed_out);
    REQUIRE(outcome.frames == 10);
    REQUIRE(world.actorIds().empty());
}

TEST_CASE("A manager runs again after a cancelled run", "[manager]")
{
    StraightRoadMap map;
    KinematicWorld world(map);
    auto ego = world.spawnActor("vehicle.lincoln.mkz2017", map.waypointAt(-1, 20.0)->pose());
    REQUIRE(ego.has_value());

    StationaryObjectCrossing scenario(world, map);
    ScenarioManager manager(world);

    REQUIRE(scenario.setup(*ego));
    manager.requestStop();
    ScenarioOutcome cancelled = manager.run(scenario);
    REQUIRE(cancelled.cancelled);
    REQUIRE(cancelled.frames == 0);
    REQUIRE_FALSE(manager.stopRequested());

    REQUIRE(scenario.setup(*ego));
    scenario.setTimeout(1.0);
    ScenarioOutcome second = manager.run(scenario);
    REQUIRE_FALSE(second.cancelled);
    REQUIRE(second.timed_out);
    REQUIRE(second.frames == 20);
}
