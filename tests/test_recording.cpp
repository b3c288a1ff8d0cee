#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "MapService.hpp"
#include "MetricExtractor.hpp"
#include "db/RecordingDatabase.hpp"

using namespace trafficscenario;

namespace
{
    ActorState stateAt(ActorId id, uint64_t frame, double x, double y)
    {
        ActorState state;
        state.actor_id = id;
        state.frame = frame;
        state.pose.location = {x, y, 0.0};
        state.velocity = {10.0, 0.0, 0.0};
        return state;
    }

    // Ego driving along lane -1 half a meter right of its center, frames 1..10.
    void recordOffsetRun(db::RecordingDatabase &recording)
    {
        REQUIRE(recording.recordActor(1, "vehicle.lincoln.mkz2017", EGO_ROLE));
        REQUIRE(recording.recordActor(2, "vehicle.diamondback.century", "cyclist"));
        for (uint64_t frame = 1; frame <= 10; ++frame)
        {
            std::vector<ActorState> states{stateAt(1, frame, 10.0 + static_cast<double>(frame), 1.75 + 0.5),
                                           stateAt(2, frame, 80.0, 3.0)};
            REQUIRE(recording.recordFrame(frame, states));
        }
    }

    std::string readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
}

TEST_CASE("RecordingDatabase requires open before use", "[recording]")
{
    db::RecordingDatabase recording(":memory:");
    std::string error;
    REQUIRE_FALSE(recording.isOpen());
    REQUIRE_FALSE(recording.recordActor(1, "vehicle.audi.tt", "other", &error));
    REQUIRE(error.find("not open") != std::string::npos);

    REQUIRE(recording.open(&error));
    REQUIRE(recording.isOpen());
}

TEST_CASE("RecordingDatabase stores metadata", "[recording]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());

    REQUIRE_FALSE(recording.metadata("run_config").has_value());
    REQUIRE(recording.setMetadata("run_config", "{\"a\":1}"));
    REQUIRE(recording.setMetadata("run_config", "{\"a\":2}"));
    REQUIRE(recording.metadata("run_config").value() == "{\"a\":2}");

    REQUIRE(recording.clear());
    REQUIRE_FALSE(recording.metadata("run_config").has_value());
}

TEST_CASE("RecordingDatabase reads back frames per actor", "[recording]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());
    recordOffsetRun(recording);

    REQUIRE(recording.egoActorId().value() == 1);

    auto range = recording.aliveFrameRange(1);
    REQUIRE(range.has_value());
    REQUIRE(range->start == 1);
    REQUIRE(range->end == 11);
    REQUIRE(range->size() == 10);

    auto transforms = recording.getActorTransforms(1, range->start, range->end);
    REQUIRE(transforms.has_value());
    REQUIRE(transforms->size() == 10);
    REQUIRE((*transforms)[0].location.x == Catch::Approx(11.0));
    REQUIRE((*transforms)[9].location.x == Catch::Approx(20.0));

    auto velocities = recording.getActorVelocities(2, 3, 5);
    REQUIRE(velocities.has_value());
    REQUIRE(velocities->size() == 2);
    REQUIRE((*velocities)[1].x == Catch::Approx(10.0));

    REQUIRE(recording.getActorTransforms(1, 5, 5)->empty());
}

TEST_CASE("RecordingDatabase reports missing actors and frames", "[recording]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());
    std::string error;

    REQUIRE_FALSE(recording.egoActorId(&error).has_value());
    REQUIRE(error == "actor not found in recording");

    error.clear();
    REQUIRE_FALSE(recording.aliveFrameRange(7, &error).has_value());
    REQUIRE(error == "actor not found in recording");

    REQUIRE(recording.recordFrame(1, {stateAt(3, 1, 0.0, 0.0)}));
    REQUIRE(recording.recordFrame(3, {stateAt(3, 3, 2.0, 0.0)}));
    error.clear();
    REQUIRE_FALSE(recording.getActorTransforms(3, 1, 4, &error).has_value());
    REQUIRE(error.find("missing frame 2") != std::string::npos);

    error.clear();
    REQUIRE_FALSE(recording.getActorTransforms(3, 1, 5, &error).has_value());
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("Lateral deviation of an offset trajectory", "[metric]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());
    recordOffsetRun(recording);
    StraightRoadMap map;

    std::string error;
    auto samples = extractLateralDeviation(recording, map, &error);
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 10);
    for (std::size_t i = 0; i < samples->size(); ++i)
    {
        const MetricSample &sample = (*samples)[i];
        REQUIRE(sample.frame == i + 1);
        REQUIRE(sample.offset == Catch::Approx(0.5));
        REQUIRE(sample.lane_half_width == Catch::Approx(1.75));
    }
}

TEST_CASE("Lateral deviation is negative left of the lane center", "[metric]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());
    REQUIRE(recording.recordActor(1, "vehicle.lincoln.mkz2017", EGO_ROLE));
    REQUIRE(recording.recordFrame(4, {stateAt(1, 4, 30.0, 1.75 - 0.25)}));
    REQUIRE(recording.recordFrame(5, {stateAt(1, 5, 31.0, 1.75 - 0.25)}));

    auto samples = extractLateralDeviation(recording, StraightRoadMap{});
    REQUIRE(samples.has_value());
    REQUIRE(samples->size() == 2);
    REQUIRE(samples->front().frame == 4);
    REQUIRE(samples->front().offset == Catch::Approx(-0.25));
}

TEST_CASE("Lateral deviation fails without an ego in the recording", "[metric]")
{
    db::RecordingDatabase recording(":memory:");
    REQUIRE(recording.open());
    REQUIRE(recording.recordActor(1, "vehicle.lincoln.mkz2017", EGO_ROLE));

    std::string error;
    REQUIRE_FALSE(extractLateralDeviation(recording, StraightRoadMap{}, &error).has_value());
    REQUIRE(error == "actor not found in recording");
}

TEST_CASE("Metric JSON lists frames and distances", "[metric][json]")
{
    std::vector<MetricSample> samples{{1, 0.5, 1.75}, {2, -0.25, 1.75}};

    const std::string text = metricToJson(samples);
    REQUIRE(text.find("    \"frames\"") != std::string::npos);
    REQUIRE(text.find("frames") < text.find("distance"));

    auto parsed = nlohmann::json::parse(text);
    REQUIRE(parsed["frames"] == nlohmann::json::array({1, 2}));
    REQUIRE(parsed["distance"][1].get<double>() == Catch::Approx(-0.25));

    REQUIRE(nlohmann::json::parse(metricToJson({}))["frames"].empty());
}

TEST_CASE("Metric file is overwritten on every write", "[metric][json]")
{
    const auto path = std::filesystem::temp_directory_path() / "trafficscenario_metric_test.json";
    std::filesystem::remove(path);

    REQUIRE(writeMetricJson(path.string(), {{1, 0.1, 1.75}, {2, 0.2, 1.75}, {3, 0.3, 1.75}}));
    REQUIRE(writeMetricJson(path.string(), {{7, 0.7, 1.75}}));

    auto parsed = nlohmann::json::parse(readFile(path));
    REQUIRE(parsed["frames"] == nlohmann::json::array({7}));
    REQUIRE(parsed["distance"].size() == 1);

    std::filesystem::remove(path);

    std::string error;
    REQUIRE_FALSE(writeMetricJson((path / "missing_dir" / "out.json").string(), {}, &error));
    REQUIRE(error.find("failed to open") != std::string::npos);
}
