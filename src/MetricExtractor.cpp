#include "MetricExtractor.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace trafficscenario
{
    namespace
    {
        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }
    }

    std::optional<std::vector<MetricSample>> extractLateralDeviation(const IRecording &recording, const IMapService &map,
                                                                      std::string *error)
    {
        auto ego = recording.egoActorId(error);
        if (!ego.has_value())
        {
            return std::nullopt;
        }
        return extractLateralDeviation(recording, map, *ego, error);
    }

    std::optional<std::vector<MetricSample>> extractLateralDeviation(const IRecording &recording, const IMapService &map,
                                                                      ActorId actor, std::string *error)
    {
        auto range = recording.aliveFrameRange(actor, error);
        if (!range.has_value())
        {
            return std::nullopt;
        }

        auto transforms = recording.getActorTransforms(actor, range->start, range->end, error);
        if (!transforms.has_value())
        {
            return std::nullopt;
        }
        if (transforms->size() != range->size())
        {
            setError(error, "recording returned " + std::to_string(transforms->size()) + " transforms for " +
                                std::to_string(range->size()) + " frames");
            return std::nullopt;
        }

        std::vector<MetricSample> samples;
        samples.reserve(transforms->size());
        for (uint64_t frame = range->start; frame < range->end; ++frame)
        {
            const Pose &pose = (*transforms)[static_cast<std::size_t>(frame - range->start)];

            auto waypoint = map.nearestWaypoint(pose.location);
            if (!waypoint.has_value())
            {
                setError(error, "no lane near the actor at frame " + std::to_string(frame));
                return std::nullopt;
            }

            auto offset = signedLateralOffset(*waypoint, pose.location);
            if (!offset.has_value())
            {
                setError(error, "invalid waypoint geometry at frame " + std::to_string(frame));
                return std::nullopt;
            }

            samples.push_back({frame, *offset, waypoint->halfWidth()});
        }
        return samples;
    }

    std::string metricToJson(const std::vector<MetricSample> &samples)
    {
        nlohmann::ordered_json root;
        root["frames"] = nlohmann::ordered_json::array();
        root["distance"] = nlohmann::ordered_json::array();
        for (const auto &sample : samples)
        {
            root["frames"].push_back(sample.frame);
            root["distance"].push_back(sample.offset);
        }
        return root.dump(4);
    }

    bool writeMetricJson(const std::string &path, const std::vector<MetricSample> &samples, std::string *error)
    {
        std::ofstream out(path, std::ios::trunc);
        if (!out.good())
        {
            setError(error, "failed to open metric output file: " + path);
            return false;
        }

        out << metricToJson(samples) << '\n';
        if (!out.good())
        {
            setError(error, "failed to write metric output file: " + path);
            return false;
        }
        return true;
    }

} // namespace trafficscenario
