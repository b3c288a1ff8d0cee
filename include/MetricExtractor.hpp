#pragma once

#include "MapService.hpp"
#include "Recording.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    struct MetricSample
    {
        uint64_t frame = 0;
        double offset = 0.0;          // signed distance to the lane center, positive to the right
        double lane_half_width = 0.0;
    };

    // Lateral deviation of the recorded ego from its lane center, one sample
    // per frame the ego was alive in.
    std::optional<std::vector<MetricSample>> extractLateralDeviation(const IRecording &recording, const IMapService &map,
                                                                      std::string *error = nullptr);
    std::optional<std::vector<MetricSample>> extractLateralDeviation(const IRecording &recording, const IMapService &map,
                                                                      ActorId actor, std::string *error = nullptr);

    // {"frames": [...], "distance": [...]}, indented by four spaces.
    std::string metricToJson(const std::vector<MetricSample> &samples);
    // Replaces any existing file at path.
    bool writeMetricJson(const std::string &path, const std::vector<MetricSample> &samples, std::string *error = nullptr);

} // namespace trafficscenario
