#pragma once

#include "MapService.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace trafficscenario
{
    struct EgoConfig
    {
        std::string blueprint = "vehicle.lincoln.mkz2017";
        int32_t lane_id = -1;
        double spawn_s = 20.0;      // meters along the road
        double cruise_speed = 8.0;  // m/s
    };

    struct RunConfig
    {
        std::string scenario = "StationaryObjectCrossing";
        RoadConfig road{};
        EgoConfig ego{};
        double time_step = 0.05;        // seconds per tick
        std::optional<double> timeout;  // overrides the scenario's own timeout
        std::string recording_path;     // empty: no recording
        std::string metric_output;      // empty: no metric file
    };

    inline RunConfig makeDefaultRunConfig()
    {
        return RunConfig{};
    }

} // namespace trafficscenario
