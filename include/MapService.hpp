#pragma once

#include "Geometry.hpp"

#include <cstdint>
#include <optional>

namespace trafficscenario
{
    struct WaypointAdvance
    {
        Waypoint waypoint;
        double traveled = 0.0;
    };

    class IMapService
    {
    public:
        virtual ~IMapService() = default;
        virtual std::optional<Waypoint> nearestWaypoint(const Vector3 &location) const = 0;
        // Walks the lane in its direction of travel; traveled may fall short at the end of the road.
        virtual std::optional<WaypointAdvance> waypointAtDistanceAhead(const Waypoint &waypoint, double distance) const = 0;
        virtual std::optional<Waypoint> leftLane(const Waypoint &waypoint) const = 0;
    };

    struct RoadConfig
    {
        double length = 500.0;    // meters
        double lane_width = 3.5;  // meters
        uint16_t lanes_per_direction = 1;
        Vector3 origin{};
        double heading = 0.0;     // degrees
    };

    // Two-way straight road. Lanes -1..-N lie right of the reference line and
    // follow its heading, lanes 1..N lie left of it and travel the opposite way.
    class StraightRoadMap : public IMapService
    {
    public:
        explicit StraightRoadMap(RoadConfig config = RoadConfig{});

        std::optional<Waypoint> nearestWaypoint(const Vector3 &location) const override;
        std::optional<WaypointAdvance> waypointAtDistanceAhead(const Waypoint &waypoint, double distance) const override;
        std::optional<Waypoint> leftLane(const Waypoint &waypoint) const override;

        std::optional<Waypoint> waypointAt(int32_t lane_id, double s) const;
        const RoadConfig &config() const { return road; }

    private:
        bool laneExists(int32_t lane_id) const;
        double laneCenterOffset(int32_t lane_id) const;

        RoadConfig road;
        Vector3 road_forward;
        Vector3 road_right;
    };

} // namespace trafficscenario
