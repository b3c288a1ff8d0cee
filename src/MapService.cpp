#include "MapService.hpp"

#include <algorithm>
#include <cstdlib>

namespace trafficscenario
{
    StraightRoadMap::StraightRoadMap(RoadConfig config)
        : road(config),
          road_forward(forwardVector(Rotation{0.0, config.heading, 0.0})),
          road_right(rightVector(Rotation{0.0, config.heading, 0.0}))
    {
    }

    bool StraightRoadMap::laneExists(int32_t lane_id) const
    {
        return lane_id != 0 && std::abs(lane_id) <= static_cast<int32_t>(road.lanes_per_direction);
    }

    double StraightRoadMap::laneCenterOffset(int32_t lane_id) const
    {
        // Offset of the lane center from the reference line, positive to the road's right.
        const double index = static_cast<double>(std::abs(lane_id)) - 0.5;
        return lane_id < 0 ? index * road.lane_width : -index * road.lane_width;
    }

    std::optional<Waypoint> StraightRoadMap::waypointAt(int32_t lane_id, double s) const
    {
        if (!laneExists(lane_id) || s < 0.0 || s > road.length)
        {
            return std::nullopt;
        }

        Waypoint waypoint;
        waypoint.road_id = 1;
        waypoint.lane_id = lane_id;
        waypoint.s = s;
        waypoint.location = road.origin + road_forward * s + road_right * laneCenterOffset(lane_id);
        waypoint.rotation.yaw = normalizeYaw(lane_id < 0 ? road.heading : road.heading + 180.0);
        waypoint.lane_width = road.lane_width;
        waypoint.forward = forwardVector(waypoint.rotation);
        waypoint.right = rightVector(waypoint.rotation);
        return waypoint;
    }

    std::optional<Waypoint> StraightRoadMap::nearestWaypoint(const Vector3 &location) const
    {
        if (road.lanes_per_direction == 0 || road.lane_width <= 0.0)
        {
            return std::nullopt;
        }

        const Vector3 relative = location - road.origin;
        const double s = std::clamp(relative.dot(road_forward), 0.0, road.length);
        const double t = relative.x * road_right.x + relative.y * road_right.y;

        const int32_t max_index = static_cast<int32_t>(road.lanes_per_direction);
        const int32_t index = std::min(static_cast<int32_t>(std::abs(t) / road.lane_width) + 1, max_index);
        return waypointAt(t >= 0.0 ? -index : index, s);
    }

    std::optional<WaypointAdvance> StraightRoadMap::waypointAtDistanceAhead(const Waypoint &waypoint, double distance) const
    {
        if (!laneExists(waypoint.lane_id) || distance < 0.0)
        {
            return std::nullopt;
        }

        // Negative lanes travel towards increasing s.
        const double direction = waypoint.lane_id < 0 ? 1.0 : -1.0;
        const double target_s = std::clamp(waypoint.s + direction * distance, 0.0, road.length);
        auto next = waypointAt(waypoint.lane_id, target_s);
        if (!next.has_value())
        {
            return std::nullopt;
        }
        return WaypointAdvance{*next, std::abs(target_s - waypoint.s)};
    }

    std::optional<Waypoint> StraightRoadMap::leftLane(const Waypoint &waypoint) const
    {
        if (!laneExists(waypoint.lane_id))
        {
            return std::nullopt;
        }

        // Left of travel points towards the reference line for both directions.
        int32_t left_id = 0;
        if (waypoint.lane_id == -1)
            left_id = 1;
        else if (waypoint.lane_id == 1)
            left_id = -1;
        else
            left_id = waypoint.lane_id < 0 ? waypoint.lane_id + 1 : waypoint.lane_id - 1;

        return waypointAt(left_id, waypoint.s);
    }

} // namespace trafficscenario
