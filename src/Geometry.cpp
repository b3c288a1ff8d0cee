#include "Geometry.hpp"
#include "MapService.hpp"

#include <limits>

namespace trafficscenario
{
    namespace
    {
        constexpr double MIN_RIGHT_SQUARED_LENGTH = 1e-9;
        constexpr double MIN_CLOSING_SPEED = 1e-6; // m/s
        constexpr double MIN_SEPARATION = 1e-9;    // m
    }

    Vector3 forwardVector(const Rotation &rotation)
    {
        const double yaw = rotation.yaw * kDegToRad;
        const double pitch = rotation.pitch * kDegToRad;
        return {std::cos(yaw) * std::cos(pitch), std::sin(yaw) * std::cos(pitch), std::sin(pitch)};
    }

    Vector3 rightVector(const Rotation &rotation)
    {
        const double yaw = (rotation.yaw + 90.0) * kDegToRad;
        return {std::cos(yaw), std::sin(yaw), 0.0};
    }

    double normalizeYaw(double yaw_deg)
    {
        double yaw = std::fmod(yaw_deg, 360.0);
        if (yaw > 180.0)
            yaw -= 360.0;
        else if (yaw <= -180.0)
            yaw += 360.0;
        return yaw;
    }

    std::optional<Pose> laneOffsetPose(const IMapService &map, const Waypoint &reference, const LaneOffset &offset)
    {
        auto advanced = map.waypointAtDistanceAhead(reference, offset.longitudinal_distance);
        if (!advanced.has_value())
        {
            return std::nullopt;
        }

        const Waypoint &waypoint = advanced->waypoint;
        const double position_yaw = (waypoint.rotation.yaw + offset.position_offset_deg) * kDegToRad;
        const double displacement = offset.lateral_fraction * reference.lane_width;

        Pose pose;
        pose.location = waypoint.location;
        pose.location.x += displacement * std::cos(position_yaw);
        pose.location.y += displacement * std::sin(position_yaw);
        pose.location.z += offset.height_offset;
        pose.rotation.yaw = normalizeYaw(waypoint.rotation.yaw + offset.orientation_offset_deg);
        return pose;
    }

    std::optional<double> signedLateralOffset(const Waypoint &waypoint, const Vector3 &world_location)
    {
        const Vector3 &right = waypoint.right;
        const double right_squared = right.squaredLength();
        if (right_squared < MIN_RIGHT_SQUARED_LENGTH)
        {
            return std::nullopt;
        }

        const Vector3 offset = world_location - waypoint.location;
        const double scale = right.dot(offset) / right_squared;
        double distance = (right * scale).length();

        // Horizontal cross product decides the side of the lane center.
        const double cross_z = waypoint.forward.x * offset.y - waypoint.forward.y * offset.x;
        if (cross_z < 0.0)
        {
            distance = -distance;
        }
        return distance;
    }

    double timeToArrival(const Pose &pose_a, const Vector3 &velocity_a, const Pose &pose_b, const Vector3 &velocity_b)
    {
        const Vector3 separation = pose_b.location - pose_a.location;
        const double distance = separation.length();
        if (distance < MIN_SEPARATION)
        {
            return 0.0;
        }

        const double closing_speed = (velocity_a - velocity_b).dot(separation) / distance;
        if (closing_speed <= MIN_CLOSING_SPEED)
        {
            return std::numeric_limits<double>::infinity();
        }
        return distance / closing_speed;
    }

    double planarDistance(const Pose &a, const Pose &b)
    {
        return (b.location - a.location).planarLength();
    }

    double distance3d(const Pose &a, const Pose &b)
    {
        return (b.location - a.location).length();
    }

} // namespace trafficscenario
