#pragma once

#include <cmath>
#include <cstdint>
#include <optional>

namespace trafficscenario
{
    class IMapService;

    // Simulator axes: x forward at yaw 0, y to the right, z up. Angles in degrees.
    struct Vector3
    {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        Vector3 operator+(const Vector3 &other) const { return {x + other.x, y + other.y, z + other.z}; }
        Vector3 operator-(const Vector3 &other) const { return {x - other.x, y - other.y, z - other.z}; }
        Vector3 operator*(double scale) const { return {x * scale, y * scale, z * scale}; }

        double dot(const Vector3 &other) const { return x * other.x + y * other.y + z * other.z; }
        double squaredLength() const { return dot(*this); }
        double length() const { return std::sqrt(squaredLength()); }
        double planarLength() const { return std::sqrt(x * x + y * y); }
    };

    struct Rotation
    {
        double pitch = 0.0;
        double yaw = 0.0;
        double roll = 0.0;
    };

    struct Pose
    {
        Vector3 location;
        Rotation rotation;
    };

    struct Waypoint
    {
        uint32_t road_id = 0;
        int32_t lane_id = -1; // negative lanes follow the road heading
        double s = 0.0;       // distance along the road reference line
        Vector3 location;
        Rotation rotation;
        double lane_width = 0.0;
        Vector3 forward;
        Vector3 right;

        double halfWidth() const { return lane_width / 2.0; }
        Pose pose() const { return Pose{location, rotation}; }
    };

    // Placement of a secondary actor relative to a lane waypoint.
    struct LaneOffset
    {
        double longitudinal_distance = 0.0;
        double lateral_fraction = 0.0;       // multiple of the lane width
        double orientation_offset_deg = 0.0; // added to the lane heading
        double position_offset_deg = 90.0;   // direction of the lateral displacement
        double height_offset = 0.0;
    };

    constexpr double kDegToRad = 3.14159265358979323846 / 180.0;

    Vector3 forwardVector(const Rotation &rotation);
    Vector3 rightVector(const Rotation &rotation);
    double normalizeYaw(double yaw_deg);

    // Returns nullopt when the map cannot walk the lane from the reference waypoint.
    std::optional<Pose> laneOffsetPose(const IMapService &map, const Waypoint &reference, const LaneOffset &offset);

    // Signed distance of world_location from the lane center, positive to the
    // right of travel. nullopt when the waypoint has a zero-length right vector.
    std::optional<double> signedLateralOffset(const Waypoint &waypoint, const Vector3 &world_location);

    // Seconds until the two actors close their separation at the current
    // closing speed; +infinity when they are not approaching each other.
    double timeToArrival(const Pose &pose_a, const Vector3 &velocity_a, const Pose &pose_b, const Vector3 &velocity_b);

    double planarDistance(const Pose &a, const Pose &b);
    double distance3d(const Pose &a, const Pose &b);

} // namespace trafficscenario
