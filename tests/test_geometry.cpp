#include <catch2/catch_all.hpp>
#include <cmath>
#include <limits>
#include "Geometry.hpp"
#include "MapService.hpp"

using namespace trafficscenario;

TEST_CASE("Forward and right vectors follow simulator axes", "[geometry]")
{
    Vector3 forward = forwardVector(Rotation{0.0, 0.0, 0.0});
    Vector3 right = rightVector(Rotation{0.0, 0.0, 0.0});
    REQUIRE(forward.x == Catch::Approx(1.0));
    REQUIRE(forward.y == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(right.x == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(right.y == Catch::Approx(1.0));

    Vector3 forward_90 = forwardVector(Rotation{0.0, 90.0, 0.0});
    REQUIRE(forward_90.x == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(forward_90.y == Catch::Approx(1.0));
    REQUIRE(forward_90.dot(rightVector(Rotation{0.0, 90.0, 0.0})) == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("Yaw normalization wraps into (-180, 180]", "[geometry]")
{
    REQUIRE(normalizeYaw(270.0) == Catch::Approx(-90.0));
    REQUIRE(normalizeYaw(-190.0) == Catch::Approx(170.0));
    REQUIRE(normalizeYaw(180.0) == Catch::Approx(180.0));
    REQUIRE(normalizeYaw(540.0) == Catch::Approx(180.0));
}

TEST_CASE("Lane offset pose walks the lane and displaces to the right", "[geometry][placement]")
{
    StraightRoadMap map;
    Waypoint reference = *map.waypointAt(-1, 10.0);

    LaneOffset offset;
    offset.longitudinal_distance = 40.0;
    offset.lateral_fraction = 0.2;
    offset.orientation_offset_deg = 270.0;
    offset.position_offset_deg = 90.0;
    offset.height_offset = 0.2;

    auto pose = laneOffsetPose(map, reference, offset);
    REQUIRE(pose.has_value());
    REQUIRE(pose->location.x == Catch::Approx(50.0));
    REQUIRE(pose->location.y == Catch::Approx(1.75 + 0.7));
    REQUIRE(pose->location.z == Catch::Approx(0.2));
    REQUIRE(pose->rotation.yaw == Catch::Approx(-90.0));
}

TEST_CASE("Placement and projection agree on the lateral sign", "[geometry][placement]")
{
    RoadConfig config;
    config.heading = 30.0;
    config.lanes_per_direction = 2;
    StraightRoadMap map(config);
    Waypoint reference = *map.waypointAt(-1, 100.0);

    for (double k : {-0.4, -0.1, 0.0, 0.25, 0.4})
    {
        LaneOffset offset;
        offset.longitudinal_distance = 20.0;
        offset.lateral_fraction = k;

        auto pose = laneOffsetPose(map, reference, offset);
        REQUIRE(pose.has_value());
        auto lane = map.nearestWaypoint(pose->location);
        REQUIRE(lane.has_value());
        REQUIRE(lane->lane_id == -1);

        auto lateral = signedLateralOffset(*lane, pose->location);
        REQUIRE(lateral.has_value());
        REQUIRE(*lateral == Catch::Approx(k * reference.lane_width).margin(1e-9));
    }
}

TEST_CASE("Opposite position offset flips the lateral sign", "[geometry][placement]")
{
    StraightRoadMap map;
    Waypoint reference = *map.waypointAt(-1, 0.0);

    LaneOffset right_side;
    right_side.longitudinal_distance = 5.0;
    right_side.lateral_fraction = 0.3;
    LaneOffset left_side = right_side;
    left_side.position_offset_deg = 270.0;

    auto right_pose = laneOffsetPose(map, reference, right_side);
    auto left_pose = laneOffsetPose(map, reference, left_side);
    REQUIRE(right_pose.has_value());
    REQUIRE(left_pose.has_value());

    Waypoint lane = *map.waypointAt(-1, 5.0);
    REQUIRE(*signedLateralOffset(lane, right_pose->location) == Catch::Approx(1.05));
    REQUIRE(*signedLateralOffset(lane, left_pose->location) == Catch::Approx(-1.05));
}

TEST_CASE("Lateral offset rejects degenerate waypoints", "[geometry]")
{
    Waypoint waypoint;
    waypoint.forward = {1.0, 0.0, 0.0};
    waypoint.right = {0.0, 0.0, 0.0};
    REQUIRE_FALSE(signedLateralOffset(waypoint, Vector3{1.0, 1.0, 0.0}).has_value());
}

TEST_CASE("Lateral offset ignores the longitudinal component", "[geometry]")
{
    StraightRoadMap map;
    Waypoint lane = *map.waypointAt(-1, 50.0);
    Vector3 point = lane.location + Vector3{7.0, 0.5, 0.0};
    REQUIRE(*signedLateralOffset(lane, point) == Catch::Approx(0.5));
}

TEST_CASE("Time to arrival uses the closing speed", "[geometry][tta]")
{
    Pose a;
    Pose b;
    b.location = {100.0, 0.0, 0.0};

    SECTION("approaching")
    {
        REQUIRE(timeToArrival(a, Vector3{10.0, 0.0, 0.0}, b, Vector3{}) == Catch::Approx(10.0));
        REQUIRE(timeToArrival(a, Vector3{10.0, 0.0, 0.0}, b, Vector3{-10.0, 0.0, 0.0}) == Catch::Approx(5.0));
    }

    SECTION("diverging or static")
    {
        REQUIRE(std::isinf(timeToArrival(a, Vector3{-1.0, 0.0, 0.0}, b, Vector3{})));
        REQUIRE(std::isinf(timeToArrival(a, Vector3{}, b, Vector3{})));
        REQUIRE(std::isinf(timeToArrival(a, Vector3{0.0, 5.0, 0.0}, b, Vector3{})));
    }

    SECTION("coincident")
    {
        REQUIRE(timeToArrival(a, Vector3{}, a, Vector3{}) == Catch::Approx(0.0));
    }
}

TEST_CASE("Planar distance ignores height", "[geometry]")
{
    Pose a;
    Pose b;
    b.location = {3.0, 4.0, 12.0};
    REQUIRE(planarDistance(a, b) == Catch::Approx(5.0));
    REQUIRE(distance3d(a, b) == Catch::Approx(13.0));
}

TEST_CASE("StraightRoadMap lays out lanes around the reference line", "[map]")
{
    RoadConfig config;
    config.lanes_per_direction = 2;
    StraightRoadMap map(config);

    auto right_inner = map.waypointAt(-1, 10.0);
    auto right_outer = map.waypointAt(-2, 10.0);
    auto left_inner = map.waypointAt(1, 10.0);
    REQUIRE(right_inner->location.y == Catch::Approx(1.75));
    REQUIRE(right_outer->location.y == Catch::Approx(5.25));
    REQUIRE(left_inner->location.y == Catch::Approx(-1.75));
    REQUIRE(left_inner->rotation.yaw == Catch::Approx(180.0));
    REQUIRE_FALSE(map.waypointAt(3, 10.0).has_value());
    REQUIRE_FALSE(map.waypointAt(0, 10.0).has_value());
    REQUIRE_FALSE(map.waypointAt(-1, 600.0).has_value());

    auto nearest = map.nearestWaypoint(Vector3{42.0, 4.0, 0.0});
    REQUIRE(nearest.has_value());
    REQUIRE(nearest->lane_id == -2);
    REQUIRE(nearest->s == Catch::Approx(42.0));

    auto beyond = map.nearestWaypoint(Vector3{-20.0, -1.0, 0.0});
    REQUIRE(beyond->lane_id == 1);
    REQUIRE(beyond->s == Catch::Approx(0.0));
}

TEST_CASE("StraightRoadMap walks lanes in their direction of travel", "[map]")
{
    StraightRoadMap map;

    auto forward = map.waypointAtDistanceAhead(*map.waypointAt(-1, 100.0), 40.0);
    REQUIRE(forward->waypoint.s == Catch::Approx(140.0));
    REQUIRE(forward->traveled == Catch::Approx(40.0));

    auto backward = map.waypointAtDistanceAhead(*map.waypointAt(1, 100.0), 40.0);
    REQUIRE(backward->waypoint.s == Catch::Approx(60.0));

    auto clamped = map.waypointAtDistanceAhead(*map.waypointAt(-1, 480.0), 50.0);
    REQUIRE(clamped->waypoint.s == Catch::Approx(500.0));
    REQUIRE(clamped->traveled == Catch::Approx(20.0));

    REQUIRE_FALSE(map.waypointAtDistanceAhead(*map.waypointAt(-1, 10.0), -1.0).has_value());
}

TEST_CASE("StraightRoadMap left lane crosses to oncoming traffic", "[map]")
{
    RoadConfig config;
    config.lanes_per_direction = 2;
    StraightRoadMap map(config);

    REQUIRE(map.leftLane(*map.waypointAt(-1, 10.0))->lane_id == 1);
    REQUIRE(map.leftLane(*map.waypointAt(1, 10.0))->lane_id == -1);
    REQUIRE(map.leftLane(*map.waypointAt(-2, 10.0))->lane_id == -1);
    REQUIRE(map.leftLane(*map.waypointAt(2, 10.0))->lane_id == 1);
}
