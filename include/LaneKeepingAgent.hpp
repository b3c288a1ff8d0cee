#pragma once

#include "World.hpp"

#include <optional>

namespace trafficscenario
{
    struct AgentConfig
    {
        double cruise_speed = 8.0;  // m/s
        double acceleration = 3.0;  // m/s²
        double lookahead = 60.0;    // m
        double lateral_margin = 0.3; // m, added to both half widths
    };

    // Minimal ego driver: keeps its lane at cruise speed and brakes for
    // anything whose footprint reaches into its path.
    class LaneKeepingAgent
    {
    public:
        LaneKeepingAgent(IWorld &world, ActorId ego, AgentConfig config = AgentConfig{});

        // Applies one tick of control; false once the ego no longer exists.
        bool step();

        bool isBraking() const { return braking; }
        // Bumper-to-bumper gap to the closest obstacle in the ego path, if any.
        std::optional<double> obstacleGap() const { return last_gap; }

    private:
        std::optional<double> closestGap(const Pose &ego_pose, const Vector3 &ego_extent) const;

        IWorld &world;
        ActorId ego;
        AgentConfig config;
        bool braking = false;
        std::optional<double> last_gap;
    };

} // namespace trafficscenario
