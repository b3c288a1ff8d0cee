#include "LaneKeepingAgent.hpp"

#include <algorithm>
#include <cmath>

namespace trafficscenario
{
    namespace
    {
        constexpr double STOPPED_GAP_METERS = 2.0;
        constexpr double BRAKE_DECEL = 4.5; // m/s^2, comfortable deceleration used for the safe speed
    }

    LaneKeepingAgent::LaneKeepingAgent(IWorld &world, ActorId ego, AgentConfig config)
        : world(world), ego(ego), config(config)
    {
    }

    std::optional<double> LaneKeepingAgent::closestGap(const Pose &ego_pose, const Vector3 &ego_extent) const
    {
        const Vector3 forward = forwardVector(Rotation{0.0, ego_pose.rotation.yaw, 0.0});
        const Vector3 right = rightVector(ego_pose.rotation);

        std::optional<double> closest;
        for (ActorId other : world.actorIds())
        {
            if (other == ego)
                continue;

            auto pose = world.getPose(other);
            auto extent = world.getBoundingExtent(other);
            if (!pose.has_value() || !extent.has_value())
                continue;

            const Vector3 other_forward = forwardVector(Rotation{0.0, pose->rotation.yaw, 0.0});
            const Vector3 other_right = rightVector(pose->rotation);
            const Vector3 relative = pose->location - ego_pose.location;

            const double longitudinal = relative.dot(forward);
            const double lateral = relative.dot(right);

            // Reach of the other footprint along the ego axes.
            const double reach_forward = extent->x * std::abs(other_forward.dot(forward)) + extent->y * std::abs(other_right.dot(forward));
            const double reach_right = extent->x * std::abs(other_forward.dot(right)) + extent->y * std::abs(other_right.dot(right));

            if (longitudinal <= 0.0 || longitudinal > config.lookahead)
                continue;
            if (std::abs(lateral) > ego_extent.y + config.lateral_margin + reach_right)
                continue;

            const double gap = longitudinal - ego_extent.x - reach_forward;
            if (!closest.has_value() || gap < *closest)
            {
                closest = gap;
            }
        }
        return closest;
    }

    bool LaneKeepingAgent::step()
    {
        auto pose = world.getPose(ego);
        auto speed = world.getSpeed(ego);
        auto extent = world.getBoundingExtent(ego);
        if (!pose.has_value() || !speed.has_value() || !extent.has_value())
        {
            return false;
        }

        if (!world.setLaneFollowing(ego, true))
        {
            return false;
        }

        double target_speed = config.cruise_speed;
        last_gap = closestGap(*pose, *extent);
        if (last_gap.has_value())
        {
            const double room = *last_gap - STOPPED_GAP_METERS;
            if (room <= 0.0)
            {
                target_speed = 0.0;
            }
            else
            {
                double safe_speed = std::sqrt(2.0 * BRAKE_DECEL * room);
                target_speed = std::min(target_speed, safe_speed);
            }
        }

        braking = *speed > target_speed;
        if (braking)
        {
            return world.clearTargetSpeed(ego) && world.setBrake(ego, 1.0);
        }
        return world.setBrake(ego, 0.0) && world.setTargetSpeed(ego, target_speed, config.acceleration);
    }

} // namespace trafficscenario
