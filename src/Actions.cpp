#include "Actions.hpp"

#include <utility>

namespace trafficscenario
{
    KeepVelocity::KeepVelocity(IWorld &world, ActorId actor, double target_speed, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), target_speed(target_speed)
    {
    }

    Status KeepVelocity::update()
    {
        return world.setTargetSpeed(actor, target_speed) ? Status::Running : Status::Failure;
    }

    void KeepVelocity::terminate(Status)
    {
        // The actor may already be gone; nothing to release then.
        static_cast<void>(world.clearTargetSpeed(actor));
    }

    AccelerateToVelocity::AccelerateToVelocity(IWorld &world, ActorId actor, double throttle, double target_speed,
                                               std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), throttle(throttle), target_speed(target_speed)
    {
    }

    Status AccelerateToVelocity::update()
    {
        auto speed = world.getSpeed(actor);
        if (!speed.has_value())
        {
            return Status::Failure;
        }

        if (*speed >= target_speed)
        {
            return Status::Success;
        }

        return world.setThrottle(actor, throttle) ? Status::Running : Status::Failure;
    }

    void AccelerateToVelocity::terminate(Status)
    {
        static_cast<void>(world.setThrottle(actor, 0.0));
    }

    StopVehicle::StopVehicle(IWorld &world, ActorId actor, double brake, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), brake(brake)
    {
    }

    Status StopVehicle::update()
    {
        if (!world.setBrake(actor, brake) || !world.setThrottle(actor, 0.0))
        {
            return Status::Failure;
        }

        auto speed = world.getSpeed(actor);
        if (!speed.has_value())
        {
            return Status::Failure;
        }
        return *speed < STANDSTILL_SPEED ? Status::Success : Status::Running;
    }

    HandBrakeVehicle::HandBrakeVehicle(IWorld &world, ActorId actor, bool engaged, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), engaged(engaged)
    {
    }

    Status HandBrakeVehicle::update()
    {
        return world.setHandBrake(actor, engaged) ? Status::Success : Status::Failure;
    }

    WaypointFollower::WaypointFollower(IWorld &world, ActorId actor, double target_speed, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), target_speed(target_speed)
    {
    }

    Status WaypointFollower::update()
    {
        if (!world.setLaneFollowing(actor, true) ||
            !world.setTargetSpeed(actor, target_speed, FOLLOWER_ACCELERATION))
        {
            return Status::Failure;
        }
        return Status::Running;
    }

    void WaypointFollower::terminate(Status)
    {
        static_cast<void>(world.setLaneFollowing(actor, false));
        static_cast<void>(world.clearTargetSpeed(actor));
    }

} // namespace trafficscenario
