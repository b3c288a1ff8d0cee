#include "Conditions.hpp"

#include <utility>

namespace trafficscenario
{
    namespace
    {
        constexpr double TIME_EPSILON = 1e-9; // absorbs accumulated step rounding
    }

    InTriggerDistanceToVehicle::InTriggerDistanceToVehicle(const IWorld &world, ActorId actor, ActorId other_actor,
                                                           double distance, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), other_actor(other_actor), distance(distance)
    {
    }

    Status InTriggerDistanceToVehicle::update()
    {
        auto pose = world.getPose(actor);
        auto other_pose = world.getPose(other_actor);
        if (!pose.has_value() || !other_pose.has_value())
        {
            return Status::Failure;
        }

        return distance3d(*pose, *other_pose) <= distance ? Status::Success : Status::Running;
    }

    InTimeToArrivalToVehicle::InTimeToArrivalToVehicle(const IWorld &world, ActorId actor, ActorId other_actor,
                                                       double time_seconds, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), other_actor(other_actor), time_seconds(time_seconds)
    {
    }

    Status InTimeToArrivalToVehicle::update()
    {
        auto pose = world.getPose(actor);
        auto velocity = world.getVelocity(actor);
        auto other_pose = world.getPose(other_actor);
        auto other_velocity = world.getVelocity(other_actor);
        if (!pose || !velocity || !other_pose || !other_velocity)
        {
            return Status::Failure;
        }

        // Diverging actors yield +infinity and keep this node running.
        const double time_to_arrival = timeToArrival(*pose, *velocity, *other_pose, *other_velocity);
        return time_to_arrival <= time_seconds ? Status::Success : Status::Running;
    }

    DriveDistance::DriveDistance(const IWorld &world, ActorId actor, double distance, std::string name)
        : BehaviorNode(std::move(name)), world(world), actor(actor), target_distance(distance)
    {
    }

    void DriveDistance::initialise()
    {
        driven = 0.0;
        last_location.reset();
    }

    Status DriveDistance::update()
    {
        auto pose = world.getPose(actor);
        if (!pose.has_value())
        {
            return Status::Failure;
        }

        if (last_location.has_value())
        {
            driven += (pose->location - *last_location).length();
        }
        last_location = pose->location;

        return driven >= target_distance ? Status::Success : Status::Running;
    }

    TimeOut::TimeOut(const IWorld &world, double timeout_seconds, std::string name)
        : BehaviorNode(std::move(name)), world(world), timeout_seconds(timeout_seconds)
    {
    }

    void TimeOut::initialise()
    {
        start_time = world.elapsedSeconds();
    }

    Status TimeOut::update()
    {
        return world.elapsedSeconds() - start_time + TIME_EPSILON >= timeout_seconds ? Status::Success : Status::Running;
    }

} // namespace trafficscenario
