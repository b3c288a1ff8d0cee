#pragma once

#include "BehaviorTree.hpp"
#include "World.hpp"

#include <optional>
#include <string>

namespace trafficscenario
{
    class InTriggerDistanceToVehicle : public BehaviorNode
    {
    public:
        InTriggerDistanceToVehicle(const IWorld &world, ActorId actor, ActorId other_actor, double distance,
                                   std::string name = "TriggerDistanceToVehicle");
        std::string kind() const override { return "Condition"; }

    protected:
        Status update() override;

    private:
        const IWorld &world;
        ActorId actor;
        ActorId other_actor;
        double distance;
    };

    class InTimeToArrivalToVehicle : public BehaviorNode
    {
    public:
        InTimeToArrivalToVehicle(const IWorld &world, ActorId actor, ActorId other_actor, double time_seconds,
                                 std::string name = "TimeToArrivalToVehicle");
        std::string kind() const override { return "Condition"; }

    protected:
        Status update() override;

    private:
        const IWorld &world;
        ActorId actor;
        ActorId other_actor;
        double time_seconds;
    };

    // Sums per-tick displacement of the actor from the first tick onwards.
    class DriveDistance : public BehaviorNode
    {
    public:
        DriveDistance(const IWorld &world, ActorId actor, double distance, std::string name = "DriveDistance");
        std::string kind() const override { return "Condition"; }
        double drivenDistance() const { return driven; }

    protected:
        void initialise() override;
        Status update() override;

    private:
        const IWorld &world;
        ActorId actor;
        double target_distance;
        double driven = 0.0;
        std::optional<Vector3> last_location;
    };

    // Measured in simulation time from the first tick.
    class TimeOut : public BehaviorNode
    {
    public:
        TimeOut(const IWorld &world, double timeout_seconds, std::string name = "TimeOut");
        std::string kind() const override { return "Condition"; }

    protected:
        void initialise() override;
        Status update() override;

    private:
        const IWorld &world;
        double timeout_seconds;
        double start_time = 0.0;
    };

} // namespace trafficscenario
