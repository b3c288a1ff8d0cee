#pragma once

#include "BehaviorTree.hpp"
#include "World.hpp"

#include <string>

namespace trafficscenario
{
    // Holds the actor at target_speed until halted. Never completes on its own.
    class KeepVelocity : public BehaviorNode
    {
    public:
        KeepVelocity(IWorld &world, ActorId actor, double target_speed, std::string name = "KeepVelocity");
        std::string kind() const override { return "Action"; }

    protected:
        Status update() override;
        void terminate(Status status) override;

    private:
        IWorld &world;
        ActorId actor;
        double target_speed;
    };

    class AccelerateToVelocity : public BehaviorNode
    {
    public:
        AccelerateToVelocity(IWorld &world, ActorId actor, double throttle, double target_speed,
                             std::string name = "AccelerateToVelocity");
        std::string kind() const override { return "Action"; }

    protected:
        Status update() override;
        void terminate(Status status) override;

    private:
        IWorld &world;
        ActorId actor;
        double throttle;
        double target_speed;
    };

    // Brakes until the actor is at standstill; the brake stays applied afterwards.
    class StopVehicle : public BehaviorNode
    {
    public:
        static constexpr double STANDSTILL_SPEED = 0.1; // m/s

        StopVehicle(IWorld &world, ActorId actor, double brake, std::string name = "StopVehicle");
        std::string kind() const override { return "Action"; }

    protected:
        Status update() override;

    private:
        IWorld &world;
        ActorId actor;
        double brake;
    };

    class HandBrakeVehicle : public BehaviorNode
    {
    public:
        HandBrakeVehicle(IWorld &world, ActorId actor, bool engaged, std::string name = "HandBrakeVehicle");
        std::string kind() const override { return "Action"; }

    protected:
        Status update() override;

    private:
        IWorld &world;
        ActorId actor;
        bool engaged;
    };

    // Drives along the current lane at target_speed until halted.
    class WaypointFollower : public BehaviorNode
    {
    public:
        static constexpr double FOLLOWER_ACCELERATION = 3.0; // m/s²

        WaypointFollower(IWorld &world, ActorId actor, double target_speed, std::string name = "WaypointFollower");
        std::string kind() const override { return "Action"; }

    protected:
        Status update() override;
        void terminate(Status status) override;

    private:
        IWorld &world;
        ActorId actor;
        double target_speed;
    };

} // namespace trafficscenario
