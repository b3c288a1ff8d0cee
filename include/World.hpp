#pragma once

#include "Geometry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    using ActorId = uint32_t;

    struct ActorState
    {
        ActorId actor_id = 0;
        uint64_t frame = 0;
        Pose pose;
        Vector3 velocity;
    };

    // Simulator-side actor lifecycle, per-actor control and the simulation clock.
    class IWorld
    {
    public:
        virtual ~IWorld() = default;

        virtual std::optional<ActorId> spawnActor(const std::string &blueprint, const Pose &pose, std::string *error = nullptr) = 0;
        virtual bool destroyActor(ActorId id) = 0;
        virtual bool isAlive(ActorId id) const = 0;
        virtual std::vector<ActorId> actorIds() const = 0;
        virtual std::optional<std::string> blueprintOf(ActorId id) const = 0;

        // Control setters return false when the actor does not exist.
        virtual bool setTargetSpeed(ActorId id, double speed, double acceleration = 0.0) = 0;
        virtual bool clearTargetSpeed(ActorId id) = 0;
        virtual bool setThrottle(ActorId id, double throttle) = 0;
        virtual bool setBrake(ActorId id, double brake) = 0;
        virtual bool setHandBrake(ActorId id, bool engaged) = 0;
        virtual bool setLaneFollowing(ActorId id, bool enabled) = 0;

        virtual std::optional<Pose> getPose(ActorId id) const = 0;
        virtual std::optional<Vector3> getVelocity(ActorId id) const = 0;
        virtual std::optional<double> getSpeed(ActorId id) const = 0;
        virtual std::optional<Waypoint> getLaneWaypoint(ActorId id) const = 0;
        // Half extents of the actor's bounding box (x along the heading).
        virtual std::optional<Vector3> getBoundingExtent(ActorId id) const = 0;
        virtual std::size_t collisionCount(ActorId id) const = 0;

        virtual void tick(double dt_seconds) = 0;
        virtual uint64_t frame() const = 0;
        virtual double elapsedSeconds() const = 0;
    };

} // namespace trafficscenario
