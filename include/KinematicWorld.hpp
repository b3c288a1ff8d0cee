#pragma once

#include "MapService.hpp"
#include "Vehicle.hpp"
#include "World.hpp"

#include <map>
#include <set>
#include <utility>

namespace trafficscenario
{
    // Point-mass world: speeds integrate along the heading, lane following
    // snaps the heading to the lane, collisions are oriented bounding-box overlaps.
    class KinematicWorld : public IWorld
    {
    public:
        explicit KinematicWorld(const IMapService &map);

        std::optional<ActorId> spawnActor(const std::string &blueprint, const Pose &pose, std::string *error = nullptr) override;
        bool destroyActor(ActorId id) override;
        bool isAlive(ActorId id) const override;
        std::vector<ActorId> actorIds() const override;
        std::optional<std::string> blueprintOf(ActorId id) const override;

        bool setTargetSpeed(ActorId id, double speed, double acceleration = 0.0) override;
        bool clearTargetSpeed(ActorId id) override;
        bool setThrottle(ActorId id, double throttle) override;
        bool setBrake(ActorId id, double brake) override;
        bool setHandBrake(ActorId id, bool engaged) override;
        bool setLaneFollowing(ActorId id, bool enabled) override;

        std::optional<Pose> getPose(ActorId id) const override;
        std::optional<Vector3> getVelocity(ActorId id) const override;
        std::optional<double> getSpeed(ActorId id) const override;
        std::optional<Waypoint> getLaneWaypoint(ActorId id) const override;
        std::optional<Vector3> getBoundingExtent(ActorId id) const override;
        std::size_t collisionCount(ActorId id) const override;

        void tick(double dt_seconds) override;
        uint64_t frame() const override { return current_frame; }
        double elapsedSeconds() const override { return current_time; }

        // Test hook: teleports an actor and sets its speed along the new heading.
        bool setState(ActorId id, const Pose &pose, double speed);
        std::optional<VehicleControl> getControl(ActorId id) const;

    private:
        Vehicle *find(ActorId id);
        const Vehicle *find(ActorId id) const;
        bool overlapsExisting(const Pose &pose, const Blueprint &model) const;
        void detectCollisions();

        const IMapService &map;
        std::map<ActorId, Vehicle> vehicles;
        std::set<std::pair<ActorId, ActorId>> touching;
        ActorId next_actor_id = 1;
        uint64_t current_frame = 0;
        double current_time = 0.0;
    };

} // namespace trafficscenario
