#include "KinematicWorld.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iterator>

namespace trafficscenario
{
    namespace
    {
        // Separating axis test on the horizontal footprints of two boxes.
        bool footprintsOverlap(const Pose &pose_a, const Blueprint &a, const Pose &pose_b, const Blueprint &b)
        {
            const Vector3 forward_a = forwardVector(Rotation{0.0, pose_a.rotation.yaw, 0.0});
            const Vector3 right_a = rightVector(pose_a.rotation);
            const Vector3 forward_b = forwardVector(Rotation{0.0, pose_b.rotation.yaw, 0.0});
            const Vector3 right_b = rightVector(pose_b.rotation);

            Vector3 center = pose_b.location - pose_a.location;
            center.z = 0.0;

            for (const Vector3 &axis : {forward_a, right_a, forward_b, right_b})
            {
                const double reach_a = a.extent_x * std::abs(forward_a.dot(axis)) + a.extent_y * std::abs(right_a.dot(axis));
                const double reach_b = b.extent_x * std::abs(forward_b.dot(axis)) + b.extent_y * std::abs(right_b.dot(axis));
                if (std::abs(center.dot(axis)) > reach_a + reach_b)
                {
                    return false;
                }
            }
            return true;
        }
    }

    KinematicWorld::KinematicWorld(const IMapService &map)
        : map(map)
    {
    }

    Vehicle *KinematicWorld::find(ActorId id)
    {
        auto it = vehicles.find(id);
        return it == vehicles.end() ? nullptr : &it->second;
    }

    const Vehicle *KinematicWorld::find(ActorId id) const
    {
        auto it = vehicles.find(id);
        return it == vehicles.end() ? nullptr : &it->second;
    }

    bool KinematicWorld::overlapsExisting(const Pose &pose, const Blueprint &model) const
    {
        for (const auto &entry : vehicles)
        {
            const Vehicle &other = entry.second;
            if (footprintsOverlap(pose, model, other.pose, other.blueprint))
            {
                return true;
            }
        }
        return false;
    }

    std::optional<ActorId> KinematicWorld::spawnActor(const std::string &blueprint, const Pose &pose, std::string *error)
    {
        auto model = findBlueprint(blueprint);
        if (!model.has_value())
        {
            if (error)
            {
                *error = "unknown blueprint: " + blueprint;
            }
            return std::nullopt;
        }

        if (overlapsExisting(pose, *model))
        {
            if (error)
            {
                *error = "spawn pose of " + blueprint + " collides with an existing actor";
            }
            return std::nullopt;
        }

        const ActorId id = next_actor_id++;
        vehicles.emplace(id, Vehicle(id, *model, pose));
        return id;
    }

    bool KinematicWorld::destroyActor(ActorId id)
    {
        if (vehicles.erase(id) == 0)
        {
            return false;
        }

        for (auto it = touching.begin(); it != touching.end();)
        {
            if (it->first == id || it->second == id)
                it = touching.erase(it);
            else
                ++it;
        }
        return true;
    }

    bool KinematicWorld::isAlive(ActorId id) const
    {
        return find(id) != nullptr;
    }

    std::vector<ActorId> KinematicWorld::actorIds() const
    {
        std::vector<ActorId> ids;
        ids.reserve(vehicles.size());
        for (const auto &entry : vehicles)
        {
            ids.push_back(entry.first);
        }
        return ids;
    }

    std::optional<std::string> KinematicWorld::blueprintOf(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return vehicle->blueprint.name;
    }

    bool KinematicWorld::setTargetSpeed(ActorId id, double speed, double acceleration)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.target_speed = speed;
        vehicle->control.target_acceleration = acceleration;
        return true;
    }

    bool KinematicWorld::clearTargetSpeed(ActorId id)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.target_speed.reset();
        vehicle->control.target_acceleration = 0.0;
        return true;
    }

    bool KinematicWorld::setThrottle(ActorId id, double throttle)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.throttle = std::clamp(throttle, 0.0, 1.0);
        return true;
    }

    bool KinematicWorld::setBrake(ActorId id, double brake)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.brake = std::clamp(brake, 0.0, 1.0);
        return true;
    }

    bool KinematicWorld::setHandBrake(ActorId id, bool engaged)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.hand_brake = engaged;
        return true;
    }

    bool KinematicWorld::setLaneFollowing(ActorId id, bool enabled)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->control.follow_lane = enabled;
        return true;
    }

    std::optional<Pose> KinematicWorld::getPose(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return vehicle->pose;
    }

    std::optional<Vector3> KinematicWorld::getVelocity(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return vehicle->velocity();
    }

    std::optional<double> KinematicWorld::getSpeed(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return vehicle->current_speed;
    }

    std::optional<Waypoint> KinematicWorld::getLaneWaypoint(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return map.nearestWaypoint(vehicle->pose.location);
    }

    std::optional<Vector3> KinematicWorld::getBoundingExtent(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return Vector3{vehicle->blueprint.extent_x, vehicle->blueprint.extent_y, 0.0};
    }

    std::size_t KinematicWorld::collisionCount(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        return vehicle ? vehicle->collisions : 0;
    }

    bool KinematicWorld::setState(ActorId id, const Pose &pose, double speed)
    {
        Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return false;
        }
        vehicle->pose = pose;
        vehicle->current_speed = std::max(0.0, speed);
        return true;
    }

    std::optional<VehicleControl> KinematicWorld::getControl(ActorId id) const
    {
        const Vehicle *vehicle = find(id);
        if (!vehicle)
        {
            return std::nullopt;
        }
        return vehicle->control;
    }

    void KinematicWorld::tick(double dt_seconds)
    {
        for (auto &entry : vehicles)
        {
            Vehicle &vehicle = entry.second;
            vehicle.updateSpeed(dt_seconds);

            if (vehicle.control.follow_lane)
            {
                if (auto waypoint = map.nearestWaypoint(vehicle.pose.location); waypoint.has_value())
                {
                    vehicle.pose.rotation.yaw = waypoint->rotation.yaw;
                    vehicle.pose.rotation.pitch = waypoint->rotation.pitch;
                }
            }

            vehicle.pose.location = vehicle.pose.location + vehicle.velocity() * dt_seconds;
        }

        detectCollisions();
        current_time += dt_seconds;
        current_frame++;
    }

    void KinematicWorld::detectCollisions()
    {
        for (auto first = vehicles.begin(); first != vehicles.end(); ++first)
        {
            for (auto second = std::next(first); second != vehicles.end(); ++second)
            {
                Vehicle &a = first->second;
                Vehicle &b = second->second;
                const auto key = std::make_pair(a.id, b.id);
                const bool overlap = footprintsOverlap(a.pose, a.blueprint, b.pose, b.blueprint);

                // Count each contact once, at its onset.
                if (overlap && touching.insert(key).second)
                {
                    a.collisions++;
                    b.collisions++;
                }
                else if (!overlap)
                {
                    touching.erase(key);
                }
            }
        }
    }

} // namespace trafficscenario
