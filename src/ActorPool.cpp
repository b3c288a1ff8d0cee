#include "ActorPool.hpp"

#include <algorithm>

namespace trafficscenario
{
    ActorPool::ActorPool(IWorld &world)
        : world(world)
    {
    }

    ActorPool::~ActorPool()
    {
        releaseAll();
    }

    std::optional<ActorId> ActorPool::requestActor(const std::string &blueprint, const Pose &pose,
                                                   const std::string &role, std::string *error)
    {
        auto id = world.spawnActor(blueprint, pose, error);
        if (!id.has_value())
        {
            return std::nullopt;
        }

        owned.push_back({*id, blueprint, role});
        return id;
    }

    bool ActorPool::owns(ActorId id) const
    {
        return std::any_of(owned.begin(), owned.end(),
                           [id](const PooledActor &actor)
                           { return actor.id == id; });
    }

    std::size_t ActorPool::releaseAll()
    {
        std::size_t released = 0;
        // Reverse spawn order.
        for (auto it = owned.rbegin(); it != owned.rend(); ++it)
        {
            if (world.destroyActor(it->id))
            {
                released++;
            }
        }
        owned.clear();
        return released;
    }

} // namespace trafficscenario
