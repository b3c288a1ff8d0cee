#pragma once

#include "World.hpp"

#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    struct PooledActor
    {
        ActorId id = 0;
        std::string blueprint;
        std::string role;
    };

    // Exclusive owner of the actors it spawned; every actor still held is
    // destroyed on releaseAll() or destruction.
    class ActorPool
    {
    public:
        explicit ActorPool(IWorld &world);
        ~ActorPool();

        ActorPool(const ActorPool &) = delete;
        ActorPool &operator=(const ActorPool &) = delete;

        std::optional<ActorId> requestActor(const std::string &blueprint, const Pose &pose,
                                            const std::string &role, std::string *error = nullptr);
        bool owns(ActorId id) const;
        const std::vector<PooledActor> &actors() const { return owned; }
        std::size_t releaseAll();

    private:
        IWorld &world;
        std::vector<PooledActor> owned;
    };

} // namespace trafficscenario
