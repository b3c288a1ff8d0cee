#pragma once

#include "World.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    inline constexpr const char *EGO_ROLE = "hero";

    // Frames an actor was recorded in: [start, end).
    struct FrameRange
    {
        uint64_t start = 0;
        uint64_t end = 0;

        uint64_t size() const { return end > start ? end - start : 0; }
    };

    class IFrameRecorder
    {
    public:
        virtual ~IFrameRecorder() = default;
        virtual bool recordActor(ActorId id, const std::string &blueprint, const std::string &role,
                                 std::string *error = nullptr) = 0;
        virtual bool recordFrame(uint64_t frame, const std::vector<ActorState> &states, std::string *error = nullptr) = 0;
    };

    class IRecording
    {
    public:
        virtual ~IRecording() = default;
        virtual std::optional<ActorId> egoActorId(std::string *error = nullptr) const = 0;
        virtual std::optional<FrameRange> aliveFrameRange(ActorId id, std::string *error = nullptr) const = 0;
        // One entry per frame in [start, end); nullopt when a frame is missing.
        virtual std::optional<std::vector<Pose>> getActorTransforms(ActorId id, uint64_t start, uint64_t end,
                                                                    std::string *error = nullptr) const = 0;
        virtual std::optional<std::vector<Vector3>> getActorVelocities(ActorId id, uint64_t start, uint64_t end,
                                                                       std::string *error = nullptr) const = 0;
        virtual std::optional<std::string> metadata(const std::string &key, std::string *error = nullptr) const = 0;
    };

} // namespace trafficscenario
