#pragma once

#include "Recording.hpp"

#include <memory>
#include <optional>
#include <string>

struct sqlite3;

namespace trafficscenario::db
{

    // SQLite-backed run recording. The file is opened once by open() and
    // closed with the object; ":memory:" gives a private in-memory recording.
    class RecordingDatabase : public IFrameRecorder, public IRecording
    {
    public:
        explicit RecordingDatabase(std::string file_path);
        ~RecordingDatabase() override;

        RecordingDatabase(const RecordingDatabase &) = delete;
        RecordingDatabase &operator=(const RecordingDatabase &) = delete;

        // Opens the file and creates the schema if needed.
        bool open(std::string *error = nullptr);
        // Drops all recorded actors, frames and metadata.
        bool clear(std::string *error = nullptr);
        bool isOpen() const { return handle != nullptr; }
        const std::string &path() const { return file_path; }

        bool setMetadata(const std::string &key, const std::string &value, std::string *error = nullptr);
        std::optional<std::string> metadata(const std::string &key, std::string *error = nullptr) const override;

        bool recordActor(ActorId id, const std::string &blueprint, const std::string &role,
                         std::string *error = nullptr) override;
        bool recordFrame(uint64_t frame, const std::vector<ActorState> &states, std::string *error = nullptr) override;

        std::optional<ActorId> egoActorId(std::string *error = nullptr) const override;
        std::optional<FrameRange> aliveFrameRange(ActorId id, std::string *error = nullptr) const override;
        std::optional<std::vector<Pose>> getActorTransforms(ActorId id, uint64_t start, uint64_t end,
                                                            std::string *error = nullptr) const override;
        std::optional<std::vector<Vector3>> getActorVelocities(ActorId id, uint64_t start, uint64_t end,
                                                               std::string *error = nullptr) const override;

    private:
        bool execute(const char *sql, std::string *error) const;
        bool checkOpen(std::string *error) const;

        std::string file_path;
        sqlite3 *handle = nullptr;
    };

} // namespace trafficscenario::db
