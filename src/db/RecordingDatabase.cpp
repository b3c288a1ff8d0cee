#include "RecordingDatabase.hpp"

#include <sqlite3.h>

#include <utility>

namespace trafficscenario::db
{
    namespace
    {
        const char *SCHEMA_SQL =
            "CREATE TABLE IF NOT EXISTS recording_meta ("
            "key TEXT PRIMARY KEY,"
            "value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS actors ("
            "id INTEGER PRIMARY KEY,"
            "blueprint TEXT NOT NULL,"
            "role TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS actor_states ("
            "frame INTEGER NOT NULL,"
            "actor_id INTEGER NOT NULL,"
            "x REAL NOT NULL, y REAL NOT NULL, z REAL NOT NULL,"
            "pitch REAL NOT NULL, yaw REAL NOT NULL, roll REAL NOT NULL,"
            "vx REAL NOT NULL, vy REAL NOT NULL, vz REAL NOT NULL,"
            "PRIMARY KEY (actor_id, frame)"
            ");";

        // Finalizes the prepared statement on scope exit.
        class Statement
        {
        public:
            Statement(sqlite3 *handle, const char *sql)
            {
                rc = sqlite3_prepare_v2(handle, sql, -1, &stmt, nullptr);
            }

            ~Statement()
            {
                sqlite3_finalize(stmt);
            }

            Statement(const Statement &) = delete;
            Statement &operator=(const Statement &) = delete;

            bool ok() const { return rc == SQLITE_OK; }
            sqlite3_stmt *get() const { return stmt; }

        private:
            sqlite3_stmt *stmt = nullptr;
            int rc = SQLITE_ERROR;
        };

        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }

        // Reads one row per frame in [start, end) and rejects gaps.
        template <typename T, typename RowReader>
        std::optional<std::vector<T>> readFrameRows(sqlite3 *handle, const char *sql, ActorId id, uint64_t start,
                                                    uint64_t end, std::string *error, RowReader read_row)
        {
            std::vector<T> rows;
            if (end <= start)
            {
                return rows;
            }

            Statement stmt(handle, sql);
            if (!stmt.ok())
            {
                setError(error, sqlite3_errmsg(handle));
                return std::nullopt;
            }

            sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));
            sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(start));
            sqlite3_bind_int64(stmt.get(), 3, static_cast<sqlite3_int64>(end));

            rows.reserve(static_cast<std::size_t>(end - start));
            uint64_t expected_frame = start;
            int step_rc = SQLITE_ROW;
            while ((step_rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
            {
                const auto frame = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
                if (frame != expected_frame)
                {
                    setError(error, "missing frame " + std::to_string(expected_frame) + " for actor " + std::to_string(id));
                    return std::nullopt;
                }
                rows.push_back(read_row(stmt.get()));
                expected_frame++;
            }

            if (step_rc != SQLITE_DONE)
            {
                setError(error, sqlite3_errmsg(handle));
                return std::nullopt;
            }

            if (expected_frame != end)
            {
                setError(error, "missing frame " + std::to_string(expected_frame) + " for actor " + std::to_string(id));
                return std::nullopt;
            }
            return rows;
        }
    }

    RecordingDatabase::RecordingDatabase(std::string file_path)
        : file_path(std::move(file_path))
    {
    }

    RecordingDatabase::~RecordingDatabase()
    {
        sqlite3_close(handle);
    }

    bool RecordingDatabase::open(std::string *error)
    {
        if (handle)
        {
            return true;
        }

        if (sqlite3_open(file_path.c_str(), &handle) != SQLITE_OK)
        {
            setError(error, handle ? sqlite3_errmsg(handle) : "failed to open recording database");
            sqlite3_close(handle);
            handle = nullptr;
            return false;
        }

        if (!execute(SCHEMA_SQL, error))
        {
            sqlite3_close(handle);
            handle = nullptr;
            return false;
        }
        return true;
    }

    bool RecordingDatabase::clear(std::string *error)
    {
        return checkOpen(error) &&
               execute("DELETE FROM actor_states; DELETE FROM actors; DELETE FROM recording_meta;", error);
    }

    bool RecordingDatabase::checkOpen(std::string *error) const
    {
        if (!handle)
        {
            setError(error, "recording database is not open: " + file_path);
            return false;
        }
        return true;
    }

    bool RecordingDatabase::execute(const char *sql, std::string *error) const
    {
        char *errmsg = nullptr;
        const int exec_rc = sqlite3_exec(handle, sql, nullptr, nullptr, &errmsg);
        if (exec_rc != SQLITE_OK)
        {
            setError(error, errmsg ? errmsg : "failed to execute statement");
            sqlite3_free(errmsg);
            return false;
        }
        return true;
    }

    bool RecordingDatabase::setMetadata(const std::string &key, const std::string &value, std::string *error)
    {
        if (!checkOpen(error))
        {
            return false;
        }

        const char *upsert_sql =
            "INSERT INTO recording_meta(key, value) VALUES(?, ?) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;";

        Statement stmt(handle, upsert_sql);
        if (!stmt.ok())
        {
            setError(error, sqlite3_errmsg(handle));
            return false;
        }

        sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle));
            return false;
        }
        return true;
    }

    std::optional<std::string> RecordingDatabase::metadata(const std::string &key, std::string *error) const
    {
        if (!checkOpen(error))
        {
            return std::nullopt;
        }

        Statement stmt(handle, "SELECT value FROM recording_meta WHERE key = ? LIMIT 1;");
        if (!stmt.ok())
        {
            setError(error, sqlite3_errmsg(handle));
            return std::nullopt;
        }
        sqlite3_bind_text(stmt.get(), 1, key.c_str(), static_cast<int>(key.size()), SQLITE_TRANSIENT);

        const int step_rc = sqlite3_step(stmt.get());
        if (step_rc == SQLITE_ROW)
        {
            const unsigned char *text = sqlite3_column_text(stmt.get(), 0);
            return std::string(text ? reinterpret_cast<const char *>(text) : "");
        }

        if (step_rc != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle));
        }
        return std::nullopt;
    }

    bool RecordingDatabase::recordActor(ActorId id, const std::string &blueprint, const std::string &role,
                                        std::string *error)
    {
        if (!checkOpen(error))
        {
            return false;
        }

        Statement stmt(handle, "INSERT OR REPLACE INTO actors(id, blueprint, role) VALUES(?, ?, ?);");
        if (!stmt.ok())
        {
            setError(error, sqlite3_errmsg(handle));
            return false;
        }

        sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));
        sqlite3_bind_text(stmt.get(), 2, blueprint.c_str(), static_cast<int>(blueprint.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt.get(), 3, role.c_str(), static_cast<int>(role.size()), SQLITE_TRANSIENT);

        if (sqlite3_step(stmt.get()) != SQLITE_DONE)
        {
            setError(error, sqlite3_errmsg(handle));
            return false;
        }
        return true;
    }

    bool RecordingDatabase::recordFrame(uint64_t frame, const std::vector<ActorState> &states, std::string *error)
    {
        if (!checkOpen(error) || !execute("BEGIN TRANSACTION;", error))
        {
            return false;
        }

        const char *insert_sql =
            "INSERT OR REPLACE INTO actor_states(frame, actor_id, x, y, z, pitch, yaw, roll, vx, vy, vz) "
            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

        bool ok = true;
        {
            Statement stmt(handle, insert_sql);
            ok = stmt.ok();
            for (std::size_t i = 0; ok && i < states.size(); ++i)
            {
                const ActorState &state = states[i];
                sqlite3_reset(stmt.get());
                sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(frame));
                sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(state.actor_id));
                sqlite3_bind_double(stmt.get(), 3, state.pose.location.x);
                sqlite3_bind_double(stmt.get(), 4, state.pose.location.y);
                sqlite3_bind_double(stmt.get(), 5, state.pose.location.z);
                sqlite3_bind_double(stmt.get(), 6, state.pose.rotation.pitch);
                sqlite3_bind_double(stmt.get(), 7, state.pose.rotation.yaw);
                sqlite3_bind_double(stmt.get(), 8, state.pose.rotation.roll);
                sqlite3_bind_double(stmt.get(), 9, state.velocity.x);
                sqlite3_bind_double(stmt.get(), 10, state.velocity.y);
                sqlite3_bind_double(stmt.get(), 11, state.velocity.z);
                ok = sqlite3_step(stmt.get()) == SQLITE_DONE;
            }
            if (!ok)
            {
                setError(error, sqlite3_errmsg(handle));
            }
        }

        if (!ok)
        {
            std::string rollback_error;
            if (!execute("ROLLBACK;", &rollback_error) && error)
            {
                *error += " (rollback failed: " + rollback_error + ")";
            }
            return false;
        }
        return execute("COMMIT;", error);
    }

    std::optional<ActorId> RecordingDatabase::egoActorId(std::string *error) const
    {
        if (!checkOpen(error))
        {
            return std::nullopt;
        }

        Statement stmt(handle, "SELECT id FROM actors WHERE role = ? ORDER BY id LIMIT 1;");
        if (!stmt.ok())
        {
            setError(error, sqlite3_errmsg(handle));
            return std::nullopt;
        }
        sqlite3_bind_text(stmt.get(), 1, EGO_ROLE, -1, SQLITE_STATIC);

        const int step_rc = sqlite3_step(stmt.get());
        if (step_rc == SQLITE_ROW)
        {
            return static_cast<ActorId>(sqlite3_column_int64(stmt.get(), 0));
        }

        setError(error, step_rc == SQLITE_DONE ? std::string("actor not found in recording") : sqlite3_errmsg(handle));
        return std::nullopt;
    }

    std::optional<FrameRange> RecordingDatabase::aliveFrameRange(ActorId id, std::string *error) const
    {
        if (!checkOpen(error))
        {
            return std::nullopt;
        }

        Statement stmt(handle, "SELECT MIN(frame), MAX(frame) FROM actor_states WHERE actor_id = ?;");
        if (!stmt.ok())
        {
            setError(error, sqlite3_errmsg(handle));
            return std::nullopt;
        }
        sqlite3_bind_int64(stmt.get(), 1, static_cast<sqlite3_int64>(id));

        if (sqlite3_step(stmt.get()) != SQLITE_ROW)
        {
            setError(error, sqlite3_errmsg(handle));
            return std::nullopt;
        }

        // MIN over no rows yields NULL.
        if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL)
        {
            setError(error, "actor not found in recording");
            return std::nullopt;
        }

        FrameRange range;
        range.start = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
        range.end = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1)) + 1;
        return range;
    }

    std::optional<std::vector<Pose>> RecordingDatabase::getActorTransforms(ActorId id, uint64_t start, uint64_t end,
                                                                           std::string *error) const
    {
        if (!checkOpen(error))
        {
            return std::nullopt;
        }

        const char *select_sql =
            "SELECT frame, x, y, z, pitch, yaw, roll FROM actor_states "
            "WHERE actor_id = ? AND frame >= ? AND frame < ? ORDER BY frame;";

        return readFrameRows<Pose>(handle, select_sql, id, start, end, error,
                                   [](sqlite3_stmt *stmt)
                                   {
                                       Pose pose;
                                       pose.location = {sqlite3_column_double(stmt, 1),
                                                        sqlite3_column_double(stmt, 2),
                                                        sqlite3_column_double(stmt, 3)};
                                       pose.rotation = {sqlite3_column_double(stmt, 4),
                                                        sqlite3_column_double(stmt, 5),
                                                        sqlite3_column_double(stmt, 6)};
                                       return pose;
                                   });
    }

    std::optional<std::vector<Vector3>> RecordingDatabase::getActorVelocities(ActorId id, uint64_t start, uint64_t end,
                                                                              std::string *error) const
    {
        if (!checkOpen(error))
        {
            return std::nullopt;
        }

        const char *select_sql =
            "SELECT frame, vx, vy, vz FROM actor_states "
            "WHERE actor_id = ? AND frame >= ? AND frame < ? ORDER BY frame;";

        return readFrameRows<Vector3>(handle, select_sql, id, start, end, error,
                                      [](sqlite3_stmt *stmt)
                                      {
                                          return Vector3{sqlite3_column_double(stmt, 1),
                                                         sqlite3_column_double(stmt, 2),
                                                         sqlite3_column_double(stmt, 3)};
                                      });
    }
} // namespace trafficscenario::db
