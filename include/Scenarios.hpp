#pragma once

#include "ActorPool.hpp"
#include "BehaviorTree.hpp"
#include "Criteria.hpp"
#include "MapService.hpp"
#include "World.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trafficscenario
{
    // A scripted situation around the ego vehicle. setup() spawns the other
    // actors into the scenario's own pool; they are released on
    // releaseActors() or when the scenario is destroyed.
    class Scenario
    {
    public:
        Scenario(std::string name, double timeout_seconds, IWorld &world, const IMapService &map);
        virtual ~Scenario() = default;

        Scenario(const Scenario &) = delete;
        Scenario &operator=(const Scenario &) = delete;

        // Fails fast on the first actor that cannot be placed or spawned and
        // releases whatever was spawned before it.
        bool setup(ActorId ego, std::string *error = nullptr);

        // Only valid after a successful setup().
        virtual std::unique_ptr<BehaviorNode> createBehavior() = 0;
        virtual std::vector<std::unique_ptr<Criterion>> createCriteria();

        const std::string &name() const { return scenario_name; }
        double timeout() const { return timeout_seconds; }
        void setTimeout(double seconds) { timeout_seconds = seconds; }
        bool isReady() const { return ready; }

        ActorId ego() const { return ego_actor; }
        const std::vector<ActorId> &otherActors() const { return other_actors; }
        const ActorPool &actors() const { return pool; }
        std::size_t releaseActors();

    protected:
        virtual bool initializeActors(std::string *error) = 0;

        std::optional<ActorId> spawnOther(const std::string &blueprint, const Pose &pose, const std::string &role,
                                          std::string *error);
        std::optional<Waypoint> egoWaypoint(std::string *error) const;

        IWorld &world;
        const IMapService &map;

    private:
        std::string scenario_name;
        double timeout_seconds;
        ActorId ego_actor = 0;
        ActorPool pool;
        std::vector<ActorId> other_actors;
        bool ready = false;
    };

    // A cyclist stands across the ego lane; the ego has to stop or avoid it.
    class StationaryObjectCrossing : public Scenario
    {
    public:
        static constexpr double START_DISTANCE = 40.0; // m
        static constexpr double RUN_TIME = 55.0;       // s

        StationaryObjectCrossing(IWorld &world, const IMapService &map);

        std::unique_ptr<BehaviorNode> createBehavior() override;

    protected:
        bool initializeActors(std::string *error) override;
    };

    // A cyclist waits at the road side and crosses in front of the ego once
    // the ego is close enough in time.
    class DynamicObjectCrossing : public Scenario
    {
    public:
        static constexpr double START_DISTANCE = 40.0;    // m
        static constexpr double TIME_TO_ARRIVAL = 12.0;   // s
        static constexpr double CROSSING_SPEED = 10.0;    // m/s
        static constexpr double CROSSING_THROTTLE = 1.0;
        static constexpr double STOP_BRAKE = 1.0;
        static constexpr double AFTER_STOP_TIME = 5.0;    // s

        DynamicObjectCrossing(IWorld &world, const IMapService &map);

        std::unique_ptr<BehaviorNode> createBehavior() override;

        // Lateral distance the cyclist covers: its own lane plus the sidewalk margin.
        double crossingWidth() const { return lane_width * 2.25; }

    protected:
        bool initializeActors(std::string *error) override;

    private:
        double lane_width = 0.0;
    };

    // The ego drives behind a leading vehicle while another one approaches
    // on the opposite lane.
    class ManeuverOppositeDirection : public Scenario
    {
    public:
        static constexpr double FIRST_VEHICLE_DISTANCE = 50.0;  // m
        static constexpr double SECOND_VEHICLE_DISTANCE = 90.0; // m
        static constexpr double TRIGGER_DISTANCE = 40.0;        // m
        static constexpr double EGO_DRIVE_DISTANCE = 140.0;     // m
        static constexpr double FIRST_VEHICLE_SPEED = 55.0 / 3.6;
        static constexpr double SECOND_VEHICLE_SPEED = 60.0 / 3.6;

        ManeuverOppositeDirection(IWorld &world, const IMapService &map);

        std::unique_ptr<BehaviorNode> createBehavior() override;

    protected:
        bool initializeActors(std::string *error) override;
    };

    // nullptr for an unknown name.
    std::unique_ptr<Scenario> makeScenario(const std::string &name, IWorld &world, const IMapService &map);
    const std::vector<std::string> &scenarioNames();

} // namespace trafficscenario
