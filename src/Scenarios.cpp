#include "Scenarios.hpp"

#include "Actions.hpp"
#include "Conditions.hpp"

#include <utility>

namespace trafficscenario
{
    namespace
    {
        const char *CYCLIST_BLUEPRINT = "vehicle.diamondback.century";

        // Cyclist placement shared by both crossing scenarios: facing across
        // the lane, displaced to the right of the ego's lane center.
        LaneOffset crossingOffset(double start_distance, double lateral_fraction)
        {
            LaneOffset offset;
            offset.longitudinal_distance = start_distance;
            offset.lateral_fraction = lateral_fraction;
            offset.orientation_offset_deg = 270.0;
            offset.position_offset_deg = 90.0;
            offset.height_offset = 0.2;
            return offset;
        }

        void setError(std::string *error, const std::string &message)
        {
            if (error)
            {
                *error = message;
            }
        }
    }

    Scenario::Scenario(std::string name, double timeout_seconds, IWorld &world, const IMapService &map)
        : world(world), map(map), scenario_name(std::move(name)), timeout_seconds(timeout_seconds), pool(world)
    {
    }

    bool Scenario::setup(ActorId ego, std::string *error)
    {
        releaseActors();
        ego_actor = ego;

        if (!world.isAlive(ego))
        {
            setError(error, "ego actor " + std::to_string(ego) + " does not exist");
            return false;
        }

        std::string init_error;
        if (!initializeActors(&init_error))
        {
            releaseActors();
            setError(error, scenario_name + ": " + init_error);
            return false;
        }

        ready = true;
        return true;
    }

    std::vector<std::unique_ptr<Criterion>> Scenario::createCriteria()
    {
        std::vector<std::unique_ptr<Criterion>> criteria;
        criteria.push_back(std::make_unique<CollisionTest>(world, ego_actor));
        return criteria;
    }

    std::size_t Scenario::releaseActors()
    {
        ready = false;
        other_actors.clear();
        return pool.releaseAll();
    }

    std::optional<ActorId> Scenario::spawnOther(const std::string &blueprint, const Pose &pose, const std::string &role,
                                                std::string *error)
    {
        auto id = pool.requestActor(blueprint, pose, role, error);
        if (id.has_value())
        {
            other_actors.push_back(*id);
        }
        return id;
    }

    std::optional<Waypoint> Scenario::egoWaypoint(std::string *error) const
    {
        auto waypoint = world.getLaneWaypoint(ego_actor);
        if (!waypoint.has_value())
        {
            setError(error, "ego is not on a lane");
        }
        return waypoint;
    }

    StationaryObjectCrossing::StationaryObjectCrossing(IWorld &world, const IMapService &map)
        : Scenario("StationaryObjectCrossing", 60.0, world, map)
    {
    }

    bool StationaryObjectCrossing::initializeActors(std::string *error)
    {
        auto reference = egoWaypoint(error);
        if (!reference.has_value())
        {
            return false;
        }

        auto pose = laneOffsetPose(map, *reference, crossingOffset(START_DISTANCE, 0.2));
        if (!pose.has_value())
        {
            setError(error, "cannot place the cyclist ahead of the ego");
            return false;
        }

        return spawnOther(CYCLIST_BLUEPRINT, *pose, "cyclist", error).has_value();
    }

    std::unique_ptr<BehaviorNode> StationaryObjectCrossing::createBehavior()
    {
        return std::make_unique<TimeOut>(world, RUN_TIME, "StationaryObjectCrossing");
    }

    DynamicObjectCrossing::DynamicObjectCrossing(IWorld &world, const IMapService &map)
        : Scenario("DynamicObjectCrossing", 60.0, world, map)
    {
    }

    bool DynamicObjectCrossing::initializeActors(std::string *error)
    {
        auto reference = egoWaypoint(error);
        if (!reference.has_value())
        {
            return false;
        }
        lane_width = reference->lane_width;

        auto pose = laneOffsetPose(map, *reference, crossingOffset(START_DISTANCE, 1.1));
        if (!pose.has_value())
        {
            setError(error, "cannot place the cyclist ahead of the ego");
            return false;
        }

        return spawnOther(CYCLIST_BLUEPRINT, *pose, "cyclist", error).has_value();
    }

    std::unique_ptr<BehaviorNode> DynamicObjectCrossing::createBehavior()
    {
        const ActorId cyclist = otherActors().front();
        const double width = crossingWidth();

        auto start_crossing = std::make_unique<Parallel>(ParallelPolicy::SuccessOnOne, "StartCrossing");
        start_crossing->addChild(std::make_unique<KeepVelocity>(world, cyclist, CROSSING_SPEED));
        start_crossing->addChild(std::make_unique<DriveDistance>(world, cyclist, 0.3 * width, "StartDistance"));

        auto keep_crossing = std::make_unique<Parallel>(ParallelPolicy::SuccessOnOne, "KeepCrossing");
        keep_crossing->addChild(
            std::make_unique<AccelerateToVelocity>(world, cyclist, CROSSING_THROTTLE, CROSSING_SPEED));
        keep_crossing->addChild(std::make_unique<DriveDistance>(world, cyclist, width, "CrossingDistance"));

        auto sequence = std::make_unique<Sequence>("CrossingSequence");
        sequence->addChild(std::make_unique<HandBrakeVehicle>(world, cyclist, true, "HoldCyclist"));
        sequence->addChild(std::make_unique<InTimeToArrivalToVehicle>(world, cyclist, ego(), TIME_TO_ARRIVAL));
        sequence->addChild(std::make_unique<HandBrakeVehicle>(world, cyclist, false, "ReleaseCyclist"));
        sequence->addChild(std::move(start_crossing));
        sequence->addChild(std::move(keep_crossing));
        sequence->addChild(std::make_unique<StopVehicle>(world, cyclist, STOP_BRAKE));
        sequence->addChild(std::make_unique<TimeOut>(world, AFTER_STOP_TIME));

        auto root = std::make_unique<Parallel>(ParallelPolicy::SuccessOnOne, "DynamicObjectCrossing");
        root->addChild(std::move(sequence));
        return root;
    }

    ManeuverOppositeDirection::ManeuverOppositeDirection(IWorld &world, const IMapService &map)
        : Scenario("ManeuverOppositeDirection", 120.0, world, map)
    {
    }

    bool ManeuverOppositeDirection::initializeActors(std::string *error)
    {
        auto reference = egoWaypoint(error);
        if (!reference.has_value())
        {
            return false;
        }

        auto first = map.waypointAtDistanceAhead(*reference, FIRST_VEHICLE_DISTANCE);
        auto second = map.waypointAtDistanceAhead(*reference, SECOND_VEHICLE_DISTANCE);
        if (!first.has_value() || !second.has_value() || second->traveled + 1e-6 < SECOND_VEHICLE_DISTANCE)
        {
            setError(error, "road ahead of the ego is too short");
            return false;
        }

        auto oncoming = map.leftLane(second->waypoint);
        if (!oncoming.has_value())
        {
            setError(error, "no lane left of the ego lane");
            return false;
        }

        if (!spawnOther("vehicle.tesla.model3", first->waypoint.pose(), "leading_vehicle", error))
        {
            return false;
        }
        return spawnOther("vehicle.audi.tt", oncoming->pose(), "oncoming_vehicle", error).has_value();
    }

    std::unique_ptr<BehaviorNode> ManeuverOppositeDirection::createBehavior()
    {
        const ActorId leading = otherActors().at(0);
        const ActorId oncoming = otherActors().at(1);

        auto drive_both = std::make_unique<Parallel>(ParallelPolicy::SuccessOnAll, "DriveBoth");
        drive_both->addChild(std::make_unique<WaypointFollower>(world, leading, FIRST_VEHICLE_SPEED, "LeadingFollower"));
        drive_both->addChild(std::make_unique<WaypointFollower>(world, oncoming, SECOND_VEHICLE_SPEED, "OncomingFollower"));

        auto start_traffic = std::make_unique<Sequence>("StartTraffic");
        start_traffic->addChild(std::make_unique<InTriggerDistanceToVehicle>(world, leading, ego(), TRIGGER_DISTANCE));
        start_traffic->addChild(std::move(drive_both));

        auto root = std::make_unique<Parallel>(ParallelPolicy::SuccessOnOne, "ManeuverOppositeDirection");
        root->addChild(std::make_unique<DriveDistance>(world, ego(), EGO_DRIVE_DISTANCE, "EgoDriveDistance"));
        root->addChild(std::move(start_traffic));
        return root;
    }

    std::unique_ptr<Scenario> makeScenario(const std::string &name, IWorld &world, const IMapService &map)
    {
        if (name == "StationaryObjectCrossing")
        {
            return std::make_unique<StationaryObjectCrossing>(world, map);
        }
        if (name == "DynamicObjectCrossing")
        {
            return std::make_unique<DynamicObjectCrossing>(world, map);
        }
        if (name == "ManeuverOppositeDirection")
        {
            return std::make_unique<ManeuverOppositeDirection>(world, map);
        }
        return nullptr;
    }

    const std::vector<std::string> &scenarioNames()
    {
        static const std::vector<std::string> names = {
            "StationaryObjectCrossing",
            "DynamicObjectCrossing",
            "ManeuverOppositeDirection"};
        return names;
    }

} // namespace trafficscenario
