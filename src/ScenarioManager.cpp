#include "ScenarioManager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace trafficscenario
{
    namespace
    {
        using nlohmann::json;

        constexpr double TIME_EPSILON = 1e-9;
    }

    bool ScenarioOutcome::passed() const
    {
        if (!runnable || timed_out || cancelled || !abort_reason.empty() || behavior_status != Status::Success)
        {
            return false;
        }
        return std::all_of(criteria.begin(), criteria.end(),
                           [](const CriterionResult &result)
                           { return result.status == Status::Success; });
    }

    std::string scenarioOutcomeToJson(const ScenarioOutcome &outcome)
    {
        json root;
        root["scenario"] = outcome.scenario;
        root["runnable"] = outcome.runnable;
        if (!outcome.setup_error.empty())
        {
            root["setup_error"] = outcome.setup_error;
        }
        root["status"] = toString(outcome.behavior_status);
        root["passed"] = outcome.passed();
        root["timed_out"] = outcome.timed_out;
        root["cancelled"] = outcome.cancelled;
        root["duration"] = outcome.duration;
        root["frames"] = outcome.frames;
        if (!outcome.abort_reason.empty())
        {
            root["abort_reason"] = outcome.abort_reason;
        }
        if (!outcome.recording_error.empty())
        {
            root["recording_error"] = outcome.recording_error;
        }

        root["criteria"] = json::array();
        for (const auto &result : outcome.criteria)
        {
            json criterion_json;
            criterion_json["name"] = result.name;
            criterion_json["actor"] = result.actor;
            criterion_json["status"] = toString(result.status);
            criterion_json["actual_value"] = result.actual_value;
            criterion_json["expected_value"] = result.expected_value;
            root["criteria"].push_back(criterion_json);
        }

        return root.dump();
    }

    ScenarioManager::ScenarioManager(IWorld &world, double time_step)
        : world(world), time_step(time_step)
    {
    }

    void ScenarioManager::recordActors(const Scenario &scenario, ScenarioOutcome &outcome)
    {
        for (ActorId id : world.actorIds())
        {
            std::string role = "other";
            if (id == scenario.ego())
            {
                role = EGO_ROLE;
            }
            else
            {
                for (const auto &pooled : scenario.actors().actors())
                {
                    if (pooled.id == id)
                    {
                        role = pooled.role;
                    }
                }
            }

            const std::string blueprint = world.blueprintOf(id).value_or("unknown");
            if (!recorder->recordActor(id, blueprint, role, &outcome.recording_error))
            {
                recording_ok = false;
                return;
            }
        }
    }

    void ScenarioManager::recordFrame(ScenarioOutcome &outcome)
    {
        if (!recorder || !recording_ok)
        {
            return;
        }

        std::vector<ActorState> states;
        for (ActorId id : world.actorIds())
        {
            auto pose = world.getPose(id);
            auto velocity = world.getVelocity(id);
            if (!pose.has_value() || !velocity.has_value())
            {
                continue;
            }
            states.push_back({id, world.frame(), *pose, *velocity});
        }

        // A broken recording does not abort the run; the error is reported in the outcome.
        if (!recorder->recordFrame(world.frame(), states, &outcome.recording_error))
        {
            recording_ok = false;
        }
    }

    ScenarioOutcome ScenarioManager::run(Scenario &scenario)
    {
        ScenarioOutcome outcome;
        outcome.scenario = scenario.name();
        recording_ok = true;

        if (time_step <= 0.0)
        {
            outcome.setup_error = "time step must be positive";
            outcome.behavior_status = Status::Failure;
            return outcome;
        }

        if (!scenario.isReady())
        {
            outcome.setup_error = "scenario " + scenario.name() + " was not set up";
            outcome.behavior_status = Status::Failure;
            return outcome;
        }
        outcome.runnable = true;

        std::unique_ptr<BehaviorNode> root = scenario.createBehavior();
        std::vector<std::unique_ptr<Criterion>> criteria = scenario.createCriteria();

        if (recorder)
        {
            recordActors(scenario, outcome);
        }

        const double start_time = world.elapsedSeconds();
        const uint64_t start_frame = world.frame();

        while (true)
        {
            if (stop_requested)
            {
                root->halt(Status::Failure);
                outcome.cancelled = true;
                break;
            }

            if (agent && !agent->step())
            {
                root->halt(Status::Failure);
                outcome.abort_reason = "ego actor can no longer be driven";
                break;
            }
            world.tick(time_step);
            recordFrame(outcome);

            const Status status = root->tick();

            bool criterion_failed = false;
            for (auto &criterion : criteria)
            {
                if (criterion->update() == Status::Failure)
                {
                    criterion_failed = true;
                }
            }

            if (isTerminal(status))
            {
                break;
            }
            if (criterion_failed)
            {
                root->halt(Status::Failure);
                break;
            }
            if (world.elapsedSeconds() - start_time + TIME_EPSILON >= scenario.timeout())
            {
                root->halt(Status::Failure);
                outcome.timed_out = true;
                break;
            }
        }

        for (auto &criterion : criteria)
        {
            criterion->finish();
            outcome.criteria.push_back(criterion->result());
        }

        // A root that never got ticked is reported as failed too.
        outcome.behavior_status = isTerminal(root->status()) ? root->status() : Status::Failure;
        outcome.duration = world.elapsedSeconds() - start_time;
        outcome.frames = world.frame() - start_frame;
        outcome.behavior_tree = describeTree(*root);
        stop_requested = false;

        // Nodes hold actor ids only; drop them before the actors go away.
        root.reset();
        scenario.releaseActors();
        return outcome;
    }

} // namespace trafficscenario
