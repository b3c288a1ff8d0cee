#pragma once

#include "BehaviorTree.hpp"
#include "Criteria.hpp"
#include "LaneKeepingAgent.hpp"
#include "Recording.hpp"
#include "Scenarios.hpp"
#include "World.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trafficscenario
{
    struct ScenarioOutcome
    {
        std::string scenario;
        bool runnable = false;
        std::string setup_error;
        Status behavior_status = Status::Invalid;
        std::vector<CriterionResult> criteria;
        bool timed_out = false;
        bool cancelled = false;
        double duration = 0.0; // simulation seconds
        uint64_t frames = 0;
        std::string abort_reason;
        std::string recording_error;
        std::string behavior_tree; // final node states, see describeTree

        bool passed() const;
    };

    std::string scenarioOutcomeToJson(const ScenarioOutcome &outcome);

    // Drives one scenario to completion: agent step, world tick, frame
    // recording, behavior tick and criteria update, in that order.
    class ScenarioManager
    {
    public:
        explicit ScenarioManager(IWorld &world, double time_step = 0.05);

        void setAgent(LaneKeepingAgent *ego_agent) { agent = ego_agent; }
        void setRecorder(IFrameRecorder *frame_recorder) { recorder = frame_recorder; }

        ScenarioOutcome run(Scenario &scenario);

        // Safe to call from a signal handler. Honored at the next tick and
        // cleared once that run has ended.
        void requestStop() { stop_requested = true; }
        bool stopRequested() const { return stop_requested; }
        double timeStep() const { return time_step; }

    private:
        void recordActors(const Scenario &scenario, ScenarioOutcome &outcome);
        void recordFrame(ScenarioOutcome &outcome);

        IWorld &world;
        double time_step;
        LaneKeepingAgent *agent = nullptr;
        IFrameRecorder *recorder = nullptr;
        bool recording_ok = true;
        std::atomic<bool> stop_requested{false};
    };

} // namespace trafficscenario
