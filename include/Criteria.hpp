#pragma once

#include "BehaviorTree.hpp"
#include "World.hpp"

#include <string>

namespace trafficscenario
{
    struct CriterionResult
    {
        std::string name;
        ActorId actor = 0;
        Status status = Status::Invalid;
        double actual_value = 0.0;
        double expected_value = 0.0;
    };

    // Pass/fail judgment tracked next to, not inside, the behavior tree.
    class Criterion
    {
    public:
        Criterion(std::string name, ActorId actor, double expected_value);
        virtual ~Criterion() = default;

        // Called once per tick; a failure is final.
        Status update();
        // Called when the run ends; a still-running criterion passes.
        void finish();

        const CriterionResult &result() const { return current; }

    protected:
        virtual Status evaluate(double &actual_value) = 0;

    private:
        CriterionResult current;
    };

    class CollisionTest : public Criterion
    {
    public:
        CollisionTest(const IWorld &world, ActorId actor);

    protected:
        Status evaluate(double &actual_value) override;

    private:
        const IWorld &world;
    };

} // namespace trafficscenario
