#include "Criteria.hpp"

#include <utility>

namespace trafficscenario
{
    Criterion::Criterion(std::string name, ActorId actor, double expected_value)
    {
        current.name = std::move(name);
        current.actor = actor;
        current.expected_value = expected_value;
    }

    Status Criterion::update()
    {
        if (current.status == Status::Failure)
        {
            return current.status;
        }

        current.status = evaluate(current.actual_value);
        return current.status;
    }

    void Criterion::finish()
    {
        if (current.status != Status::Failure)
        {
            current.status = Status::Success;
        }
    }

    CollisionTest::CollisionTest(const IWorld &world, ActorId actor)
        : Criterion("CollisionTest", actor, 0.0), world(world)
    {
    }

    Status CollisionTest::evaluate(double &actual_value)
    {
        actual_value = static_cast<double>(world.collisionCount(result().actor));
        return actual_value > result().expected_value ? Status::Failure : Status::Running;
    }

} // namespace trafficscenario
