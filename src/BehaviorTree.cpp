#include "BehaviorTree.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace trafficscenario
{
    const char *toString(Status status)
    {
        switch (status)
        {
        case Status::Invalid:
            return "INVALID";
        case Status::Running:
            return "RUNNING";
        case Status::Success:
            return "SUCCESS";
        case Status::Failure:
            return "FAILURE";
        }
        return "INVALID";
    }

    const char *toString(ParallelPolicy policy)
    {
        switch (policy)
        {
        case ParallelPolicy::SuccessOnOne:
            return "SUCCESS_ON_ONE";
        case ParallelPolicy::SuccessOnAll:
            return "SUCCESS_ON_ALL";
        }
        return "SUCCESS_ON_ALL";
    }

    BehaviorNode::BehaviorNode(std::string name)
        : node_name(std::move(name))
    {
    }

    Status BehaviorNode::tick()
    {
        if (isTerminal(current_status))
        {
            return current_status;
        }

        if (current_status == Status::Invalid)
        {
            has_started = true;
            initialise();
        }

        current_status = update();
        if (isTerminal(current_status))
        {
            terminate(current_status);
        }
        return current_status;
    }

    void BehaviorNode::halt(Status final_status)
    {
        if (current_status != Status::Running)
        {
            return;
        }

        haltChildren();
        terminate(final_status);
        current_status = final_status;
    }

    BehaviorNode &Composite::addChild(std::unique_ptr<BehaviorNode> child)
    {
        if (!child)
        {
            throw std::logic_error("cannot add a null child to " + name());
        }
        if (started())
        {
            throw std::logic_error("cannot add children to " + name() + " after it started ticking");
        }

        child_nodes.push_back(std::move(child));
        return *child_nodes.back();
    }

    std::vector<const BehaviorNode *> Composite::children() const
    {
        std::vector<const BehaviorNode *> out;
        out.reserve(child_nodes.size());
        for (const auto &child : child_nodes)
        {
            out.push_back(child.get());
        }
        return out;
    }

    void Composite::haltChildren()
    {
        for (auto &child : child_nodes)
        {
            child->halt(Status::Invalid);
        }
    }

    Sequence::Sequence(std::string name)
        : Composite(std::move(name))
    {
    }

    void Sequence::initialise()
    {
        current_child = 0;
    }

    Status Sequence::update()
    {
        if (child_nodes.empty())
        {
            return Status::Success;
        }

        const Status child_status = child_nodes[current_child]->tick();
        if (child_status != Status::Success)
        {
            return child_status;
        }

        current_child++;
        return current_child == child_nodes.size() ? Status::Success : Status::Running;
    }

    Parallel::Parallel(ParallelPolicy policy, std::string name)
        : Composite(std::move(name)), success_policy(policy)
    {
    }

    std::string Parallel::kind() const
    {
        return std::string("Parallel/") + toString(success_policy);
    }

    Status Parallel::update()
    {
        if (child_nodes.empty())
        {
            return Status::Success;
        }

        std::size_t successes = 0;
        std::size_t failures = 0;
        for (auto &child : child_nodes)
        {
            const Status child_status = child->tick();
            if (child_status == Status::Success)
                successes++;
            else if (child_status == Status::Failure)
                failures++;
        }

        if (success_policy == ParallelPolicy::SuccessOnOne)
        {
            if (successes > 0)
                return Status::Success;
            if (failures == child_nodes.size())
                return Status::Failure;
            return Status::Running;
        }

        if (failures > 0)
            return Status::Failure;
        if (successes == child_nodes.size())
            return Status::Success;
        return Status::Running;
    }

    void Parallel::terminate(Status)
    {
        haltChildren();
    }

    namespace
    {
        void describeNode(std::ostringstream &out, const BehaviorNode &node, int depth)
        {
            out << std::string(static_cast<std::size_t>(depth) * 2, ' ')
                << node.kind() << " " << node.name() << " [" << toString(node.status()) << "]\n";
            for (const BehaviorNode *child : node.children())
            {
                describeNode(out, *child, depth + 1);
            }
        }
    }

    std::string describeTree(const BehaviorNode &root)
    {
        std::ostringstream out;
        describeNode(out, root, 0);
        return out.str();
    }

} // namespace trafficscenario
