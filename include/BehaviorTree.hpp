#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trafficscenario
{
    enum class Status : uint8_t
    {
        Invalid,
        Running,
        Success,
        Failure
    };

    const char *toString(Status status);

    inline bool isTerminal(Status status)
    {
        return status == Status::Success || status == Status::Failure;
    }

    class BehaviorNode
    {
    public:
        explicit BehaviorNode(std::string name);
        virtual ~BehaviorNode() = default;

        BehaviorNode(const BehaviorNode &) = delete;
        BehaviorNode &operator=(const BehaviorNode &) = delete;

        // Evaluates the node once. A terminal status is latched: later ticks
        // return it without re-evaluating.
        Status tick();

        // Stops a running node and its running descendants. The node ends in
        // final_status, descendants in Status::Invalid.
        void halt(Status final_status);

        Status status() const { return current_status; }
        const std::string &name() const { return node_name; }
        bool started() const { return has_started; }

        virtual std::vector<const BehaviorNode *> children() const { return {}; }
        virtual std::string kind() const = 0;

    protected:
        virtual void initialise() {}
        virtual Status update() = 0;
        virtual void terminate(Status) {}
        virtual void haltChildren() {}

    private:
        std::string node_name;
        Status current_status = Status::Invalid;
        bool has_started = false;
    };

    class Composite : public BehaviorNode
    {
    public:
        using BehaviorNode::BehaviorNode;

        // Tree structure is fixed once ticking starts; throws std::logic_error afterwards.
        BehaviorNode &addChild(std::unique_ptr<BehaviorNode> child);

        std::vector<const BehaviorNode *> children() const override;
        std::size_t childCount() const { return child_nodes.size(); }

    protected:
        void haltChildren() override;

        std::vector<std::unique_ptr<BehaviorNode>> child_nodes;
    };

    // Advances by at most one child per tick and resumes at that child on the next tick.
    class Sequence : public Composite
    {
    public:
        explicit Sequence(std::string name = "Sequence");

        std::string kind() const override { return "Sequence"; }
        std::size_t currentIndex() const { return current_child; }

    protected:
        void initialise() override;
        Status update() override;

    private:
        std::size_t current_child = 0;
    };

    enum class ParallelPolicy
    {
        SuccessOnOne,
        SuccessOnAll
    };

    const char *toString(ParallelPolicy policy);

    // Ticks every child every tick; running children are halted once the
    // aggregate status is decided.
    class Parallel : public Composite
    {
    public:
        explicit Parallel(ParallelPolicy policy = ParallelPolicy::SuccessOnAll, std::string name = "Parallel");

        std::string kind() const override;
        ParallelPolicy policy() const { return success_policy; }

    protected:
        Status update() override;
        void terminate(Status status) override;

    private:
        ParallelPolicy success_policy;
    };

    // Indented one-line-per-node dump: "kind name [STATUS]".
    std::string describeTree(const BehaviorNode &root);

} // namespace trafficscenario
