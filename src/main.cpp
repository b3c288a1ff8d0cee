#include <iostream>
#include <atomic>
#include <csignal>
#include <fstream>
#include <sstream>
#include <string>
#include "BehaviorTree.hpp"
#include "MetricExtractor.hpp"
#include "RunConfigJson.hpp"
#include "ScenarioManager.hpp"
#include "ScenarioRunner.hpp"
#include "Scenarios.hpp"

namespace
{
    std::atomic<trafficscenario::ScenarioRunner *> g_active_runner{nullptr};

    void handleSignal(int)
    {
        if (trafficscenario::ScenarioRunner *runner = g_active_runner.load())
        {
            runner->requestStop();
        }
    }

    void printUsage()
    {
        std::cout << "Usage:" << std::endl;
        std::cout << "  trafficscenario list" << std::endl;
        std::cout << "  trafficscenario run <config.json>" << std::endl;
        std::cout << "  trafficscenario metric <recording.db> <output.json>" << std::endl;
    }

    int listScenarios()
    {
        for (const auto &name : trafficscenario::scenarioNames())
        {
            std::cout << name << std::endl;
        }
        return 0;
    }

    int runScenario(const std::string &config_path)
    {
        std::ifstream in(config_path);
        if (!in.good())
        {
            std::cerr << "Error: cannot read config file " << config_path << std::endl;
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        trafficscenario::ConfigParseResult parsed = trafficscenario::runConfigFromJson(buffer.str());
        if (!parsed.ok)
        {
            std::cerr << "Error: invalid config " << config_path << std::endl;
            for (const auto &error : parsed.errors)
            {
                std::cerr << "  " << error << std::endl;
            }
            return 1;
        }

        std::cout << "=== Traffic Scenario: " << parsed.config.scenario << " ===" << std::endl;

        trafficscenario::ScenarioRunner runner(parsed.config);
        g_active_runner = &runner;
        trafficscenario::RunReport report = runner.run();
        g_active_runner = nullptr;

        const trafficscenario::ScenarioOutcome &outcome = report.outcome;
        if (!outcome.runnable)
        {
            std::cerr << "Error: scenario could not be set up: " << report.error << std::endl;
            return 1;
        }

        std::cout << "Status:   " << trafficscenario::toString(outcome.behavior_status) << std::endl;
        std::cout << "Duration: " << outcome.duration << " s (" << outcome.frames << " frames)" << std::endl;
        for (const auto &criterion : outcome.criteria)
        {
            std::cout << "  " << criterion.name << " [" << trafficscenario::toString(criterion.status) << "] actual "
                      << criterion.actual_value << ", expected " << criterion.expected_value << std::endl;
        }
        std::cout << "Behavior tree:" << std::endl << outcome.behavior_tree;
        if (outcome.timed_out)
        {
            std::cout << "Scenario timed out" << std::endl;
        }
        if (outcome.cancelled)
        {
            std::cout << "Scenario cancelled" << std::endl;
        }
        if (!outcome.abort_reason.empty())
        {
            std::cerr << "Warning: run aborted: " << outcome.abort_reason << std::endl;
        }

        if (!report.ok)
        {
            std::cerr << "Error: " << report.error << std::endl;
            return 1;
        }
        if (report.metric.has_value())
        {
            std::cout << "Metric written to " << parsed.config.metric_output << " (" << report.metric->size()
                      << " samples)" << std::endl;
        }

        std::cout << trafficscenario::scenarioOutcomeToJson(outcome) << std::endl;
        std::cout << (outcome.passed() ? "PASSED" : "FAILED") << std::endl;
        return outcome.passed() ? 0 : 2;
    }

    int extractMetric(const std::string &recording_path, const std::string &output_path)
    {
        std::string error;
        auto samples = trafficscenario::extractRecordingMetric(recording_path, &error);
        if (!samples.has_value())
        {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }

        if (!trafficscenario::writeMetricJson(output_path, *samples, &error))
        {
            std::cerr << "Error: " << error << std::endl;
            return 1;
        }

        std::cout << "Wrote " << samples->size() << " samples to " << output_path << std::endl;
        return 0;
    }
}

int main(int argc, char **argv)
{
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (argc < 2)
    {
        printUsage();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "list" && argc == 2)
        return listScenarios();
    if (command == "run" && argc == 3)
        return runScenario(argv[2]);
    if (command == "metric" && argc == 4)
        return extractMetric(argv[2], argv[3]);

    printUsage();
    return 1;
}
