#pragma once
#include <memory>
#include <string>
#include <vector>
#include "ConvergenceEngine.hpp"
#include "ScenarioParser.hpp"
#include "SimulationObserver.hpp"
#include "Topology.hpp"
#include "utils.hpp"

// Builds the topology from a scenario, drives the engine through the
// initial convergence and the optional topology change, and reports the
// sections to an observer. The only place the topology is mutated.
class Simulation
{
public:
    Simulation(const Scenario &scenario, const SimulationConfig &config);
    Simulation(const Simulation &) = delete;
    Simulation &operator=(const Simulation &) = delete;

    SimulationSummary run(SimulationObserver &observer);

    const Topology &getTopology() const { return topology; }
    const ConvergenceEngine &getEngine() const { return *engine; }
    const std::vector<LinkSpec> &getPendingChanges() const { return changes; }

private:
    bool acceptLink(const LinkSpec &link, const char *context) const;
    void applyLink(const LinkSpec &link);

    SimulationConfig config;
    std::vector<std::string> nodeIds;
    std::vector<LinkSpec> changes;
    Topology topology;
    std::unique_ptr<ConvergenceEngine> engine;
};
