#pragma once
#include <string>
#include <vector>
#include "NodeAgent.hpp"
#include "Topology.hpp"
#include "TraceFilter.hpp"
#include "UpdateChannel.hpp"
#include "SimulationObserver.hpp"

// Runs synchronous rounds over the agents: every agent broadcasts, then
// every agent receives, then the observer sees the tables. Agents are
// visited in declaration order.
class ConvergenceEngine
{
public:
    ConvergenceEngine(const Topology &topology, const std::vector<std::string> &nodeIds,
                      const TraceFilter &traceFilter = TraceFilter(), size_t compressThreshold = 500);

    void setObserver(SimulationObserver *observer) { this->observer = observer; }

    void initialize();
    // Rounds while any agent is dirty, at most cap of them. Returns the rounds run.
    int converge(int cap);
    // Reset every agent after the topology was mutated, then one exchange
    void applyTopologyReset();
    // One broadcast phase and one receive phase at the current round.
    // Agents that changed stay dirty, which is what isConverged() reads.
    void exchange();

    bool isConverged() const;
    int currentRound() const { return round; }

    const std::vector<NodeAgent> &getAgents() const { return agents; }
    const NodeAgent &getAgent(const std::string &name) const;
    const UpdateChannel &getChannel() const { return channel; }

private:
    void reportTables();

    const Topology &topology;
    std::vector<std::string> nodeIds;
    std::vector<NodeAgent> agents;
    TraceFilter traceFilter;
    UpdateChannel channel;
    SimulationObserver *observer = nullptr;
    int round = 0;
};
