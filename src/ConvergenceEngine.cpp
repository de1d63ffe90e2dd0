#include "ConvergenceEngine.hpp"
#include <stdexcept>

ConvergenceEngine::ConvergenceEngine(const Topology &topology, const std::vector<std::string> &nodeIds,
                                     const TraceFilter &traceFilter, size_t compressThreshold)
    : topology(topology), nodeIds(nodeIds), traceFilter(traceFilter), channel(compressThreshold)
{
    for (const auto &id : nodeIds)
    {
        agents.emplace_back(id);
    }
}

void ConvergenceEngine::initialize()
{
    round = 0;
    channel.resetStats();

    for (auto &agent : agents)
    {
        agent.setupTable(nodeIds);
    }
    for (auto &agent : agents)
    {
        agent.initializeFromTopology(topology, agents);
    }

    reportTables();
}

int ConvergenceEngine::converge(int cap)
{
    int rounds = 0;
    while (!isConverged() && rounds < cap)
    {
        round++;
        rounds++;
        exchange();
        reportTables();
    }
    return rounds;
}

void ConvergenceEngine::applyTopologyReset()
{
    round++;
    for (auto &agent : agents)
    {
        agent.handleTopologyChange(topology);
    }
    reportTables();

    exchange();
}

void ConvergenceEngine::exchange()
{
    // ======= BROADCAST PHASE =======
    for (auto &agent : agents)
    {
        agent.broadcast(topology.neighborsOf(agent.getName()), agents, channel, round);
    }

    // ======= RECEIVE PHASE =======
    for (auto &agent : agents)
    {
        auto changes = agent.receive(round);
        if (observer && traceFilter.isEnabled())
        {
            for (const auto &change : changes)
            {
                if (traceFilter.accepts(change))
                    observer->onTrace(change);
            }
        }
    }
}

bool ConvergenceEngine::isConverged() const
{
    for (const auto &agent : agents)
    {
        if (agent.needsUpdate())
            return false;
    }
    return true;
}

const NodeAgent &ConvergenceEngine::getAgent(const std::string &name) const
{
    for (const auto &agent : agents)
    {
        if (agent.getName() == name)
            return agent;
    }
    throw std::out_of_range("No agent named " + name);
}

void ConvergenceEngine::reportTables()
{
    if (observer)
        observer->onDistanceTables(round, agents);
}
