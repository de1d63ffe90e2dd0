#pragma once
#include <vector>
#include "NodeAgent.hpp"
#include "TraceFilter.hpp"
#include "UpdateChannel.hpp"

enum class Section
{
    Start,
    Initial,
    Update,
    Final
};

struct SimulationSummary
{
    int finalRound = 0;
    int initialRounds = 0;
    int updateRounds = 0;
    bool hadUpdate = false;
    bool initialConverged = false;
    bool updateConverged = false;
    UpdateChannel::TrafficStats traffic;
};

// Reads agent state at round boundaries. Agents must not be modified.
class SimulationObserver
{
public:
    virtual ~SimulationObserver() = default;

    virtual void onSection(Section section) = 0;
    virtual void onDistanceTables(int round, const std::vector<NodeAgent> &agents) = 0;
    virtual void onRoutingTables(const std::vector<NodeAgent> &agents) = 0;
    virtual void onTrace(const CostChange &change) = 0;
    virtual void onFinished(const SimulationSummary &summary) { (void)summary; }
};
