#pragma once
#include <ostream>
#include "SimulationObserver.hpp"

// Plain-text report: section markers, per-round distance tables and
// routing tables in the classic "dest,nexthop,cost" form.
class TextReporter : public SimulationObserver
{
public:
    explicit TextReporter(std::ostream &out) : out(out) {}

    void onSection(Section section) override;
    void onDistanceTables(int round, const std::vector<NodeAgent> &agents) override;
    void onRoutingTables(const std::vector<NodeAgent> &agents) override;
    void onTrace(const CostChange &change) override;

    void printDistanceTable(const NodeAgent &agent, int round);
    void printRoutingTable(const NodeAgent &agent);

private:
    std::ostream &out;
};
