#pragma once
#include <string>
#include <set>
#include "Cost.hpp"
#include "utils.hpp"

// One relaxation that changed a distance table entry
struct CostChange
{
    int round = 0;
    std::string node;
    std::string destination;
    std::string via;
    Cost previous;
    Cost cost;
};

// Decides which cost changes are reported as trace lines.
// Default constructed filters accept nothing.
class TraceFilter
{
public:
    TraceFilter() = default;
    TraceFilter(bool traceAll, int fromRound, const std::set<TraceTriple> &triples);

    static TraceFilter fromConfig(const SimulationConfig &config);

    bool accepts(const CostChange &change) const;
    bool isEnabled() const { return traceAll || !triples.empty(); }

private:
    bool traceAll = false;
    int fromRound = 0;
    std::set<TraceTriple> triples;
};
