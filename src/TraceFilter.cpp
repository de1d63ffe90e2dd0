#include "TraceFilter.hpp"

TraceFilter::TraceFilter(bool traceAll, int fromRound, const std::set<TraceTriple> &triples)
    : traceAll(traceAll), fromRound(fromRound), triples(triples)
{
}

TraceFilter TraceFilter::fromConfig(const SimulationConfig &config)
{
    return TraceFilter(config.traceAll, config.traceFromRound, config.traceTriples);
}

bool TraceFilter::accepts(const CostChange &change) const
{
    if (change.round < fromRound)
        return false;
    if (traceAll)
        return true;
    return triples.count(TraceTriple{change.node, change.destination, change.via}) > 0;
}
