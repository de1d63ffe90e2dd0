#include "Simulation.hpp"
#include <algorithm>

Simulation::Simulation(const Scenario &scenario, const SimulationConfig &config)
    : config(config), nodeIds(scenario.nodes)
{
    for (const auto &node : nodeIds)
    {
        topology.insertNode(node);
    }

    // -1 among the base declarations means "no link", it never removes one
    for (const auto &link : scenario.links)
    {
        if (!link.cost.isReachable())
        {
            logDebug("link " + link.a + " " + link.b + " declared without cost, skipped");
            continue;
        }
        if (acceptLink(link, "link"))
            applyLink(link);
    }

    // Changes referring to unknown nodes are filtered now so that an
    // empty change list means no #UPDATE section at all
    for (const auto &change : scenario.changes)
    {
        if (acceptLink(change, "update"))
            changes.push_back(change);
    }

    engine = std::make_unique<ConvergenceEngine>(topology, nodeIds, TraceFilter::fromConfig(config),
                                                 config.compressThreshold);

    logDebug("simulation: " + std::to_string(nodeIds.size()) + " routers, " +
             std::to_string(topology.linkCount()) + " links, " +
             std::to_string(changes.size()) + " pending changes");
}

bool Simulation::acceptLink(const LinkSpec &link, const char *context) const
{
    if (config.unknownNodes == UnknownNodePolicy::Orphan)
        return true;

    for (const auto &node : {link.a, link.b})
    {
        if (std::find(nodeIds.begin(), nodeIds.end(), node) == nodeIds.end())
        {
            logWarning(std::string(context) + " " + link.a + " " + link.b +
                       " refers to undeclared node " + node + ", skipped");
            return false;
        }
    }
    return true;
}

void Simulation::applyLink(const LinkSpec &link)
{
    if (link.cost.isReachable())
    {
        topology.connect(link.a, link.b, static_cast<int>(link.cost.value()));
    }
    else if (!topology.disconnect(link.a, link.b))
    {
        logDebug("no link between " + link.a + " and " + link.b + " to remove");
    }
}

SimulationSummary Simulation::run(SimulationObserver &observer)
{
    SimulationSummary summary;
    engine->setObserver(&observer);

    observer.onSection(Section::Start);
    engine->initialize();

    observer.onSection(Section::Initial);
    summary.initialRounds = engine->converge(config.initialRoundCap);
    summary.initialConverged = engine->isConverged();
    observer.onRoutingTables(engine->getAgents());

    logDebug("initial convergence: " + std::to_string(summary.initialRounds) + " rounds, " +
             (summary.initialConverged ? "converged" : "round cap reached"));

    if (!changes.empty())
    {
        summary.hadUpdate = true;
        observer.onSection(Section::Update);

        for (const auto &change : changes)
        {
            applyLink(change);
        }

        engine->applyTopologyReset();
        summary.updateRounds = 1 + engine->converge(config.updateRoundCap);
        summary.updateConverged = engine->isConverged();

        observer.onSection(Section::Final);
        observer.onRoutingTables(engine->getAgents());

        logDebug("post-update convergence: " + std::to_string(summary.updateRounds) + " rounds, " +
                 (summary.updateConverged ? "converged" : "round cap reached"));
    }

    summary.finalRound = engine->currentRound();
    summary.traffic = engine->getChannel().getTrafficStats();
    observer.onFinished(summary);

    engine->setObserver(nullptr);
    return summary;
}
