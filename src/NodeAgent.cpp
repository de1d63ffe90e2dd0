// NodeAgent.cpp
#include "NodeAgent.hpp"
#include "UpdateChannel.hpp"

NodeAgent::NodeAgent(const std::string &name) : name(name) {}

void NodeAgent::setupTable(const std::vector<std::string> &allNodeIds)
{
    distances = DistanceTable(name, allNodeIds);
    routing = RoutingTable{};
    mailbox.clear();
    dirty = false;
    initialized = false;
    disturbed = false;
}

void NodeAgent::initializeFromTopology(const Topology &topology, const std::vector<NodeAgent> &allAgents)
{
    auto neighbors = topology.neighborsOf(name);
    for (const auto &neighbor : neighbors)
    {
        // links to nodes without an agent are not part of the table
        if (distances.hasDestination(neighbor))
            distances.set(neighbor, neighbor, topology.linkCost(name, neighbor));
    }

    for (const auto &agent : allAgents)
    {
        const std::string &via = agent.getName();
        if (via == name || neighbors.count(via) || !distances.hasDestination(via))
            continue;

        for (const auto &destination : distances.destinations())
        {
            distances.set(destination, via, Cost::unreachable());
        }
    }

    // First round always advertises the direct links
    dirty = true;
    initialized = true;
}

void NodeAgent::broadcast(const std::set<std::string> &neighbors, std::vector<NodeAgent> &allAgents,
                          UpdateChannel &channel, int round)
{
    if (!dirty)
        return;

    computeRoutingTable();

    UpdateMessage message(name, round, distances);
    for (auto &agent : allAgents)
    {
        if (agent.getName() != name && neighbors.count(agent.getName()))
        {
            channel.send(message, agent);
        }
    }

    dirty = false;
    disturbed = false;
}

std::vector<CostChange> NodeAgent::receive(int round)
{
    std::vector<CostChange> changes;

    for (const auto &message : mailbox)
    {
        const std::string &source = message.getSource();
        if (!distances.hasDestination(source))
            continue;

        const DistanceTable &senderTable = message.getVector();
        Cost costToSource = distances.at(source, source);

        for (const auto &destination : distances.destinations())
        {
            if (destination == source)
                continue;

            // No split horizon: the source may advertise a route it learned from us
            Cost candidate = combine(costToSource, senderTable.bestCost(destination));
            Cost previous = distances.at(destination, source);
            if (candidate != previous)
            {
                distances.set(destination, source, candidate);
                dirty = true;
                changes.push_back(CostChange{round, name, destination, source, previous, candidate});
            }
        }
    }

    mailbox.clear();
    return changes;
}

void NodeAgent::computeRoutingTable()
{
    routing = RoutingTable::fromDistanceTable(distances);
}

void NodeAgent::handleTopologyChange(const Topology &topology)
{
    mailbox.clear();
    DistanceTable previous = distances;
    auto neighbors = topology.neighborsOf(name);

    for (const auto &destination : previous.destinations())
    {
        for (const auto &via : previous.destinations())
        {
            if (neighbors.count(via))
                distances.set(destination, via, topology.linkCost(name, via));
            else
                distances.set(destination, via, Cost::unreachable());
        }
    }

    if (distances != previous)
    {
        dirty = true;
        disturbed = true;
    }
}

void NodeAgent::deliver(const UpdateMessage &message)
{
    mailbox.push_back(message);
}

AgentState NodeAgent::getState() const
{
    if (!initialized)
        return AgentState::Uninitialized;
    if (!dirty)
        return AgentState::Converged;
    if (disturbed)
        return AgentState::Disturbed;
    return AgentState::Dirty;
}
