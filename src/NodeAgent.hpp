// NodeAgent.hpp
#pragma once
#include <string>
#include <vector>
#include <set>
#include "DistanceTable.hpp"
#include "RoutingTable.hpp"
#include "Topology.hpp"
#include "TraceFilter.hpp"
#include "UpdateMessage.hpp"

class UpdateChannel;

enum class AgentState
{
    Uninitialized,
    Dirty,
    Converged,
    Disturbed
};

class NodeAgent
{
public:
    explicit NodeAgent(const std::string &name);

    void setupTable(const std::vector<std::string> &allNodeIds);
    void initializeFromTopology(const Topology &topology, const std::vector<NodeAgent> &allAgents);

    void broadcast(const std::set<std::string> &neighbors, std::vector<NodeAgent> &allAgents,
                   UpdateChannel &channel, int round);
    std::vector<CostChange> receive(int round);
    void computeRoutingTable();
    void handleTopologyChange(const Topology &topology);

    // Append to the mailbox; consumed by the next receive()
    void deliver(const UpdateMessage &message);

    const std::string &getName() const { return name; }
    const DistanceTable &getDistanceTable() const { return distances; }
    const RoutingTable &getRoutingTable() const { return routing; }
    bool needsUpdate() const { return dirty; }
    size_t pendingMessages() const { return mailbox.size(); }
    AgentState getState() const;

private:
    std::string name;
    DistanceTable distances;
    RoutingTable routing;
    std::vector<UpdateMessage> mailbox;
    bool dirty = false;
    bool initialized = false;
    bool disturbed = false;
};
