// Topology.cpp
#include "Topology.hpp"
#include <stdexcept>

void Topology::insertNode(const std::string &id)
{
    if (adjacency.count(id))
        return;

    adjacency[id] = {};
    nodeOrder.push_back(id);
}

void Topology::connect(const std::string &a, const std::string &b, int cost)
{
    if (cost < 0)
    {
        throw std::invalid_argument("Negative link cost between " + a + " and " + b);
    }

    insertNode(a);
    insertNode(b);
    adjacency[a][b] = cost;
    adjacency[b][a] = cost;
}

bool Topology::disconnect(const std::string &a, const std::string &b)
{
    if (!hasLink(a, b))
        return false;

    adjacency[a].erase(b);
    adjacency[b].erase(a);
    return true;
}

std::set<std::string> Topology::neighborsOf(const std::string &id) const
{
    std::set<std::string> neighbors;
    auto it = adjacency.find(id);
    if (it == adjacency.end())
        return neighbors;

    for (const auto &[neighbor, _] : it->second)
    {
        neighbors.insert(neighbor);
    }
    return neighbors;
}

Cost Topology::linkCost(const std::string &a, const std::string &b) const
{
    auto it = adjacency.find(a);
    if (it == adjacency.end())
        return Cost::unreachable();

    auto link = it->second.find(b);
    if (link == it->second.end())
        return Cost::unreachable();

    return Cost(link->second);
}

bool Topology::hasNode(const std::string &id) const
{
    return adjacency.count(id) > 0;
}

bool Topology::hasLink(const std::string &a, const std::string &b) const
{
    auto it = adjacency.find(a);
    return it != adjacency.end() && it->second.count(b) > 0;
}

size_t Topology::linkCount() const
{
    size_t halfLinks = 0;
    for (const auto &[_, links] : adjacency)
    {
        halfLinks += links.size();
    }
    return halfLinks / 2;
}
