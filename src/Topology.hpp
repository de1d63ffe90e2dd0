// Topology.hpp
#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include "Cost.hpp"

// Undirected weighted graph. Every link is stored in both directions.
class Topology
{
public:
    void insertNode(const std::string &id);
    void connect(const std::string &a, const std::string &b, int cost);
    bool disconnect(const std::string &a, const std::string &b);

    std::set<std::string> neighborsOf(const std::string &id) const;
    Cost linkCost(const std::string &a, const std::string &b) const;

    bool hasNode(const std::string &id) const;
    bool hasLink(const std::string &a, const std::string &b) const;
    const std::vector<std::string> &nodes() const { return nodeOrder; }
    size_t linkCount() const;

private:
    std::map<std::string, std::map<std::string, int>> adjacency;
    std::vector<std::string> nodeOrder;
};
