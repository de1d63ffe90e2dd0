#pragma once
#include <string>
#include <map>
#include "Cost.hpp"
#include "DistanceTable.hpp"

struct Route
{
    Cost cost;
    std::string nextHop; // empty when the destination is unreachable

    bool hasNextHop() const { return !nextHop.empty(); }
    bool operator==(const Route &other) const { return cost == other.cost && nextHop == other.nextHop; }
};

class RoutingTable
{
public:
    std::map<std::string, Route> table;

    static RoutingTable fromDistanceTable(const DistanceTable &distances);

    // Unreachable route without next hop for unknown destinations
    Route lookup(const std::string &destination) const;
    bool empty() const { return table.empty(); }

    bool operator==(const RoutingTable &other) const { return table == other.table; }
    bool operator!=(const RoutingTable &other) const { return !(*this == other); }
};
