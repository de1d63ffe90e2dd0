// RoutingTable.cpp
#include "RoutingTable.hpp"

RoutingTable RoutingTable::fromDistanceTable(const DistanceTable &distances)
{
    RoutingTable rt;
    for (const auto &destination : distances.destinations())
    {
        Route route;
        route.cost = distances.bestCost(destination);
        route.nextHop = distances.bestVia(destination);
        rt.table[destination] = route;
    }
    return rt;
}

Route RoutingTable::lookup(const std::string &destination) const
{
    auto it = table.find(destination);
    if (it == table.end())
        return Route{};
    return it->second;
}
