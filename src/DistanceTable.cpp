// DistanceTable.cpp
#include "DistanceTable.hpp"
#include <stdexcept>

DistanceTable::DistanceTable(const std::string &owner, const std::vector<std::string> &allNodeIds)
    : owner(owner)
{
    std::map<std::string, Cost> emptyRow;
    for (const auto &id : allNodeIds)
    {
        if (id != owner && emptyRow.emplace(id, Cost::unreachable()).second)
            order.push_back(id);
    }

    for (const auto &destination : order)
    {
        rows[destination] = emptyRow;
    }
}

Cost DistanceTable::at(const std::string &destination, const std::string &via) const
{
    auto row = rows.find(destination);
    if (row == rows.end())
    {
        throw std::out_of_range("Distance table of " + owner + " has no destination " + destination);
    }

    auto entry = row->second.find(via);
    if (entry == row->second.end())
    {
        throw std::out_of_range("Distance table of " + owner + " has no via " + via);
    }
    return entry->second;
}

void DistanceTable::set(const std::string &destination, const std::string &via, const Cost &cost)
{
    auto row = rows.find(destination);
    if (row == rows.end())
    {
        throw std::out_of_range("Distance table of " + owner + " has no destination " + destination);
    }

    auto entry = row->second.find(via);
    if (entry == row->second.end())
    {
        throw std::out_of_range("Distance table of " + owner + " has no via " + via);
    }
    entry->second = cost;
}

void DistanceTable::fill(const Cost &cost)
{
    for (auto &[_, row] : rows)
    {
        for (auto &entry : row)
        {
            entry.second = cost;
        }
    }
}

Cost DistanceTable::bestCost(const std::string &destination) const
{
    Cost best = Cost::unreachable();
    auto row = rows.find(destination);
    if (row == rows.end())
        return best;

    for (const auto &[via, cost] : row->second)
    {
        best = minCost(best, cost);
    }
    return best;
}

std::string DistanceTable::bestVia(const std::string &destination) const
{
    Cost best = Cost::unreachable();
    std::string nextHop;
    auto row = rows.find(destination);
    if (row == rows.end())
        return nextHop;

    // vias iterate in sorted order, so the first strict minimum wins ties
    for (const auto &[via, cost] : row->second)
    {
        if (cost < best)
        {
            best = cost;
            nextHop = via;
        }
    }
    return nextHop;
}

bool DistanceTable::hasDestination(const std::string &destination) const
{
    return rows.count(destination) > 0;
}

bool DistanceTable::operator==(const DistanceTable &other) const
{
    return owner == other.owner && rows == other.rows;
}
