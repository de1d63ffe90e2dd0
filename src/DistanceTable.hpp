// DistanceTable.hpp
#pragma once
#include <string>
#include <vector>
#include <map>
#include "Cost.hpp"

// Costs to every destination broken down by the neighbor (via) they were
// learned through. Rows and via columns are "all nodes except owner",
// fixed at construction.
class DistanceTable
{
public:
    DistanceTable() = default;
    DistanceTable(const std::string &owner, const std::vector<std::string> &allNodeIds);

    const std::string &getOwner() const { return owner; }

    Cost at(const std::string &destination, const std::string &via) const;
    void set(const std::string &destination, const std::string &via, const Cost &cost);
    void fill(const Cost &cost);

    // Minimum over the row, unreachable for unknown destinations
    Cost bestCost(const std::string &destination) const;
    // Smallest via reaching bestCost, empty if the row is unreachable
    std::string bestVia(const std::string &destination) const;

    bool hasDestination(const std::string &destination) const;
    // Declaration order of the nodes the table was built from
    const std::vector<std::string> &destinations() const { return order; }
    size_t size() const { return rows.size(); }

    const std::map<std::string, std::map<std::string, Cost>> &getRows() const { return rows; }

    bool operator==(const DistanceTable &other) const;
    bool operator!=(const DistanceTable &other) const { return !(*this == other); }

private:
    std::string owner;
    std::vector<std::string> order;
    std::map<std::string, std::map<std::string, Cost>> rows;
};
