#include "TextReporter.hpp"
#include <algorithm>
#include <iomanip>

void TextReporter::onSection(Section section)
{
    switch (section)
    {
    case Section::Start:
        out << "#START" << std::endl;
        break;
    case Section::Initial:
        out << "\n#INITIAL" << std::endl;
        break;
    case Section::Update:
        out << "\n#UPDATE" << std::endl;
        break;
    case Section::Final:
        out << "\n#FINAL" << std::endl;
        break;
    }
}

void TextReporter::onDistanceTables(int round, const std::vector<NodeAgent> &agents)
{
    for (const auto &agent : agents)
    {
        printDistanceTable(agent, round);
    }
}

void TextReporter::onRoutingTables(const std::vector<NodeAgent> &agents)
{
    for (const auto &agent : agents)
    {
        printRoutingTable(agent);
    }
}

void TextReporter::onTrace(const CostChange &change)
{
    out << "t=" << change.round << " distance from " << change.node << " to " << change.destination
        << " via " << change.via << " is " << change.cost << std::endl;
}

void TextReporter::printDistanceTable(const NodeAgent &agent, int round)
{
    const DistanceTable &distances = agent.getDistanceTable();
    auto nodes = distances.destinations();
    std::sort(nodes.begin(), nodes.end());

    out << "Distance Table of router " << agent.getName() << " at t=" << round << ":" << std::endl;

    out << "     ";
    for (size_t i = 0; i < nodes.size(); ++i)
    {
        out << (i ? "    " : "") << nodes[i];
    }
    out << std::endl;

    std::ios_base::fmtflags flags = out.flags();
    for (const auto &destination : nodes)
    {
        out << destination << "    ";
        for (size_t i = 0; i < nodes.size(); ++i)
        {
            out << (i ? "    " : "") << std::left << std::setw(4)
                << distances.at(destination, nodes[i]).toString();
        }
        out << std::endl;
    }
    out.flags(flags);
}

void TextReporter::printRoutingTable(const NodeAgent &agent)
{
    out << "\nRouting Table of router " << agent.getName() << ":" << std::endl;
    for (const auto &[destination, route] : agent.getRoutingTable().table)
    {
        if (!route.cost.isReachable())
            out << destination << ",INF,INF" << std::endl;
        else
            out << destination << "," << route.nextHop << "," << route.cost.value() << std::endl;
    }
}
