#include "JsonReporter.hpp"
#include <stdexcept>

using json = nlohmann::json;

const char *sectionName(Section section)
{
    switch (section)
    {
    case Section::Start:
        return "START";
    case Section::Initial:
        return "INITIAL";
    case Section::Update:
        return "UPDATE";
    case Section::Final:
        return "FINAL";
    }
    return "UNKNOWN";
}

json &JsonReporter::currentSection()
{
    auto &sections = document["sections"];
    if (sections.empty())
    {
        throw std::logic_error("JSON report received tables before any section");
    }
    return sections.back();
}

void JsonReporter::onSection(Section section)
{
    document["sections"].push_back({{"name", sectionName(section)}, {"rounds", json::array()}});
}

void JsonReporter::onDistanceTables(int round, const std::vector<NodeAgent> &agents)
{
    json routers = json::object();
    for (const auto &agent : agents)
    {
        routers[agent.getName()] = distanceTableToJson(agent.getDistanceTable());
    }
    currentSection()["rounds"].push_back({{"t", round}, {"routers", routers}});
}

void JsonReporter::onRoutingTables(const std::vector<NodeAgent> &agents)
{
    json routing = json::object();
    for (const auto &agent : agents)
    {
        json routes = json::object();
        for (const auto &[destination, route] : agent.getRoutingTable().table)
        {
            routes[destination] = {
                {"next_hop", route.hasNextHop() ? json(route.nextHop) : json(nullptr)},
                {"cost", costToJson(route.cost)}};
        }
        routing[agent.getName()] = routes;
    }
    currentSection()["routing"] = routing;
}

void JsonReporter::onTrace(const CostChange &change)
{
    document["traces"].push_back({{"t", change.round},
                                  {"router", change.node},
                                  {"destination", change.destination},
                                  {"via", change.via},
                                  {"previous", costToJson(change.previous)},
                                  {"cost", costToJson(change.cost)}});
}

void JsonReporter::onFinished(const SimulationSummary &summary)
{
    document["summary"] = {
        {"final_round", summary.finalRound},
        {"initial_rounds", summary.initialRounds},
        {"initial_converged", summary.initialConverged},
        {"had_update", summary.hadUpdate},
        {"update_rounds", summary.updateRounds},
        {"update_converged", summary.updateConverged},
        {"channel", {{"frames_sent", summary.traffic.framesSent},
                     {"bytes_sent", summary.traffic.totalBytesSent},
                     {"compressed_frames", summary.traffic.compressedFrames},
                     {"dropped_frames", summary.traffic.droppedFrames}}}};

    out << document.dump(indent) << std::endl;
}
