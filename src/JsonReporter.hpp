#pragma once
#include <ostream>
#include <nlohmann/json.hpp>
#include "SimulationObserver.hpp"

// Collects the whole run and writes a single JSON document when the
// simulation finishes.
class JsonReporter : public SimulationObserver
{
public:
    explicit JsonReporter(std::ostream &out, int indent = 2) : out(out), indent(indent) {}

    void onSection(Section section) override;
    void onDistanceTables(int round, const std::vector<NodeAgent> &agents) override;
    void onRoutingTables(const std::vector<NodeAgent> &agents) override;
    void onTrace(const CostChange &change) override;
    void onFinished(const SimulationSummary &summary) override;

    const nlohmann::json &getDocument() const { return document; }

private:
    nlohmann::json &currentSection();

    std::ostream &out;
    int indent;
    nlohmann::json document = {{"sections", nlohmann::json::array()}, {"traces", nlohmann::json::array()}};
};

const char *sectionName(Section section);
