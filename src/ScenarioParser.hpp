#pragma once
#include <string>
#include <vector>
#include <istream>
#include "Cost.hpp"

struct LinkSpec
{
    std::string a;
    std::string b;
    Cost cost; // unreachable removes the link
};

struct Scenario
{
    std::vector<std::string> nodes;
    std::vector<LinkSpec> links;
    std::vector<LinkSpec> changes;
    size_t skippedLines = 0;
};

// Malformed lines are skipped and counted, never fatal
Scenario parseScenario(std::istream &input);

bool isReservedWord(const std::string &token);
