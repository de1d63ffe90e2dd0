#include "ScenarioParser.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace
{
    const std::set<std::string> RESERVED_WORDS = {"DISTANCEVECTOR", "UPDATE", "END"};

    // Decimal integer in [0, INT_MAX] with an optional leading '+', or -1 for "no link"
    bool parseCostToken(const std::string &token, Cost &cost)
    {
        if (token == "-1")
        {
            cost = Cost::unreachable();
            return true;
        }

        std::string digits = (!token.empty() && token[0] == '+') ? token.substr(1) : token;
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            return false;

        try
        {
            cost = Cost(std::stoi(digits));
        }
        catch (const std::out_of_range &)
        {
            return false;
        }
        return true;
    }

    bool parseLinkLine(const std::vector<std::string> &parts, LinkSpec &link)
    {
        if (isReservedWord(parts[0]) || isReservedWord(parts[1]))
            return false;
        if (parts[0] == parts[1])
            return false;
        if (!parseCostToken(parts[2], link.cost))
            return false;

        link.a = parts[0];
        link.b = parts[1];
        return true;
    }
}

bool isReservedWord(const std::string &token)
{
    return RESERVED_WORDS.count(token) > 0;
}

Scenario parseScenario(std::istream &input)
{
    Scenario scenario;
    std::set<std::string> declared;
    bool readingUpdates = false;
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(input, line))
    {
        lineNumber++;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        if (line == "UPDATE")
        {
            readingUpdates = true;
            continue;
        }
        if (line == "END")
        {
            readingUpdates = false;
            continue;
        }

        auto parts = splitWhitespace(line);
        if (!readingUpdates && parts.size() == 1)
        {
            if (isReservedWord(parts[0]))
            {
                logDebug("line " + std::to_string(lineNumber) + ": reserved word as node name, skipped");
                scenario.skippedLines++;
            }
            else if (declared.insert(parts[0]).second)
            {
                scenario.nodes.push_back(parts[0]);
            }
            else
            {
                logDebug("line " + std::to_string(lineNumber) + ": node " + parts[0] + " already declared");
            }
            continue;
        }

        LinkSpec link;
        if (parts.size() == 3 && parseLinkLine(parts, link))
        {
            if (readingUpdates)
                scenario.changes.push_back(link);
            else
                scenario.links.push_back(link);
            continue;
        }

        logDebug("line " + std::to_string(lineNumber) + ": malformed, skipped: " + line);
        scenario.skippedLines++;
    }

    return scenario;
}
