#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace
{
    bool verboseLogging = false;

    int parseNonNegative(const std::string &key, const std::string &value)
    {
        size_t consumed = 0;
        int parsed = 0;
        try
        {
            parsed = std::stoi(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Invalid integer for " + key + ": " + value);
        }
        if (consumed != value.size() || parsed < 0)
        {
            throw std::runtime_error("Invalid integer for " + key + ": " + value);
        }
        return parsed;
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        if (value == "true" || value == "yes" || value == "1")
            return true;
        if (value == "false" || value == "no" || value == "0")
            return false;
        throw std::runtime_error("Invalid boolean for " + key + ": " + value);
    }

    std::set<TraceTriple> parseTriples(const std::string &value)
    {
        std::set<TraceTriple> triples;
        for (const auto &item : split(value, ','))
        {
            std::string entry = trim(item);
            if (entry.empty())
                continue;

            auto parts = split(entry, ':');
            if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty())
            {
                throw std::runtime_error("Invalid trace triple (expected node:destination:via): " + entry);
            }
            triples.insert({parts[0], parts[1], parts[2]});
        }
        return triples;
    }
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (std::getline(tokenStream, token, delimiter))
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> splitWhitespace(const std::string &str)
{
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream tokenStream(str);
    while (tokenStream >> token)
    {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string &str)
{
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0)
    {
        throw std::invalid_argument("Odd-length hex string");
    }

    std::string bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        size_t consumed = 0;
        std::string pair = hex.substr(i, 2);
        int byte = 0;
        try
        {
            byte = std::stoi(pair, &consumed, 16);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("Invalid hex digits: " + pair);
        }
        if (consumed != 2)
        {
            throw std::invalid_argument("Invalid hex digits: " + pair);
        }
        bytes.push_back(static_cast<char>(byte));
    }
    return bytes;
}

void setVerbose(bool enabled)
{
    verboseLogging = enabled;
}

bool isVerbose()
{
    return verboseLogging;
}

void logDebug(const std::string &message)
{
    if (verboseLogging)
        std::cerr << "DEBUG " << message << std::endl;
}

void logWarning(const std::string &message)
{
    std::cerr << "WARN " << message << std::endl;
}

void logError(const std::string &message)
{
    std::cerr << "ERROR " << message << std::endl;
}

UnknownNodePolicy parseUnknownNodePolicy(const std::string &value)
{
    if (value == "reject")
        return UnknownNodePolicy::Reject;
    if (value == "orphan")
        return UnknownNodePolicy::Orphan;
    throw std::runtime_error("Invalid unknown_nodes policy (expected reject or orphan): " + value);
}

ReportFormat parseReportFormat(const std::string &value)
{
    if (value == "text")
        return ReportFormat::Text;
    if (value == "json")
        return ReportFormat::Json;
    throw std::runtime_error("Invalid report format (expected text or json): " + value);
}

SimulationConfig parseSimulationConfig(std::istream &input)
{
    SimulationConfig config;
    std::string line;
    std::string currentSection;

    while (std::getline(input, line))
    {
        line = trim(line);

        if (line.empty() || line[0] == '#' || (line.size() > 1 && line[0] == '/' && line[1] == '/'))
            continue;

        // Section header [name]
        if (line.front() == '[' && line.back() == ']')
        {
            currentSection = line.substr(1, line.size() - 2);
            if (currentSection != "simulation" && currentSection != "trace" && currentSection != "channel")
            {
                logWarning("Ignoring unknown config section [" + currentSection + "]");
            }
            continue;
        }

        size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos)
        {
            logWarning("Ignoring config line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, equalsPos));
        std::string value = line.substr(equalsPos + 1);
        size_t commentPos = value.find('#');
        if (commentPos != std::string::npos)
        {
            value = value.substr(0, commentPos);
        }
        value = trim(value);

        if (currentSection == "simulation")
        {
            if (key == "initial_round_cap")
                config.initialRoundCap = parseNonNegative(key, value);
            else if (key == "update_round_cap")
                config.updateRoundCap = parseNonNegative(key, value);
            else if (key == "unknown_nodes")
                config.unknownNodes = parseUnknownNodePolicy(value);
            else if (key == "report")
                config.report = parseReportFormat(value);
            else if (key == "verbose")
                config.verbose = parseBool(key, value);
            else
                logWarning("Ignoring unknown key simulation." + key);
        }
        else if (currentSection == "trace")
        {
            if (key == "all")
                config.traceAll = parseBool(key, value);
            else if (key == "from_round")
                config.traceFromRound = parseNonNegative(key, value);
            else if (key == "triples")
                config.traceTriples = parseTriples(value);
            else
                logWarning("Ignoring unknown key trace." + key);
        }
        else if (currentSection == "channel")
        {
            if (key == "compress_threshold")
                config.compressThreshold = static_cast<size_t>(parseNonNegative(key, value));
            else
                logWarning("Ignoring unknown key channel." + key);
        }
    }

    return config;
}

SimulationConfig loadSimulationConfig(const std::string &configFile)
{
    std::ifstream file(configFile);
    if (!file)
    {
        throw std::runtime_error("Cannot open config file: " + configFile);
    }
    return parseSimulationConfig(file);
}
