#pragma once
#include <string>
#include <vector>
#include <set>
#include <tuple>
#include <istream>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

enum class UnknownNodePolicy
{
    Reject,
    Orphan
};

enum class ReportFormat
{
    Text,
    Json
};

using TraceTriple = std::tuple<std::string, std::string, std::string>; // node, destination, via

struct SimulationConfig
{
    int initialRoundCap = 2;
    int updateRoundCap = 2;
    UnknownNodePolicy unknownNodes = UnknownNodePolicy::Reject;
    ReportFormat report = ReportFormat::Text;
    bool verbose = false;

    bool traceAll = false;
    int traceFromRound = 0;
    std::set<TraceTriple> traceTriples;

    size_t compressThreshold = 500;
};

SimulationConfig parseSimulationConfig(std::istream &input);

SimulationConfig loadSimulationConfig(const std::string &configFile);

UnknownNodePolicy parseUnknownNodePolicy(const std::string &value);

ReportFormat parseReportFormat(const std::string &value);

std::vector<std::string> split(const std::string &str, char delimiter);

std::vector<std::string> splitWhitespace(const std::string &str);

std::string trim(const std::string &str);

// Diagnostics on stderr; stdout carries the report
void setVerbose(bool enabled);
bool isVerbose();
void logDebug(const std::string &message);
void logWarning(const std::string &message);
void logError(const std::string &message);

inline std::string toHex(const std::string &input)
{
    std::ostringstream oss;
    for (unsigned char c : input)
    {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return oss.str();
}

std::string fromHex(const std::string &hex);

inline std::string computeDigest(const std::string &data)
{
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), result, &len, EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return std::string(reinterpret_cast<char *>(result), len);
}
