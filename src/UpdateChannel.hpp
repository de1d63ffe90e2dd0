#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "UpdateMessage.hpp"

class NodeAgent;

class FrameError : public std::runtime_error
{
public:
    explicit FrameError(const std::string &what) : std::runtime_error(what) {}
};

// Moves update messages between agents as encoded frames, so a receiver
// only ever holds its own decoded copy of the sender's table.
class UpdateChannel
{
public:
    explicit UpdateChannel(size_t compressThreshold = 500) : compressThreshold(compressThreshold) {}

    // Returns false when the frame was dropped
    bool send(const UpdateMessage &message, NodeAgent &peer);

    nlohmann::json encode(const UpdateMessage &message);
    UpdateMessage decode(const nlohmann::json &frame) const;

    std::string compressData(const std::string &data) const;
    std::string decompressData(const std::string &compressedHex, size_t originalSize) const;

    struct TrafficStats
    {
        size_t framesSent = 0;
        size_t totalBytesSent = 0;
        size_t compressedFrames = 0;
        size_t droppedFrames = 0;
    } stats;

    const TrafficStats &getTrafficStats() const { return stats; }
    void resetStats() { stats = TrafficStats{}; }

private:
    size_t compressThreshold;
};

nlohmann::json costToJson(const Cost &cost);
Cost costFromJson(const nlohmann::json &value);

nlohmann::json distanceTableToJson(const DistanceTable &table);
DistanceTable distanceTableFromJson(const std::string &owner, const nlohmann::json &vector);
