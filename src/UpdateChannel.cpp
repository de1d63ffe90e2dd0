#include "UpdateChannel.hpp"
#include "NodeAgent.hpp"
#include "utils.hpp"
#include <limits>
#include <vector>
#include <zlib.h>

using json = nlohmann::json;

namespace
{
    std::string frameType(const json &frame)
    {
        auto it = frame.find("type");
        if (it == frame.end() || !it->is_string())
            return "";
        return it->get<std::string>();
    }
}

json costToJson(const Cost &cost)
{
    if (!cost.isReachable())
        return nullptr;
    return cost.value();
}

Cost costFromJson(const json &value)
{
    if (value.is_null())
        return Cost::unreachable();
    if (!value.is_number_integer() ||
        (value.is_number_unsigned() && value.get<unsigned long long>() > std::numeric_limits<long long>::max()) ||
        value.get<long long>() < 0)
    {
        throw FrameError("Invalid cost in frame: " + value.dump());
    }
    return Cost(value.get<long long>());
}

json distanceTableToJson(const DistanceTable &table)
{
    json vector = json::object();
    for (const auto &[destination, row] : table.getRows())
    {
        json costs = json::object();
        for (const auto &[via, cost] : row)
        {
            costs[via] = costToJson(cost);
        }
        vector[destination] = costs;
    }
    return vector;
}

DistanceTable distanceTableFromJson(const std::string &owner, const json &vector)
{
    if (!vector.is_object())
    {
        throw FrameError("Distance vector of " + owner + " is not an object");
    }

    std::vector<std::string> nodes{owner};
    for (const auto &[destination, _] : vector.items())
    {
        if (destination == owner)
        {
            throw FrameError("Distance vector of " + owner + " lists its owner as destination");
        }
        nodes.push_back(destination);
    }

    DistanceTable table(owner, nodes);
    for (const auto &[destination, row] : vector.items())
    {
        if (!row.is_object() || row.size() != table.size())
        {
            throw FrameError("Malformed row " + destination + " in distance vector of " + owner);
        }
        for (const auto &[via, cost] : row.items())
        {
            if (!table.hasDestination(via))
            {
                throw FrameError("Unknown via " + via + " in distance vector of " + owner);
            }
            table.set(destination, via, costFromJson(cost));
        }
    }
    return table;
}

json UpdateChannel::encode(const UpdateMessage &message)
{
    json frame = {
        {"type", "DV_UPDATE"},
        {"source", message.getSource()},
        {"round", message.getRound()},
        {"vector", distanceTableToJson(message.getVector())}};

    frame["digest"] = toHex(computeDigest(frame.dump()));

    std::string frameStr = frame.dump();
    if (frameStr.size() > compressThreshold)
    {
        std::string compressed = compressData(frameStr);
        // hex doubles the stream, keep it only when it still saves space
        if (compressed.size() < frameStr.size())
        {
            stats.compressedFrames++;
            return json{
                {"type", "DV_UPDATE_COMPRESSED"},
                {"source", message.getSource()},
                {"size", frameStr.size()},
                {"payload", compressed}};
        }
    }
    return frame;
}

UpdateMessage UpdateChannel::decode(const json &received) const
{
    if (!received.is_object())
    {
        throw FrameError("Frame is not a JSON object");
    }

    json frame = received;
    if (frameType(frame) == "DV_UPDATE_COMPRESSED")
    {
        if (!frame.contains("payload") || !frame["payload"].is_string() ||
            !frame.contains("size") || !frame["size"].is_number_unsigned())
        {
            throw FrameError("Malformed compressed frame");
        }
        std::string inner = decompressData(frame["payload"].get<std::string>(), frame["size"].get<size_t>());
        try
        {
            frame = json::parse(inner);
        }
        catch (const json::parse_error &e)
        {
            throw FrameError(std::string("Compressed frame does not hold JSON: ") + e.what());
        }
        if (!frame.is_object())
        {
            throw FrameError("Compressed frame does not hold a JSON object");
        }
    }

    std::string type = frameType(frame);
    if (type != "DV_UPDATE")
    {
        throw FrameError("Unexpected frame type: " + (type.empty() ? std::string("<none>") : type));
    }
    if (!frame.contains("digest") || !frame["digest"].is_string())
    {
        throw FrameError("No digest found in frame");
    }
    if (!frame.contains("source") || !frame["source"].is_string() ||
        !frame.contains("round") || !frame["round"].is_number_integer() ||
        !frame.contains("vector"))
    {
        throw FrameError("Frame is missing source, round or vector");
    }

    std::string receivedDigest = frame["digest"];
    frame.erase("digest");
    if (receivedDigest != toHex(computeDigest(frame.dump())))
    {
        throw FrameError("Digest verification failed");
    }

    std::string source = frame["source"];
    return UpdateMessage(source, frame["round"].get<int>(), distanceTableFromJson(source, frame["vector"]));
}

bool UpdateChannel::send(const UpdateMessage &message, NodeAgent &peer)
{
    json frame = encode(message);
    std::string wire = frame.dump();
    stats.framesSent++;
    stats.totalBytesSent += wire.size();

    try
    {
        peer.deliver(decode(json::parse(wire)));
    }
    catch (const FrameError &e)
    {
        stats.droppedFrames++;
        logWarning("Frame from " + message.getSource() + " to " + peer.getName() + " dropped: " + e.what());
        return false;
    }
    return true;
}

std::string UpdateChannel::compressData(const std::string &data) const
{
    uLongf compressedSize = compressBound(data.size());
    std::vector<Bytef> compressed(compressedSize);

    int result = compress(compressed.data(), &compressedSize,
                          reinterpret_cast<const Bytef *>(data.data()), data.size());
    if (result != Z_OK)
    {
        throw std::runtime_error("zlib compress failed with code " + std::to_string(result));
    }

    compressed.resize(compressedSize);
    return toHex(std::string(compressed.begin(), compressed.end()));
}

std::string UpdateChannel::decompressData(const std::string &compressedHex, size_t originalSize) const
{
    std::string compressed;
    try
    {
        compressed = fromHex(compressedHex);
    }
    catch (const std::invalid_argument &e)
    {
        throw FrameError(std::string("Compressed payload is not hex: ") + e.what());
    }

    uLongf decompressedSize = originalSize;
    std::vector<Bytef> decompressed(originalSize);
    int result = uncompress(decompressed.data(), &decompressedSize,
                            reinterpret_cast<const Bytef *>(compressed.data()), compressed.size());
    if (result != Z_OK || decompressedSize != originalSize)
    {
        throw FrameError("zlib uncompress failed with code " + std::to_string(result));
    }
    return std::string(decompressed.begin(), decompressed.end());
}
