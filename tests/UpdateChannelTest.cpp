#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "NodeAgent.hpp"
#include "UpdateChannel.hpp"

using json = nlohmann::json;

namespace
{
    DistanceTable sampleTable()
    {
        DistanceTable table("X", {"X", "Y", "Z"});
        table.set("Y", "Y", Cost(4));
        table.set("Z", "Y", Cost(5));
        table.set("Z", "Z", Cost(50));
        return table;
    }

    std::vector<std::string> manyNodes(int count)
    {
        std::vector<std::string> nodes;
        for (int i = 0; i < count; ++i)
        {
            nodes.push_back("router" + std::to_string(i));
        }
        return nodes;
    }
}

TEST(UpdateChannelTest, FrameCarriesVectorWithNullForUnreachable)
{
    UpdateChannel channel;
    json frame = channel.encode(UpdateMessage("X", 3, sampleTable()));

    EXPECT_EQ(frame["type"], "DV_UPDATE");
    EXPECT_EQ(frame["source"], "X");
    EXPECT_EQ(frame["round"], 3);
    EXPECT_EQ(frame["vector"]["Z"]["Z"], 50);
    EXPECT_TRUE(frame["vector"]["Y"]["Z"].is_null());
    EXPECT_EQ(frame["digest"].get<std::string>().size(), 64u);
}

TEST(UpdateChannelTest, DecodeRestoresMessage)
{
    UpdateChannel channel;
    UpdateMessage decoded = channel.decode(channel.encode(UpdateMessage("X", 7, sampleTable())));

    EXPECT_EQ(decoded.getSource(), "X");
    EXPECT_EQ(decoded.getRound(), 7);
    EXPECT_EQ(decoded.getVector(), sampleTable());
}

TEST(UpdateChannelTest, TamperedFrameFailsDigest)
{
    UpdateChannel channel;
    json frame = channel.encode(UpdateMessage("X", 1, sampleTable()));
    frame["vector"]["Z"]["Y"] = 1;

    EXPECT_THROW(channel.decode(frame), FrameError);
}

TEST(UpdateChannelTest, MalformedFramesAreRejected)
{
    UpdateChannel channel;
    EXPECT_THROW(channel.decode(json::array()), FrameError);
    EXPECT_THROW(channel.decode(json{{"type", "HELLO"}}), FrameError);

    json frame = channel.encode(UpdateMessage("X", 1, sampleTable()));
    frame.erase("digest");
    EXPECT_THROW(channel.decode(frame), FrameError);
}

TEST(UpdateChannelTest, VectorMustKeepTableShape)
{
    json vector = {{"Y", {{"Y", 1}, {"Z", nullptr}}}, {"Z", {{"Y", 2}}}};
    EXPECT_THROW(distanceTableFromJson("X", vector), FrameError);

    json negative = {{"Y", {{"Y", -4}}}};
    EXPECT_THROW(distanceTableFromJson("X", negative), FrameError);

    json tooLarge = {{"Y", {{"Y", 18446744073709551615ULL}}}};
    EXPECT_THROW(distanceTableFromJson("X", tooLarge), FrameError);

    json ownRow = {{"X", {{"X", 0}}}};
    EXPECT_THROW(distanceTableFromJson("X", ownRow), FrameError);
}

TEST(UpdateChannelTest, LargeFramesAreCompressed)
{
    auto nodes = manyNodes(20);
    DistanceTable table(nodes[0], nodes);
    table.set(nodes[1], nodes[1], Cost(12));

    UpdateChannel channel(100);
    json frame = channel.encode(UpdateMessage(nodes[0], 2, table));

    EXPECT_EQ(frame["type"], "DV_UPDATE_COMPRESSED");
    EXPECT_EQ(channel.getTrafficStats().compressedFrames, 1u);

    UpdateMessage decoded = channel.decode(frame);
    EXPECT_EQ(decoded.getVector(), table);
    EXPECT_EQ(decoded.getVector().at(nodes[1], nodes[1]), Cost(12));
}

TEST(UpdateChannelTest, SmallFramesStayPlain)
{
    UpdateChannel channel(100000);
    json frame = channel.encode(UpdateMessage("X", 1, sampleTable()));

    EXPECT_EQ(frame["type"], "DV_UPDATE");
    EXPECT_EQ(channel.getTrafficStats().compressedFrames, 0u);
}

TEST(UpdateChannelTest, CompressionRoundTrip)
{
    UpdateChannel channel;
    std::string data(2000, 'a');
    std::string compressed = channel.compressData(data);

    EXPECT_LT(compressed.size(), data.size());
    EXPECT_EQ(channel.decompressData(compressed, data.size()), data);
    EXPECT_THROW(channel.decompressData("zz", 10), FrameError);
}

TEST(UpdateChannelTest, SendDeliversIndependentCopy)
{
    UpdateChannel channel;
    NodeAgent peer("Y");
    peer.setupTable({"X", "Y", "Z"});

    DistanceTable table = sampleTable();
    EXPECT_TRUE(channel.send(UpdateMessage("X", 1, table), peer));
    EXPECT_EQ(peer.pendingMessages(), 1u);

    const auto &stats = channel.getTrafficStats();
    EXPECT_EQ(stats.framesSent, 1u);
    EXPECT_GT(stats.totalBytesSent, 0u);
    EXPECT_EQ(stats.droppedFrames, 0u);

    channel.resetStats();
    EXPECT_EQ(channel.getTrafficStats().framesSent, 0u);
}
