#include <gtest/gtest.h>
#include "RoutingTable.hpp"

TEST(RoutingTableTest, PicksMinimumPerDestination)
{
    DistanceTable distances("X", {"X", "Y", "Z"});
    distances.set("Y", "Y", Cost(4));
    distances.set("Y", "Z", Cost(51));
    distances.set("Z", "Y", Cost(5));
    distances.set("Z", "Z", Cost(50));

    RoutingTable rt = RoutingTable::fromDistanceTable(distances);

    ASSERT_EQ(rt.table.size(), 2u);
    EXPECT_EQ(rt.lookup("Y").cost, Cost(4));
    EXPECT_EQ(rt.lookup("Y").nextHop, "Y");
    EXPECT_EQ(rt.lookup("Z").cost, Cost(5));
    EXPECT_EQ(rt.lookup("Z").nextHop, "Y");
}

TEST(RoutingTableTest, TieGoesToSmallestVia)
{
    DistanceTable distances("D", {"D", "C", "A", "B"});
    distances.set("B", "C", Cost(2));
    distances.set("B", "A", Cost(2));

    RoutingTable rt = RoutingTable::fromDistanceTable(distances);
    EXPECT_EQ(rt.lookup("B").nextHop, "A");
}

TEST(RoutingTableTest, UnreachableDestinationHasNoNextHop)
{
    DistanceTable distances("Z", {"X", "Y", "Z"});
    RoutingTable rt = RoutingTable::fromDistanceTable(distances);

    Route route = rt.lookup("X");
    EXPECT_FALSE(route.cost.isReachable());
    EXPECT_FALSE(route.hasNextHop());
    EXPECT_FALSE(rt.lookup("missing").hasNextHop());
}

TEST(RoutingTableTest, CostMatchesRowMinimum)
{
    DistanceTable distances("A", {"A", "B", "C", "D"});
    distances.set("B", "B", Cost(7));
    distances.set("B", "C", Cost(3));
    distances.set("C", "C", Cost(1));
    distances.set("D", "B", Cost(9));
    distances.set("D", "D", Cost(9));

    RoutingTable rt = RoutingTable::fromDistanceTable(distances);
    for (const auto &destination : distances.destinations())
    {
        EXPECT_EQ(rt.lookup(destination).cost, distances.bestCost(destination)) << destination;
        EXPECT_EQ(rt.lookup(destination).nextHop, distances.bestVia(destination)) << destination;
    }
    EXPECT_EQ(rt.lookup("D").nextHop, "B");
}
