#include <gtest/gtest.h>
#include <stdexcept>
#include "DistanceTable.hpp"

TEST(DistanceTableTest, ShapeExcludesOwner)
{
    DistanceTable table("X", {"X", "Y", "Z"});

    EXPECT_EQ(table.getOwner(), "X");
    EXPECT_EQ(table.destinations(), (std::vector<std::string>{"Y", "Z"}));
    ASSERT_EQ(table.size(), 2u);
    for (const auto &[destination, row] : table.getRows())
    {
        ASSERT_EQ(row.size(), 2u) << destination;
        EXPECT_TRUE(row.count("Y"));
        EXPECT_TRUE(row.count("Z"));
        for (const auto &[via, cost] : row)
        {
            EXPECT_FALSE(cost.isReachable()) << destination << " via " << via;
        }
    }
}

TEST(DistanceTableTest, DestinationsKeepDeclarationOrder)
{
    DistanceTable table("B", {"C", "B", "A", "C"});
    EXPECT_EQ(table.destinations(), (std::vector<std::string>{"C", "A"}));
}

TEST(DistanceTableTest, SetOutsideShapeThrows)
{
    DistanceTable table("X", {"X", "Y", "Z"});

    EXPECT_THROW(table.set("X", "Y", Cost(1)), std::out_of_range);
    EXPECT_THROW(table.set("Y", "X", Cost(1)), std::out_of_range);
    EXPECT_THROW(table.set("W", "Y", Cost(1)), std::out_of_range);
    EXPECT_THROW(table.at("Y", "W"), std::out_of_range);
    EXPECT_EQ(table.size(), 2u);
}

TEST(DistanceTableTest, BestCostAndViaBreakTiesBySmallestVia)
{
    DistanceTable table("A", {"A", "B", "C", "D"});
    table.set("D", "C", Cost(5));
    table.set("D", "B", Cost(5));

    EXPECT_EQ(table.bestCost("D"), Cost(5));
    EXPECT_EQ(table.bestVia("D"), "B");

    table.set("D", "C", Cost(4));
    EXPECT_EQ(table.bestVia("D"), "C");
}

TEST(DistanceTableTest, UnreachableRowHasNoVia)
{
    DistanceTable table("A", {"A", "B", "C"});
    EXPECT_FALSE(table.bestCost("B").isReachable());
    EXPECT_EQ(table.bestVia("B"), "");
    EXPECT_FALSE(table.bestCost("unknown").isReachable());
}

TEST(DistanceTableTest, CopiesAreIndependent)
{
    DistanceTable table("A", {"A", "B"});
    DistanceTable snapshot = table;
    table.set("B", "B", Cost(3));

    EXPECT_FALSE(snapshot.at("B", "B").isReachable());
    EXPECT_NE(snapshot, table);

    table.fill(Cost::unreachable());
    EXPECT_EQ(snapshot, table);
}
