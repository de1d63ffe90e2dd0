#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "Cost.hpp"

TEST(CostTest, DefaultIsUnreachable)
{
    Cost cost;
    EXPECT_FALSE(cost.isReachable());
    EXPECT_EQ(cost, Cost::unreachable());
    EXPECT_EQ(cost.toString(), "INF");
    EXPECT_THROW(cost.value(), std::logic_error);
}

TEST(CostTest, RejectsNegativeAmounts)
{
    EXPECT_THROW(Cost(-1), std::invalid_argument);
    EXPECT_EQ(Cost(0).value(), 0);
}

TEST(CostTest, CombineAddsFiniteCosts)
{
    EXPECT_EQ(combine(Cost(2), Cost(3)), Cost(5));
    EXPECT_EQ(combine(Cost(0), Cost(7)).toString(), "7");
}

TEST(CostTest, CombineWithUnreachableIsUnreachable)
{
    EXPECT_FALSE(combine(Cost::unreachable(), Cost(3)).isReachable());
    EXPECT_FALSE(combine(Cost(3), Cost::unreachable()).isReachable());
    EXPECT_FALSE(combine(Cost::unreachable(), Cost::unreachable()).isReachable());
}

TEST(CostTest, LargeFinitePathStaysReachable)
{
    Cost big(std::numeric_limits<int>::max());
    Cost path = combine(big, Cost(1));

    ASSERT_TRUE(path.isReachable());
    EXPECT_EQ(path.value(), 2147483648LL);
    EXPECT_EQ(path.toString(), "2147483648");
    EXPECT_EQ(combine(path, big), Cost(4294967295LL));
}

TEST(CostTest, CombineSaturatesOnlyPastLongLong)
{
    Cost huge(std::numeric_limits<long long>::max());
    EXPECT_FALSE(combine(huge, Cost(1)).isReachable());
    EXPECT_EQ(combine(huge, Cost(0)), huge);
}

TEST(CostTest, UnreachableOrdersLast)
{
    EXPECT_TRUE(Cost(1000000) < Cost::unreachable());
    EXPECT_FALSE(Cost::unreachable() < Cost(0));
    EXPECT_FALSE(Cost::unreachable() < Cost::unreachable());
    EXPECT_TRUE(Cost(1) < Cost(2));
    EXPECT_EQ(minCost(Cost::unreachable(), Cost(4)), Cost(4));
    EXPECT_EQ(minCost(Cost(4), Cost(3)), Cost(3));
}

TEST(CostTest, EqualityIgnoresAmountOfUnreachable)
{
    EXPECT_EQ(Cost::unreachable(), Cost());
    EXPECT_NE(Cost(0), Cost::unreachable());
    EXPECT_NE(Cost(1), Cost(2));
}
