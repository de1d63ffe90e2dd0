// Cost.hpp
#pragma once
#include <string>
#include <iostream>

// Link or path cost. A default constructed Cost is unreachable.
class Cost
{
public:
    Cost() : reachable(false), amount(0) {}
    explicit Cost(long long amount);

    static Cost unreachable() { return Cost(); }

    bool isReachable() const { return reachable; }
    long long value() const;
    std::string toString() const;

    bool operator==(const Cost &other) const;
    bool operator!=(const Cost &other) const { return !(*this == other); }
    // Unreachable orders after every finite cost
    bool operator<(const Cost &other) const;

private:
    bool reachable;
    long long amount;
};

// Path cost through a hop: unreachable if either side is, or if the sum overflows long long
Cost combine(const Cost &a, const Cost &b);

Cost minCost(const Cost &a, const Cost &b);

std::ostream &operator<<(std::ostream &os, const Cost &cost);
