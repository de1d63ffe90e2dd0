// Cost.cpp
#include "Cost.hpp"
#include <limits>
#include <stdexcept>

Cost::Cost(long long amount) : reachable(true), amount(amount)
{
    if (amount < 0)
    {
        throw std::invalid_argument("Cost must be non-negative: " + std::to_string(amount));
    }
}

long long Cost::value() const
{
    if (!reachable)
    {
        throw std::logic_error("Unreachable cost has no value");
    }
    return amount;
}

std::string Cost::toString() const
{
    return reachable ? std::to_string(amount) : "INF";
}

bool Cost::operator==(const Cost &other) const
{
    if (reachable != other.reachable)
        return false;
    return !reachable || amount == other.amount;
}

bool Cost::operator<(const Cost &other) const
{
    if (!reachable)
        return false;
    if (!other.reachable)
        return true;
    return amount < other.amount;
}

Cost combine(const Cost &a, const Cost &b)
{
    if (!a.isReachable() || !b.isReachable())
        return Cost::unreachable();

    if (a.value() > std::numeric_limits<long long>::max() - b.value())
        return Cost::unreachable();

    return Cost(a.value() + b.value());
}

Cost minCost(const Cost &a, const Cost &b)
{
    return b < a ? b : a;
}

std::ostream &operator<<(std::ostream &os, const Cost &cost)
{
    return os << cost.toString();
}
