// UpdateMessage.hpp
#pragma once
#include <string>
#include "DistanceTable.hpp"

// Snapshot of a sender's distance table, owned by value.
class UpdateMessage
{
public:
    UpdateMessage(const std::string &source, int round, const DistanceTable &vector)
        : source(source), round(round), vector(vector) {}

    const std::string &getSource() const { return source; }
    int getRound() const { return round; }
    const DistanceTable &getVector() const { return vector; }

private:
    std::string source;
    int round;
    DistanceTable vector;
};
