#pragma once
#include <string>
#include "ReviewRecord.hpp"

// A term/definition pair plus its scheduling state.
class Card {
public:
    Card() = default;
    Card(const std::string& term, const std::string& definition, int today);

    std::string id;          // Auto-generated, unique within the collection
    std::string term;
    std::string definition;

    ReviewRecord review;

    bool isDue(int today) const { return review.isDue(today); }

    // 128 random bits, hex encoded
    static std::string generateID();
};
