#pragma once
#include <string>
#include <vector>
#include "Card.hpp"

class Deck {
public:
    Deck() = default;
    explicit Deck(const std::string& name);

    std::string name;
    std::vector<Card> cards;

    // Adds a fresh card due on `today`. A term already present in the deck
    // is not duplicated; the existing card is returned instead.
    Card& addCard(const std::string& term, const std::string& definition, int today);
    bool removeCard(const std::string& cardId); // returns true if removed

    Card* findCard(const std::string& cardId);
    const Card* findCard(const std::string& cardId) const;
    const Card* findByTerm(const std::string& term) const;

    // Cards with next_review_day <= today, oldest due first, ties in deck order.
    std::vector<const Card*> dueCards(int today) const;
};
