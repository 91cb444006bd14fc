#include "Deck.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

Deck::Deck(const std::string& n)
    : name(n)
{
}

Card& Deck::addCard(const std::string& term, const std::string& definition, int today) {
    auto it = std::find_if(cards.begin(), cards.end(),
        [&term](const Card& c) { return c.term == term; });
    if (it != cards.end()) {
        spdlog::warn("Deck '{}' already has term '{}'; keeping existing card {}", name, term, it->id);
        return *it;
    }

    cards.emplace_back(term, definition, today);
    spdlog::debug("Deck '{}' now holds {} cards", name, cards.size());
    return cards.back();
}

bool Deck::removeCard(const std::string& cardId) {
    auto it = std::find_if(cards.begin(), cards.end(),
        [&cardId](const Card& c) { return c.id == cardId; });
    if (it == cards.end()) return false;

    spdlog::info("Deck '{}' removeCard '{}' ({})", name, it->term, cardId);
    cards.erase(it);
    return true;
}

Card* Deck::findCard(const std::string& cardId) {
    for (auto& c : cards)
        if (c.id == cardId) return &c;
    return nullptr;
}

const Card* Deck::findCard(const std::string& cardId) const {
    for (const auto& c : cards)
        if (c.id == cardId) return &c;
    return nullptr;
}

const Card* Deck::findByTerm(const std::string& term) const {
    for (const auto& c : cards)
        if (c.term == term) return &c;
    return nullptr;
}

std::vector<const Card*> Deck::dueCards(int today) const {
    std::vector<const Card*> due;
    for (const auto& c : cards) {
        if (c.isDue(today)) due.push_back(&c);
    }

    std::stable_sort(due.begin(), due.end(),
        [](const Card* a, const Card* b) {
            return a->review.next_review_day < b->review.next_review_day;
        });

    return due;
}
