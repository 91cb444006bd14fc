#include "Collection.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

bool Collection::createDeck(const std::string& name) {
    if (name.empty()) {
        spdlog::warn("createDeck: empty deck name");
        return false;
    }
    if (findDeck(name)) {
        spdlog::warn("createDeck: deck '{}' already exists", name);
        return false;
    }

    decks.emplace_back(name);
    spdlog::info("Deck '{}' created", name);
    return true;
}

bool Collection::removeDeck(const std::string& name) {
    auto it = std::find_if(decks.begin(), decks.end(),
        [&name](const Deck& d) { return d.name == name; });
    if (it == decks.end()) return false;

    spdlog::info("Deck '{}' removed with {} cards", name, it->cards.size());
    decks.erase(it);
    return true;
}

bool Collection::addDeck(Deck deck) {
    if (deck.name.empty()) {
        spdlog::warn("addDeck: empty deck name");
        return false;
    }
    if (findDeck(deck.name)) {
        spdlog::warn("addDeck: deck '{}' already exists", deck.name);
        return false;
    }

    // Ids must be unique across the collection and within the new deck
    std::set<std::string> seen;
    for (auto& c : deck.cards) {
        while (c.id.empty() || findCard(c.id) || seen.count(c.id)) {
            c.id = Card::generateID();
        }
        seen.insert(c.id);
    }

    spdlog::info("Deck '{}' added with {} cards", deck.name, deck.cards.size());
    decks.push_back(std::move(deck));
    return true;
}

Deck* Collection::findDeck(const std::string& name) {
    for (auto& d : decks)
        if (d.name == name) return &d;
    return nullptr;
}

const Deck* Collection::findDeck(const std::string& name) const {
    for (const auto& d : decks)
        if (d.name == name) return &d;
    return nullptr;
}

std::vector<std::string> Collection::deckNames() const {
    std::vector<std::string> names;
    names.reserve(decks.size());
    for (const auto& d : decks) names.push_back(d.name);
    return names;
}

Card* Collection::addCard(const std::string& deckName, const std::string& term, const std::string& definition, int today) {
    Deck* deck = findDeck(deckName);
    if (!deck) {
        spdlog::warn("addCard: deck '{}' not found", deckName);
        return nullptr;
    }
    if (term.empty() || definition.empty()) {
        spdlog::warn("addCard: term and definition are required");
        return nullptr;
    }

    return &deck->addCard(term, definition, today);
}

bool Collection::removeCard(const std::string& cardId) {
    for (auto& d : decks) {
        if (d.removeCard(cardId)) return true;
    }
    spdlog::warn("removeCard: card '{}' not found", cardId);
    return false;
}

Card* Collection::findCard(const std::string& cardId) {
    for (auto& d : decks) {
        if (Card* c = d.findCard(cardId)) return c;
    }
    return nullptr;
}

const Card* Collection::findCard(const std::string& cardId) const {
    for (const auto& d : decks) {
        if (const Card* c = d.findCard(cardId)) return c;
    }
    return nullptr;
}

size_t Collection::cardCount() const {
    size_t n = 0;
    for (const auto& d : decks) n += d.cards.size();
    return n;
}

std::vector<std::string> Collection::dueCards(const std::string& deckName, int today) const {
    std::vector<std::string> ids;

    const Deck* deck = findDeck(deckName);
    if (!deck) {
        spdlog::warn("dueCards: deck '{}' not found", deckName);
        return ids;
    }

    for (const Card* c : deck->dueCards(today)) ids.push_back(c->id);

    spdlog::debug("Deck '{}' has {} due cards on day {}", deckName, ids.size(), today);
    return ids;
}

bool Collection::saveReviewRecord(const std::string& cardId, const ReviewRecord& record) {
    Card* card = findCard(cardId);
    if (!card) {
        spdlog::error("saveReviewRecord: card '{}' not found", cardId);
        return false;
    }

    card->review = record;
    spdlog::debug("Card '{}' record saved: ef={:.3f} interval={} reps={} next_day={}",
        card->term, record.easiness_factor, record.interval_days, record.repetitions, record.next_review_day);
    return true;
}

std::optional<ReviewRecord> Collection::reviewRecord(const std::string& cardId) const {
    const Card* card = findCard(cardId);
    if (!card) return std::nullopt;
    return card->review;
}
