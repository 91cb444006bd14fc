#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Deck.hpp"
#include "DeckStore.hpp"

// All decks of one learner, held in memory. Storage persists it as a whole.
class Collection : public DeckStore {
public:
    std::vector<Deck> decks;

    // Deck management
    bool createDeck(const std::string& name);     // false on empty or duplicate name
    bool removeDeck(const std::string& name);
    bool addDeck(Deck deck);                       // imported deck; false on duplicate name
    Deck* findDeck(const std::string& name);
    const Deck* findDeck(const std::string& name) const;
    std::vector<std::string> deckNames() const;

    // Card management. addCard returns nullptr if the deck is missing or a field is empty.
    Card* addCard(const std::string& deckName, const std::string& term, const std::string& definition, int today);
    bool removeCard(const std::string& cardId);
    Card* findCard(const std::string& cardId);
    const Card* findCard(const std::string& cardId) const;
    size_t cardCount() const;

    // DeckStore
    std::vector<std::string> dueCards(const std::string& deckName, int today) const override;
    bool saveReviewRecord(const std::string& cardId, const ReviewRecord& record) override;
    std::optional<ReviewRecord> reviewRecord(const std::string& cardId) const override;
};
