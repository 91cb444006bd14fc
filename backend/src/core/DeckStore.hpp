#pragma once
#include <optional>
#include <string>
#include <vector>
#include "ReviewRecord.hpp"

// What the session engine needs from persistence.
class DeckStore {
public:
    virtual ~DeckStore() = default;

    // Ids of the deck's cards with next_review_day <= today, oldest due first.
    virtual std::vector<std::string> dueCards(const std::string& deckName, int today) const = 0;

    // Idempotent upsert. Returns false if the record could not be written.
    virtual bool saveReviewRecord(const std::string& cardId, const ReviewRecord& record) = 0;

    virtual std::optional<ReviewRecord> reviewRecord(const std::string& cardId) const = 0;
};
