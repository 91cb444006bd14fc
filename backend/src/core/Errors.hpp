#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Quality rating outside [0,5]. Raised before any state is touched.
class InvalidRating : public std::runtime_error {
public:
    explicit InvalidRating(int quality)
        : std::runtime_error("invalid quality rating " + std::to_string(quality) + " (expected 0..5)"),
        quality(quality) {}

    int quality;
};

// Session call made in the wrong state, or for a card that is not queued.
class InvalidSessionOperation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A DeckStore write failed. The session keeps the computed record so the
// save can be retried without rescheduling.
class PersistenceFailure : public std::runtime_error {
public:
    PersistenceFailure(const std::string& what, std::string cardId)
        : std::runtime_error(what), card_id(std::move(cardId)) {}

    std::string card_id;
};
