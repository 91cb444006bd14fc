#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../core/Collection.hpp"

// JSON form of decks, used for deck import/export and as the plaintext
// payload of the sealed collection file.
//
// Deck document:
//   { "name": "...", "flashcards": [
//       { "term": "...", "definition": "...",
//         "review": { "easiness_factor": 2.5, "interval_days": 0,
//                     "repetitions": 0, "next_review_day": 0 } } ] }
//
// "review" may be missing on import; the card then gets a fresh record due
// on the current day. Card ids are written only for the collection file.
namespace DeckJson {

nlohmann::json reviewToJson(const ReviewRecord& record);
bool reviewFromJson(const nlohmann::json& j, ReviewRecord& out);

nlohmann::json deckToJson(const Deck& deck, bool withIds = false);
// Ids in the document are kept only with keepIds (the collection file);
// imported decks always get fresh ones.
bool deckFromJson(const nlohmann::json& j, int today, Deck& out, bool keepIds = false);

nlohmann::json collectionToJson(const Collection& collection, int currentDay);
bool collectionFromJson(const nlohmann::json& j, Collection& out, int& currentDay);

// Files
bool exportDeckToPath(const Deck& deck, const std::string& path);
bool importDeck(const std::string& path, int today, Deck& out);

}
