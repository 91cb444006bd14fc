#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "storage/DeckJson.hpp"

namespace {

Deck sampleDeck() {
    Deck deck("Test Deck");
    deck.addCard("hello", "cześć", 0);
    Card& reviewed = deck.addCard("goodbye", "do widzenia", 0);
    reviewed.review.easiness_factor = 2.36;
    reviewed.review.interval_days = 16;
    reviewed.review.repetitions = 3;
    reviewed.review.next_review_day = 41;
    Card& awkward = deck.addCard("third", "ef with long fraction", 0);
    awkward.review.easiness_factor = 1.3 + 0.1 / 3.0;
    return deck;
}

void writeFile(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

}  // namespace

TEST(DeckJsonTest, ExportThenImportReproducesSchedulingState) {
    const std::string path = "test_roundtrip.json";
    Deck original = sampleDeck();

    ASSERT_TRUE(DeckJson::exportDeckToPath(original, path));

    Deck imported;
    ASSERT_TRUE(DeckJson::importDeck(path, 99, imported));
    std::remove(path.c_str());

    EXPECT_EQ(imported.name, original.name);
    ASSERT_EQ(imported.cards.size(), original.cards.size());
    for (size_t i = 0; i < original.cards.size(); ++i) {
        EXPECT_EQ(imported.cards[i].term, original.cards[i].term);
        EXPECT_EQ(imported.cards[i].definition, original.cards[i].definition);
        EXPECT_EQ(imported.cards[i].review, original.cards[i].review);
        EXPECT_EQ(imported.cards[i].review.easiness_factor, original.cards[i].review.easiness_factor);
    }
}

TEST(DeckJsonTest, CardWithoutReviewGetsDefaultRecordForToday) {
    const std::string path = "test_import.json";
    writeFile(path, R"({
  "name": "Import Test Deck",
  "flashcards": [
    { "term": "test term", "definition": "test definition" }
  ]
})");

    Deck deck;
    ASSERT_TRUE(DeckJson::importDeck(path, 7, deck));
    std::remove(path.c_str());

    EXPECT_EQ(deck.name, "Import Test Deck");
    ASSERT_EQ(deck.cards.size(), 1u);
    EXPECT_EQ(deck.cards[0].term, "test term");
    EXPECT_EQ(deck.cards[0].review, ReviewRecord::fresh(7));
    EXPECT_FALSE(deck.cards[0].id.empty());
}

TEST(DeckJsonTest, ExportedDocumentHasExpectedShape) {
    nlohmann::json j = DeckJson::deckToJson(sampleDeck());

    EXPECT_EQ(j["name"], "Test Deck");
    ASSERT_EQ(j["flashcards"].size(), 3u);
    const auto& card = j["flashcards"][1];
    EXPECT_EQ(card["term"], "goodbye");
    EXPECT_EQ(card["review"]["interval_days"], 16);
    EXPECT_EQ(card["review"]["repetitions"], 3);
    EXPECT_EQ(card["review"]["next_review_day"], 41);
    EXPECT_FALSE(card.contains("id"));

    EXPECT_TRUE(DeckJson::deckToJson(sampleDeck(), true)["flashcards"][0].contains("id"));
}

TEST(DeckJsonTest, MissingFileFails) {
    Deck deck;
    EXPECT_FALSE(DeckJson::importDeck("nonexistent_file_xyz123.json", 0, deck));
}

TEST(DeckJsonTest, InvalidJsonFails) {
    const std::string path = "test_invalid.json";
    writeFile(path, "{ this is not valid json }");

    Deck deck;
    EXPECT_FALSE(DeckJson::importDeck(path, 0, deck));
    std::remove(path.c_str());
}

TEST(DeckJsonTest, WrongStructureFails) {
    Deck deck;
    EXPECT_FALSE(DeckJson::deckFromJson(nlohmann::json::parse(R"({"flashcards": []})"), 0, deck));
    EXPECT_FALSE(DeckJson::deckFromJson(nlohmann::json::parse(R"({"name": "x"})"), 0, deck));
    EXPECT_FALSE(DeckJson::deckFromJson(nlohmann::json::parse(R"({"name": "", "flashcards": []})"), 0, deck));
    EXPECT_FALSE(DeckJson::deckFromJson(
        nlohmann::json::parse(R"({"name": "x", "flashcards": [{"term": 1, "definition": "d"}]})"), 0, deck));
}

TEST(DeckJsonTest, OutOfRangeReviewDataFails) {
    ReviewRecord r;
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 1.1, "interval_days": 1, "repetitions": 1, "next_review_day": 1})"), r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 2.5, "interval_days": -1, "repetitions": 1, "next_review_day": 1})"), r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 2.5, "interval_days": 1, "next_review_day": 1})"), r));
}

TEST(DeckJsonTest, DuplicateTermsInImportKeepFirst) {
    Deck deck;
    ASSERT_TRUE(DeckJson::deckFromJson(nlohmann::json::parse(R"({"name": "x", "flashcards": [
        {"term": "a", "definition": "first"},
        {"term": "a", "definition": "second"}]})"), 0, deck));
    ASSERT_EQ(deck.cards.size(), 1u);
    EXPECT_EQ(deck.cards[0].definition, "first");
}

TEST(DeckJsonTest, CollectionDocumentKeepsIdsAndDay) {
    Collection collection;
    collection.addDeck(sampleDeck());
    const std::string id = collection.decks[0].cards[1].id;

    Collection loaded;
    int day = -1;
    ASSERT_TRUE(DeckJson::collectionFromJson(DeckJson::collectionToJson(collection, 12), loaded, day));

    EXPECT_EQ(day, 12);
    ASSERT_NE(loaded.findCard(id), nullptr);
    EXPECT_EQ(loaded.findCard(id)->review, collection.findCard(id)->review);
}

TEST(DeckJsonTest, InconsistentOrOversizedReviewDataFails) {
    ReviewRecord r;
    // repetitions without an interval
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 2.5, "interval_days": 0, "repetitions": 1, "next_review_day": 1})"), r));
    // does not fit in an int
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 2.5, "interval_days": 4294967297, "repetitions": 1, "next_review_day": 1})"), r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json::parse(
        R"({"easiness_factor": 2.5, "interval_days": 1, "repetitions": -4294967295, "next_review_day": 1})"), r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json{
        {"easiness_factor", 2.5}, {"interval_days", ReviewRecord::MAX_INTERVAL_DAYS + 1},
        {"repetitions", 3}, {"next_review_day", 1}}, r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json{
        {"easiness_factor", 2.5}, {"interval_days", 6},
        {"repetitions", 2}, {"next_review_day", static_cast<long long>(ReviewRecord::MAX_DAY) + 1}}, r));
    EXPECT_FALSE(DeckJson::reviewFromJson(nlohmann::json{
        {"easiness_factor", 2.5}, {"interval_days", 6},
        {"repetitions", 2}, {"next_review_day", -1}}, r));

    ReviewRecord ok;
    ASSERT_TRUE(DeckJson::reviewFromJson(nlohmann::json{
        {"easiness_factor", 2.5}, {"interval_days", ReviewRecord::MAX_INTERVAL_DAYS},
        {"repetitions", 9}, {"next_review_day", ReviewRecord::MAX_DAY}}, ok));
    EXPECT_EQ(ok.interval_days, ReviewRecord::MAX_INTERVAL_DAYS);
    EXPECT_EQ(ok.next_review_day, ReviewRecord::MAX_DAY);
}

TEST(DeckJsonTest, ImportedCardsGetFreshDistinctIds) {
    const std::string path = "test_dup_ids.json";
    writeFile(path, R"({"name": "Dup", "flashcards": [
        {"id": "same", "term": "a", "definition": "1"},
        {"id": "same", "term": "b", "definition": "2"}]})");

    Deck deck;
    ASSERT_TRUE(DeckJson::importDeck(path, 0, deck));
    std::remove(path.c_str());

    ASSERT_EQ(deck.cards.size(), 2u);
    EXPECT_NE(deck.cards[0].id, "same");
    EXPECT_NE(deck.cards[1].id, "same");
    EXPECT_NE(deck.cards[0].id, deck.cards[1].id);

    Collection collection;
    ASSERT_TRUE(collection.addDeck(deck));
    EXPECT_EQ(collection.findCard(deck.cards[0].id)->term, "a");
    EXPECT_EQ(collection.findCard(deck.cards[1].id)->term, "b");
}
