#include <gtest/gtest.h>

#include <set>
#include <string>

#include "core/Collection.hpp"

class CollectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(collection.createDeck("Polish"));
    }

    Collection collection;
};

TEST_F(CollectionTest, DeckNamesMustBeUniqueAndNonEmpty) {
    EXPECT_FALSE(collection.createDeck("Polish"));
    EXPECT_FALSE(collection.createDeck(""));
    EXPECT_TRUE(collection.createDeck("German"));
    EXPECT_EQ(collection.deckNames(), (std::vector<std::string>{"Polish", "German"}));
}

TEST_F(CollectionTest, NewCardsCarryFreshRecordDueToday) {
    Card* card = collection.addCard("Polish", "cześć", "hello", 4);
    ASSERT_NE(card, nullptr);

    EXPECT_FALSE(card->id.empty());
    EXPECT_EQ(card->review, ReviewRecord::fresh(4));
    EXPECT_DOUBLE_EQ(card->review.easiness_factor, 2.5);
    EXPECT_EQ(card->review.interval_days, 0);
    EXPECT_EQ(card->review.repetitions, 0);
    EXPECT_TRUE(card->isDue(4));
}

TEST_F(CollectionTest, AddCardRejectsMissingDeckOrFields) {
    EXPECT_EQ(collection.addCard("Nope", "a", "b", 0), nullptr);
    EXPECT_EQ(collection.addCard("Polish", "", "b", 0), nullptr);
    EXPECT_EQ(collection.addCard("Polish", "a", "", 0), nullptr);
    EXPECT_EQ(collection.cardCount(), 0u);
}

TEST_F(CollectionTest, DuplicateTermReturnsExistingCard) {
    Card* first = collection.addCard("Polish", "proszę", "please", 0);
    ASSERT_NE(first, nullptr);
    const std::string id = first->id;

    Card* second = collection.addCard("Polish", "proszę", "you're welcome", 0);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->id, id);
    EXPECT_EQ(second->definition, "please");
    EXPECT_EQ(collection.cardCount(), 1u);
}

TEST_F(CollectionTest, CardIdsAreUnique) {
    std::string a = collection.addCard("Polish", "a", "1", 0)->id;
    std::string b = collection.addCard("Polish", "b", "2", 0)->id;
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 32u);
}

TEST_F(CollectionTest, DueCardsOrderedByDueDayThenDeckOrder) {
    std::string a = collection.addCard("Polish", "a", "1", 0)->id;
    std::string b = collection.addCard("Polish", "b", "2", 0)->id;
    std::string c = collection.addCard("Polish", "c", "3", 0)->id;
    std::string d = collection.addCard("Polish", "d", "4", 0)->id;

    ReviewRecord later = ReviewRecord::fresh(3);
    ReviewRecord earlier = ReviewRecord::fresh(1);
    ReviewRecord future = ReviewRecord::fresh(9);
    ASSERT_TRUE(collection.saveReviewRecord(a, later));
    ASSERT_TRUE(collection.saveReviewRecord(b, earlier));
    ASSERT_TRUE(collection.saveReviewRecord(d, future));

    EXPECT_EQ(collection.dueCards("Polish", 3), (std::vector<std::string>{c, b, a}));
    EXPECT_EQ(collection.dueCards("Polish", 0), (std::vector<std::string>{c}));
    EXPECT_TRUE(collection.dueCards("Missing", 3).empty());
}

TEST_F(CollectionTest, SaveReviewRecordIsIdempotentUpsert) {
    std::string id = collection.addCard("Polish", "a", "1", 0)->id;

    ReviewRecord r;
    r.easiness_factor = 2.36;
    r.interval_days = 6;
    r.repetitions = 2;
    r.next_review_day = 8;

    EXPECT_TRUE(collection.saveReviewRecord(id, r));
    EXPECT_TRUE(collection.saveReviewRecord(id, r));
    EXPECT_EQ(collection.reviewRecord(id), std::optional<ReviewRecord>(r));

    EXPECT_FALSE(collection.saveReviewRecord("missing", r));
    EXPECT_FALSE(collection.reviewRecord("missing").has_value());
}

TEST_F(CollectionTest, RemovingCardsAndDecks) {
    std::string id = collection.addCard("Polish", "a", "1", 0)->id;

    EXPECT_TRUE(collection.removeCard(id));
    EXPECT_FALSE(collection.removeCard(id));
    EXPECT_EQ(collection.findCard(id), nullptr);

    EXPECT_TRUE(collection.removeDeck("Polish"));
    EXPECT_FALSE(collection.removeDeck("Polish"));
    EXPECT_TRUE(collection.decks.empty());
}

TEST_F(CollectionTest, AddDeckRejectsDuplicateNameAndRemintsClashingIds) {
    std::string id = collection.addCard("Polish", "a", "1", 0)->id;

    Deck same("Polish");
    EXPECT_FALSE(collection.addDeck(same));

    Deck other("German");
    Card clash;
    clash.id = id;
    clash.term = "hallo";
    clash.definition = "hello";
    other.cards.push_back(clash);

    ASSERT_TRUE(collection.addDeck(other));
    const Deck* german = collection.findDeck("German");
    ASSERT_NE(german, nullptr);
    EXPECT_NE(german->cards[0].id, id);
    EXPECT_EQ(collection.findCard(id)->term, "a");
}

TEST_F(CollectionTest, AddDeckRemintsIdsRepeatedWithinTheDeck) {
    Deck incoming("German");
    for (const char* term : {"eins", "zwei", "drei"}) {
        Card card;
        card.id = "dup";
        card.term = term;
        card.definition = term;
        incoming.cards.push_back(card);
    }

    ASSERT_TRUE(collection.addDeck(incoming));
    const Deck* german = collection.findDeck("German");
    ASSERT_NE(german, nullptr);

    std::set<std::string> ids;
    for (const auto& c : german->cards) ids.insert(c.id);
    EXPECT_EQ(ids.size(), 3u);
    for (const auto& c : german->cards) EXPECT_EQ(collection.findCard(c.id)->term, c.term);
}
