#pragma once
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "DeckStore.hpp"
#include "Scheduler.hpp"
#include "SimulatedClock.hpp"

enum class SessionState {
    IDLE,
    ACTIVE,
    COMPLETE
};

/*
  One learning session over a set of due cards.

  Cards are presented from the primary queue first, then from the recycle
  queue. A rating below the pass threshold sends the card to the back of the
  recycle queue and keeps its freshly computed record in memory; a passing
  rating masters the card and commits that record to the DeckStore. So each
  card commits at most one record per session, from its last rating.

  abort() commits the last computed record of every rated but unmastered
  card. A failed save raises PersistenceFailure after the session state has
  moved on; retryPendingSaves() writes the same records again.

  Not thread-safe: the owner serializes all calls.
*/
class SessionEngine {
public:
    SessionEngine(DeckStore& store, const Scheduler& scheduler, const SimulatedClock& clock);

    void startSession(const std::vector<std::string>& dueCardIds);
    void startDeckSession(const std::string& deckName);

    // Next card to present, empty when the session is not active.
    std::optional<std::string> currentCard() const;

    // Returns the record computed for this rating.
    ReviewRecord rate(const std::string& cardId, int quality);

    void abort();

    // Re-saves records whose commit failed. Returns how many are still pending.
    size_t retryPendingSaves();
    bool hasPendingSaves() const { return !pending_saves.empty(); }

    SessionState state() const { return session_state; }
    bool isActive() const { return session_state == SessionState::ACTIVE; }
    bool isComplete() const { return session_state == SessionState::COMPLETE; }

    // Progress
    const std::string& deckName() const { return deck_name; }
    int roundNumber() const { return round_number; }
    size_t totalCount() const { return total_cards; }
    size_t masteredCount() const { return mastered.size(); }
    size_t remainingCount() const { return total_cards - mastered.size(); }
    size_t presentedCount() const { return presented; }
    std::string phaseMessage() const;

    // Inspection
    const std::deque<std::string>& primaryQueue() const { return primary_queue; }
    const std::deque<std::string>& recycleQueue() const { return recycle_queue; }
    bool isMastered(const std::string& cardId) const { return mastered.count(cardId) != 0; }
    std::optional<ReviewRecord> lastComputed(const std::string& cardId) const;

private:
    DeckStore& store;
    const Scheduler& scheduler;
    const SimulatedClock& clock;

    SessionState session_state = SessionState::IDLE;
    std::string deck_name;

    std::deque<std::string> primary_queue;
    std::deque<std::string> recycle_queue;
    std::unordered_set<std::string> mastered;
    std::unordered_map<std::string, ReviewRecord> computed; // last record per rated card
    std::map<std::string, ReviewRecord> pending_saves;      // commits that failed

    size_t total_cards = 0;
    size_t presented = 0;
    int round_number = 0;
    size_t lap_size = 0;      // cards in the current review round
    size_t lap_remaining = 0; // of those, not yet rated

    void ensureCanStart() const;
    void resetQueues();
    void enqueue(const std::vector<std::string>& dueCardIds);
    bool tryCommit(const std::string& cardId, const ReviewRecord& record);
    void advanceRound();
};
