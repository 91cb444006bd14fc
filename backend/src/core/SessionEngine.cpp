#include "SessionEngine.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

SessionEngine::SessionEngine(DeckStore& s, const Scheduler& sched, const SimulatedClock& c)
    : store(s), scheduler(sched), clock(c)
{
}

void SessionEngine::resetQueues() {
    deck_name.clear();
    primary_queue.clear();
    recycle_queue.clear();
    mastered.clear();
    computed.clear();
    total_cards = 0;
    presented = 0;
    round_number = 0;
    lap_size = 0;
    lap_remaining = 0;
}

void SessionEngine::ensureCanStart() const {
    if (session_state == SessionState::ACTIVE) {
        throw InvalidSessionOperation("a session is already active");
    }
    if (!pending_saves.empty()) {
        spdlog::warn("Session start refused: {} review records still unsaved", pending_saves.size());
        throw InvalidSessionOperation("previous session has unsaved review records; retry saving first");
    }
}

void SessionEngine::startSession(const std::vector<std::string>& dueCardIds) {
    ensureCanStart();
    resetQueues();
    enqueue(dueCardIds);
}

void SessionEngine::enqueue(const std::vector<std::string>& dueCardIds) {
    std::unordered_set<std::string> seen;
    for (const auto& id : dueCardIds) {
        if (seen.insert(id).second) primary_queue.push_back(id);
    }
    total_cards = primary_queue.size();

    if (primary_queue.empty()) {
        session_state = SessionState::COMPLETE;
        spdlog::info("Session for '{}' has no due cards; complete", deck_name);
        return;
    }

    round_number = 1;
    lap_size = total_cards;
    session_state = SessionState::ACTIVE;
    spdlog::info("Session started for '{}' with {} cards on day {}", deck_name, total_cards, clock.today());
}

void SessionEngine::startDeckSession(const std::string& deckName) {
    ensureCanStart();

    std::vector<std::string> due = store.dueCards(deckName, clock.today());
    resetQueues();
    deck_name = deckName;
    enqueue(due);
}

std::optional<std::string> SessionEngine::currentCard() const {
    if (session_state != SessionState::ACTIVE) return std::nullopt;
    if (!primary_queue.empty()) return primary_queue.front();
    if (!recycle_queue.empty()) return recycle_queue.front();
    return std::nullopt;
}

ReviewRecord SessionEngine::rate(const std::string& cardId, int quality) {
    const ReviewQuality grade = Scheduler::qualityFromInt(quality);

    if (session_state != SessionState::ACTIVE) {
        throw InvalidSessionOperation("no active session");
    }

    bool fromRecycle = false;
    auto pos = std::find(primary_queue.begin(), primary_queue.end(), cardId);
    if (pos == primary_queue.end()) {
        pos = std::find(recycle_queue.begin(), recycle_queue.end(), cardId);
        if (pos == recycle_queue.end()) {
            spdlog::warn("rate: card '{}' is not queued in this session", cardId);
            throw InvalidSessionOperation("card " + cardId + " is not queued in this session");
        }
        fromRecycle = true;
    }

    ReviewRecord prior;
    auto last = computed.find(cardId);
    if (last != computed.end()) {
        prior = last->second;
    }
    else if (auto stored = store.reviewRecord(cardId)) {
        prior = *stored;
    }
    else {
        spdlog::warn("rate: no stored record for '{}'; scheduling from defaults", cardId);
        prior = ReviewRecord::fresh(clock.today());
    }

    ReviewRecord next = scheduler.schedule(prior, grade, clock.today());

    // Nothing below can fail before the commit
    if (fromRecycle) {
        size_t index = static_cast<size_t>(pos - recycle_queue.begin());
        if (index < lap_remaining) --lap_remaining;
        recycle_queue.erase(pos);
    }
    else {
        primary_queue.erase(pos);
    }

    computed[cardId] = next;
    ++presented;

    const bool passed = scheduler.isPassing(quality);
    if (passed) {
        mastered.insert(cardId);
    }
    else {
        recycle_queue.push_back(cardId);
    }

    spdlog::info("Rated '{}' q={} ({}); mastered {}/{}", cardId, quality,
        passed ? "mastered" : "recycled", mastered.size(), total_cards);

    advanceRound();

    if (primary_queue.empty() && recycle_queue.empty()) {
        session_state = SessionState::COMPLETE;
        spdlog::info("Session for '{}' complete after {} ratings in {} rounds", deck_name, presented, round_number);
    }

    if (passed && !tryCommit(cardId, next)) {
        throw PersistenceFailure("failed to save review record for card " + cardId, cardId);
    }

    return next;
}

void SessionEngine::advanceRound() {
    if (!primary_queue.empty() || lap_remaining > 0 || recycle_queue.empty()) return;

    ++round_number;
    lap_size = recycle_queue.size();
    lap_remaining = lap_size;
    spdlog::debug("Session round {} begins with {} cards to retry", round_number, lap_size);
}

void SessionEngine::abort() {
    if (session_state != SessionState::ACTIVE) {
        throw InvalidSessionOperation("no active session to abort");
    }

    spdlog::info("Session for '{}' aborted with {} unmastered cards", deck_name, remainingCount());

    // Rated but unmastered cards are exactly the ones waiting for a retry
    std::vector<std::string> failed;
    for (const auto& id : recycle_queue) {
        auto it = computed.find(id);
        if (it != computed.end() && !tryCommit(id, it->second)) failed.push_back(id);
    }

    primary_queue.clear();
    recycle_queue.clear();
    lap_remaining = 0;
    session_state = SessionState::COMPLETE;

    if (!failed.empty()) {
        throw PersistenceFailure(std::to_string(failed.size()) + " review record(s) could not be saved on abort", failed.front());
    }
}

bool SessionEngine::tryCommit(const std::string& cardId, const ReviewRecord& record) {
    if (store.saveReviewRecord(cardId, record)) {
        pending_saves.erase(cardId);
        return true;
    }

    spdlog::error("Saving review record for '{}' failed; kept for retry", cardId);
    pending_saves[cardId] = record;
    return false;
}

size_t SessionEngine::retryPendingSaves() {
    for (auto it = pending_saves.begin(); it != pending_saves.end();) {
        if (store.saveReviewRecord(it->first, it->second)) {
            spdlog::info("Retried save for '{}' succeeded", it->first);
            it = pending_saves.erase(it);
        }
        else {
            spdlog::warn("Retried save for '{}' failed again", it->first);
            ++it;
        }
    }
    return pending_saves.size();
}

std::optional<ReviewRecord> SessionEngine::lastComputed(const std::string& cardId) const {
    auto it = computed.find(cardId);
    if (it == computed.end()) return std::nullopt;
    return it->second;
}

std::string SessionEngine::phaseMessage() const {
    if (round_number <= 1) {
        return "Round 1: " + std::to_string(total_cards) + " cards";
    }
    return "Round " + std::to_string(round_number) + " (Review): "
        + std::to_string(lap_size) + " cards to retry";
}
