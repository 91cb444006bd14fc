#include "DeckJson.hpp"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace DeckJson {

json reviewToJson(const ReviewRecord& record) {
    return json{
        {"easiness_factor", record.easiness_factor},
        {"interval_days", record.interval_days},
        {"repetitions", record.repetitions},
        {"next_review_day", record.next_review_day}
    };
}

namespace {

// Reads an integer field and checks it lies in [lo, hi] before narrowing.
bool intInRange(const json& j, const char* field, long long lo, long long hi, int& out) {
    if (!j.contains(field) || !j[field].is_number_integer()) {
        spdlog::error("review data lacks an integer '{}'", field);
        return false;
    }
    const json& v = j[field];
    bool ok;
    if (v.is_number_unsigned()) {
        std::uint64_t u = v.get<std::uint64_t>();
        ok = u <= static_cast<std::uint64_t>(hi) && static_cast<long long>(u) >= lo;
    } else {
        std::int64_t s = v.get<std::int64_t>();
        ok = s >= lo && s <= hi;
    }
    if (!ok) {
        spdlog::error("review field '{}' out of range [{}, {}]: {}", field, lo, hi, v.dump());
        return false;
    }
    out = static_cast<int>(v.get<std::int64_t>());
    return true;
}

}

bool reviewFromJson(const json& j, ReviewRecord& out) {
    if (!j.is_object()) {
        spdlog::error("review data is not an object");
        return false;
    }

    if (!j.contains("easiness_factor") || !j["easiness_factor"].is_number()) {
        spdlog::error("review data lacks a numeric 'easiness_factor'");
        return false;
    }

    ReviewRecord r;
    r.easiness_factor = j["easiness_factor"].get<double>();
    if (!std::isfinite(r.easiness_factor) || r.easiness_factor < 1.3) {
        spdlog::error("review data out of range: ef={}", r.easiness_factor);
        return false;
    }

    if (!intInRange(j, "interval_days", 0, ReviewRecord::MAX_INTERVAL_DAYS, r.interval_days)
        || !intInRange(j, "repetitions", 0, std::numeric_limits<int>::max(), r.repetitions)
        || !intInRange(j, "next_review_day", 0, ReviewRecord::MAX_DAY, r.next_review_day)) {
        return false;
    }

    if (r.repetitions >= 1 && r.interval_days < 1) {
        spdlog::error("review data inconsistent: reps={} with interval={}",
            r.repetitions, r.interval_days);
        return false;
    }

    out = r;
    return true;
}

json deckToJson(const Deck& deck, bool withIds) {
    json cards = json::array();
    for (const auto& c : deck.cards) {
        json jc{
            {"term", c.term},
            {"definition", c.definition},
            {"review", reviewToJson(c.review)}
        };
        if (withIds) jc["id"] = c.id;
        cards.push_back(std::move(jc));
    }
    return json{{"name", deck.name}, {"flashcards", std::move(cards)}};
}

bool deckFromJson(const json& j, int today, Deck& out, bool keepIds) {
    if (!j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        spdlog::error("deck document needs a string 'name'");
        return false;
    }
    if (!j.contains("flashcards") || !j["flashcards"].is_array()) {
        spdlog::error("deck document needs a 'flashcards' array");
        return false;
    }

    Deck deck(j["name"].get<std::string>());
    if (deck.name.empty()) {
        spdlog::error("deck name is empty");
        return false;
    }

    for (const auto& jc : j["flashcards"]) {
        if (!jc.is_object()
            || !jc.contains("term") || !jc["term"].is_string()
            || !jc.contains("definition") || !jc["definition"].is_string()) {
            spdlog::error("deck '{}': flashcard needs string 'term' and 'definition'", deck.name);
            return false;
        }

        Card card;
        card.term = jc["term"].get<std::string>();
        card.definition = jc["definition"].get<std::string>();
        card.review = ReviewRecord::fresh(today);

        if (jc.contains("review") && !jc["review"].is_null()) {
            if (!reviewFromJson(jc["review"], card.review)) {
                spdlog::error("deck '{}': bad review data for term '{}'", deck.name, card.term);
                return false;
            }
        }

        if (keepIds && jc.contains("id") && jc["id"].is_string()) card.id = jc["id"].get<std::string>();
        if (card.id.empty()) card.id = Card::generateID();

        if (deck.findByTerm(card.term)) {
            spdlog::warn("deck '{}': duplicate term '{}' skipped", deck.name, card.term);
            continue;
        }
        deck.cards.push_back(std::move(card));
    }

    out = std::move(deck);
    return true;
}

json collectionToJson(const Collection& collection, int currentDay) {
    json decks = json::array();
    for (const auto& d : collection.decks) decks.push_back(deckToJson(d, true));
    return json{{"version", 1}, {"current_day", currentDay}, {"decks", std::move(decks)}};
}

bool collectionFromJson(const json& j, Collection& out, int& currentDay) {
    if (!j.is_object() || !j.contains("current_day") || !j["current_day"].is_number_integer()
        || !j.contains("decks") || !j["decks"].is_array()) {
        spdlog::error("collection document is malformed");
        return false;
    }

    const json& jday = j["current_day"];
    if (jday.is_number_unsigned()
        ? jday.get<std::uint64_t>() > static_cast<std::uint64_t>(ReviewRecord::MAX_DAY)
        : (jday.get<std::int64_t>() < 0 || jday.get<std::int64_t>() > ReviewRecord::MAX_DAY)) {
        spdlog::error("collection current_day out of range: {}", jday.dump());
        return false;
    }
    int day = static_cast<int>(jday.get<std::int64_t>());

    Collection loaded;
    for (const auto& jd : j["decks"]) {
        Deck deck;
        if (!deckFromJson(jd, day, deck, true)) return false;
        if (!loaded.addDeck(std::move(deck))) {
            spdlog::error("collection holds deck '{}' twice", jd.value("name", ""));
            return false;
        }
    }

    out = std::move(loaded);
    currentDay = day;
    return true;
}

bool exportDeckToPath(const Deck& deck, const std::string& path) {
    spdlog::info("Exporting deck '{}' ({} cards) to '{}'", deck.name, deck.cards.size(), path);

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing", path);
        return false;
    }

    out << deckToJson(deck).dump(2) << "\n";
    if (!out) {
        spdlog::error("Failed writing deck export to '{}'", path);
        return false;
    }
    return true;
}

bool importDeck(const std::string& path, int today, Deck& out) {
    spdlog::info("Importing deck from '{}'", path);

    std::ifstream in(path);
    if (!in) {
        spdlog::error("Deck file '{}' not found or unreadable", path);
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    json j = json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        spdlog::error("Deck file '{}' is not valid JSON", path);
        return false;
    }

    if (!deckFromJson(j, today, out)) {
        spdlog::error("Deck file '{}' has the wrong structure", path);
        return false;
    }

    spdlog::info("Deck '{}' imported from '{}' with {} cards", out.name, path, out.cards.size());
    return true;
}

}
