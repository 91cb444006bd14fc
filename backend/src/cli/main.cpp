#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <limits>
#include <utility>

#include "../utils/logging.hpp"
#include "../utils/Config.hpp"
#include "../storage/Storage.hpp"
#include "../storage/DeckJson.hpp"
#include "../core/Collection.hpp"
#include "../core/Errors.hpp"
#include "../core/Scheduler.hpp"
#include "../core/SessionEngine.hpp"
#include "../core/SimulatedClock.hpp"

static void clearLine() {
    std::cin.clear();
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
}

static int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        if (std::cin.eof()) return -1;
        clearLine();
        return 0;
    }
    clearLine();
    return choice;
}

static std::string prompt(const std::string& label) {
    std::cout << label;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

void listDecks(const Collection& collection, int today) {
    std::cout << "\n===== DECKS (day " << today << ") =====\n";

    if (collection.decks.empty()) {
        std::cout << "No decks stored.\n";
        return;
    }

    for (size_t i = 0; i < collection.decks.size(); i++) {
        const Deck& d = collection.decks[i];
        std::cout << i + 1 << ". " << d.name << " (" << d.cards.size() << " cards, "
            << d.dueCards(today).size() << " due)\n";
    }
}

void listCards(const Deck& deck, int today) {
    std::cout << "\n===== " << deck.name << " =====\n";

    if (deck.cards.empty()) {
        std::cout << "No flashcards.\n";
        return;
    }

    for (size_t i = 0; i < deck.cards.size(); i++) {
        const Card& c = deck.cards[i];
        std::cout << i + 1 << ". Term: " << c.term << "\n"
            << "   Definition: " << c.definition << "\n"
            << "   Ease: " << c.review.easiness_factor
            << " | Interval: " << c.review.interval_days << " days"
            << " | Repetitions: " << c.review.repetitions << "\n"
            << "   Next review: day " << c.review.next_review_day
            << (c.isDue(today) ? " (due)" : "") << "\n";
    }
}

Deck* chooseDeck(Collection& collection, int today) {
    if (collection.decks.empty()) {
        std::cout << "No decks available.\n";
        return nullptr;
    }
    listDecks(collection, today);
    std::cout << "Choose deck number: ";

    int sel = readChoice();
    if (sel < 1 || (size_t)sel > collection.decks.size()) {
        std::cout << "Invalid selection.\n";
        return nullptr;
    }
    return &collection.decks[sel - 1];
}

// Returns 0..5, or -1 when the learner wants to stop the session.
int askQuality() {
    while (true) {
        std::cout << "\nRate your response:\n";
        for (int q = 0; q <= 5; ++q) {
            std::cout << " " << q << " = "
                      << Scheduler::qualityLabel(Scheduler::qualityFromInt(q)) << "\n";
        }
        std::cout << " q = Stop session\n> ";
        std::string line;
        if (!std::getline(std::cin, line) || line == "q") return -1;
        if (line.size() == 1 && line[0] >= '0' && line[0] <= '5') return line[0] - '0';
        std::cout << "Invalid input.\n";
    }
}

bool saveAll(const Collection& collection, const SimulatedClock& clock,
    const Config& config, const StoreKey& key)
{
    if (!Storage::saveCollection(collection, clock.today(), config.store_path, key)) {
        std::cout << "Error saving collection to '" << config.store_path << "'.\n";
        return false;
    }
    return true;
}

void handleSaveFailure(SessionEngine& engine, const PersistenceFailure& e) {
    std::cout << "Could not save progress: " << e.what() << "\n";
    while (engine.hasPendingSaves()) {
        std::cout << "1. Retry\n2. Keep for later\n> ";
        if (readChoice() != 1) break;
        size_t left = engine.retryPendingSaves();
        if (left) std::cout << left << " record(s) still unsaved.\n";
    }
}

void runSession(SessionEngine& engine, const Collection& collection) {
    while (engine.isActive()) {
        auto cardId = engine.currentCard();
        if (!cardId) break;

        const Card* card = collection.findCard(*cardId);
        if (!card) {
            spdlog::error("Queued card '{}' vanished from the collection", *cardId);
            std::cout << "Card missing from collection; stopping session.\n";
            try {
                engine.abort();
            }
            catch (const PersistenceFailure& e) {
                handleSaveFailure(engine, e);
            }
            break;
        }

        std::cout << "\n" << engine.phaseMessage() << "\n"
            << "Progress: " << engine.masteredCount() << " / " << engine.totalCount()
            << " learned (" << engine.remainingCount() << " remaining)\n"
            << "\nTerm: " << card->term << "\n";
        prompt("(Press Enter to show definition)");
        std::cout << "Definition: " << card->definition << "\n";

        int q = askQuality();
        try {
            if (q < 0) {
                engine.abort();
                std::cout << "Session stopped; progress so far was kept.\n";
                break;
            }
            engine.rate(*cardId, q);
        }
        catch (const PersistenceFailure& e) {
            handleSaveFailure(engine, e);
        }
        catch (const InvalidRating& e) {
            std::cout << e.what() << "\n";
        }
        catch (const InvalidSessionOperation& e) {
            std::cout << e.what() << "\n";
            break;
        }
    }

    if (engine.isComplete() && engine.remainingCount() == 0) {
        std::cout << "\nCongratulations! You've learned all due cards in this deck.\n";
    }
}

void seedSampleDeck(Collection& collection, int today) {
    const std::string name = "Polish Vocabulary";
    collection.createDeck(name);
    collection.addCard(name, "cześć", "hello", today);
    collection.addCard(name, "dziękuję", "thank you", today);
    collection.addCard(name, "proszę", "please", today);
    spdlog::info("Sample deck '{}' created", name);
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Config config;
    const std::string configPath = argc > 1 ? argv[1] : "recall.conf";
    if (!config.load(configPath)) {
        std::cerr << "Failed to read config '" << configPath << "'\n";
        return 1;
    }

    try {
        Log::init(config.log_path, config.log_level);
    }
    catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to open log file '" << config.log_path << "': " << e.what() << "\n";
        return 1;
    }
    spdlog::info("recall starting with config '{}'", configPath);

    Collection collection;
    StoreKey key;
    int day = 0;

    // UNLOCK
    while (!key.valid()) {
        std::cout << "\n===== OPEN COLLECTION =====\n"
            "Store: " << config.store_path << "\n"
            "1. Unlock\n"
            "2. Exit\n> ";
        int choice = readChoice();

        if (choice == 1) {
            std::string passphrase = prompt("Passphrase: ");
            if (passphrase.empty()) { std::cout << "Passphrase required.\n"; continue; }

            if (Storage::openCollection(config.store_path, passphrase, key, collection, day))
                std::cout << "Collection unlocked.\n";
            else
                std::cout << "Could not open collection (wrong passphrase or damaged file).\n";

            sodium_memzero(&passphrase[0], passphrase.size());
        }
        else if (choice == 2 || choice == -1)
            return 0;
    }

    SimulatedClock clock(day);
    Scheduler scheduler;
    SessionEngine engine(collection, scheduler, clock);

    if (collection.decks.empty()) {
        seedSampleDeck(collection, clock.today());
        std::cout << "Sample data created!\n";
    }

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Day: " << clock.today() << "\n"
            "1. Create Deck\n"
            "2. Add Flashcard\n"
            "3. List Decks\n"
            "4. List Flashcards\n"
            "5. Learn Deck\n"
            "6. Next Day\n"
            "7. Export Deck\n"
            "8. Import Deck\n"
            "9. Remove Flashcard\n"
            "10. Remove Deck\n"
            "11. Settings\n"
            "12. Save & Exit\n> ";

        int choice = readChoice();
        if (choice == -1) choice = 12;

        if (choice == 1) {
            std::string name = prompt("Deck name: ");
            if (collection.createDeck(name)) std::cout << "Deck '" << name << "' created.\n";
            else std::cout << "Deck name empty or already used.\n";
        }

        else if (choice == 2) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (!deck) continue;

            std::string term = prompt("Term: ");
            std::string definition = prompt("Definition: ");
            if (collection.addCard(deck->name, term, definition, clock.today()))
                std::cout << "Flashcard saved.\n";
            else
                std::cout << "Term and definition required.\n";
        }

        else if (choice == 3) {
            listDecks(collection, clock.today());
        }

        else if (choice == 4) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (deck) listCards(*deck, clock.today());
        }

        else if (choice == 5) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (!deck) continue;

            if (engine.hasPendingSaves() && engine.retryPendingSaves() > 0) {
                std::cout << "Earlier progress is still unsaved; try again later.\n";
                continue;
            }

            engine.startDeckSession(deck->name);
            if (engine.presentedCount() == 0 && engine.isComplete()) {
                std::cout << "No cards due in '" << deck->name << "'. Try the next day.\n";
                continue;
            }

            std::cout << "\nLearning: " << deck->name << "\n";
            runSession(engine, collection);
            saveAll(collection, clock, config, key);
        }

        else if (choice == 6) {
            clock.advanceDay();
            std::cout << "It is now day " << clock.today() << ".\n";
            saveAll(collection, clock, config, key);
        }

        else if (choice == 7) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (!deck) continue;

            const std::string path = config.exportPathFor(deck->name);
            if (DeckJson::exportDeckToPath(*deck, path))
                std::cout << "Deck '" << deck->name << "' exported to " << path << "\n";
            else
                std::cout << "Export failed; see log.\n";
        }

        else if (choice == 8) {
            std::string path = prompt("JSON file: ");
            Deck imported;
            if (!DeckJson::importDeck(path, clock.today(), imported)) {
                std::cout << "Import failed. Expected structure:\n"
                    "{\n  \"name\": \"Deck Name\",\n  \"flashcards\": [...]\n}\n";
                continue;
            }

            const std::string name = imported.name;
            const size_t count = imported.cards.size();
            if (collection.addDeck(std::move(imported)))
                std::cout << "Deck '" << name << "' imported successfully with " << count << " cards!\n";
            else
                std::cout << "Deck '" << name << "' already exists! Please rename it in the JSON file.\n";
        }

        else if (choice == 9) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (!deck) continue;
            listCards(*deck, clock.today());
            std::cout << "Choose flashcard number: ";
            int sel = readChoice();
            if (sel < 1 || (size_t)sel > deck->cards.size()) { std::cout << "Invalid selection.\n"; continue; }
            collection.removeCard(deck->cards[sel - 1].id);
            std::cout << "Flashcard removed.\n";
        }

        else if (choice == 10) {
            Deck* deck = chooseDeck(collection, clock.today());
            if (!deck) continue;
            const std::string name = deck->name;
            collection.removeDeck(name);
            std::cout << "Deck '" << name << "' removed.\n";
        }

        else if (choice == 11) {
            std::cout << "=== SETTINGS (" << configPath << ") ===\n" << config.serialize();
        }

        else if (choice == 12) {
            bool saved = saveAll(collection, clock, config, key);
            key.clear();
            std::cout << (saved ? "Goodbye!\n" : "Exiting without saving.\n");
            return saved ? 0 : 1;
        }

        else {
            std::cout << "Invalid.\n";
        }
    }

    return 0;
}
