#include "Card.hpp"
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

Card::Card(const std::string& t, const std::string& d, int today)
    : term(t), definition(d), review(ReviewRecord::fresh(today))
{
    id = generateID();
    spdlog::info("Created Card: ID={}, Term={}, due day {}", id, term, review.next_review_day);
}

std::string Card::generateID() {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed while generating a card id");
        throw std::runtime_error("libsodium initialization failed");
    }

    unsigned char raw[16];
    randombytes_buf(raw, sizeof(raw));

    char hex[2 * sizeof(raw) + 1];
    sodium_bin2hex(hex, sizeof(hex), raw, sizeof(raw));
    return std::string(hex);
}
