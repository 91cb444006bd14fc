#include "StoreKey.hpp"
#include <sodium.h>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t ENC_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;      // recommended salt size

StoreKey::~StoreKey() {
    clear();
}

std::vector<unsigned char> StoreKey::generateSalt() {
    std::vector<unsigned char> salt(SALT_BYTES);
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

bool StoreKey::derive(const std::string& passphrase, const std::vector<unsigned char>& salt) {
    spdlog::debug("Deriving store key (not logging passphrase or salt)");
    clear();

    if (passphrase.empty()) {
        spdlog::error("Cannot derive store key: passphrase is empty");
        return false;
    }
    if (salt.size() != SALT_BYTES) {
        spdlog::error("Cannot derive store key: salt length {} (expected {})", salt.size(), SALT_BYTES);
        return false;
    }

    key.assign(ENC_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        ENC_KEY_BYTES,
        passphrase.c_str(),
        static_cast<unsigned long long>(passphrase.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during store key derivation (likely out of memory)");
        key.clear();
        return false;
    }

    key_salt = salt;
    spdlog::debug("Store key derived successfully");
    return true;
}

void StoreKey::clear() {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
        key.clear();
    }
    key_salt.clear();
}
