#include "Storage.hpp"
#include "DeckJson.hpp"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "SRDECK1\n";

bool Storage::saveCollection(const Collection& collection, int currentDay,
    const std::string& filename, const StoreKey& key)
{
    spdlog::info("Saving {} decks ({} cards, day {}) to '{}'",
        collection.decks.size(), collection.cardCount(), currentDay, filename);

    if (!key.valid() || key.bytes().size() != crypto_secretbox_KEYBYTES
        || key.salt().size() != crypto_pwhash_SALTBYTES) {
        spdlog::error("Invalid store key");
        return false;
    }

    std::string plain = DeckJson::collectionToJson(collection, currentDay).dump();
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.bytes().data()) != 0) {
        spdlog::error("Encryption failed");
        sodium_memzero(&plain[0], plain.size());
        return false;
    }
    sodium_memzero(&plain[0], plain.size());

    // Write beside the target, then rename, so a failed write keeps the old file
    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
        out.write(reinterpret_cast<const char*>(key.salt().data()), key.salt().size());
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
        if (!out) {
            spdlog::error("Failed writing '{}'", tmp);
            return false;
        }
    }

    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to move '{}' over '{}'", tmp, filename);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool Storage::openCollection(const std::string& filename, const std::string& passphrase,
    StoreKey& key, Collection& collection, int& currentDay)
{
    spdlog::info("Opening collection '{}'", filename);

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Collection file '{}' not found; starting empty at day 0", filename);
        if (!key.derive(passphrase, StoreKey::generateSalt())) return false;
        collection = Collection();
        currentDay = 0;
        return true;
    }

    char hdr[sizeof(MAGIC_HDR) - 1];
    in.read(hdr, sizeof(hdr));
    if (in.gcount() != sizeof(hdr) || std::strncmp(hdr, MAGIC_HDR, sizeof(hdr)) != 0) {
        spdlog::error("Invalid magic header");
        return false;
    }

    std::vector<unsigned char> salt(crypto_pwhash_SALTBYTES);
    in.read(reinterpret_cast<char*>(salt.data()), salt.size());
    if (in.gcount() != static_cast<std::streamsize>(salt.size())) {
        spdlog::error("Failed to read salt");
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    if (!key.derive(passphrase, salt)) return false;

    std::vector<unsigned char> plain(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext.data(), ciphertext.size(), nonce, key.bytes().data()) != 0) {
        spdlog::error("Decryption failed (wrong passphrase or corrupted file)");
        key.clear();
        return false;
    }

    std::string plain_str(reinterpret_cast<char*>(plain.data()), plain.size());
    sodium_memzero(plain.data(), plain.size());

    nlohmann::json doc = nlohmann::json::parse(plain_str, nullptr, false);
    if (!plain_str.empty()) sodium_memzero(&plain_str[0], plain_str.size());
    if (doc.is_discarded()) {
        spdlog::error("Collection payload is not valid JSON");
        key.clear();
        return false;
    }

    if (!DeckJson::collectionFromJson(doc, collection, currentDay)) {
        key.clear();
        return false;
    }

    spdlog::info("Loaded {} decks ({} cards), current day {}",
        collection.decks.size(), collection.cardCount(), currentDay);
    return true;
}
