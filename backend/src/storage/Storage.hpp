#pragma once
#include <string>
#include "StoreKey.hpp"
#include "../core/Collection.hpp"

// Storage seals the whole collection (decks, cards, review records and the
// simulated day) into one encrypted file.
//
// Format:
//   Header: 8 bytes ASCII "SRDECK1\n" (magic + version)
//   Salt:   crypto_pwhash_SALTBYTES (for the passphrase-derived key)
//   Nonce:  crypto_secretbox_NONCEBYTES
//   Ciphertext: JSON collection document (see DeckJson)
//
// openCollection derives the key from the passphrase and the file's salt
// (a new salt when the file does not exist yet) and leaves it in `key` for
// later saves.

class Storage {
public:
    static bool openCollection(const std::string& filename, const std::string& passphrase,
        StoreKey& key, Collection& collection, int& currentDay);

    static bool saveCollection(const Collection& collection, int currentDay,
        const std::string& filename, const StoreKey& key);
};
