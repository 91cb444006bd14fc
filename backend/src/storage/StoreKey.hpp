#pragma once
#include <string>
#include <vector>

// Symmetric key for the collection file, derived from the learner's
// passphrase with Argon2id (crypto_pwhash). Wiped on destruction.
class StoreKey {
public:
    StoreKey() = default;
    ~StoreKey();

    StoreKey(const StoreKey&) = delete;
    StoreKey& operator=(const StoreKey&) = delete;

    // Fresh random salt for a new store file.
    static std::vector<unsigned char> generateSalt();

    bool derive(const std::string& passphrase, const std::vector<unsigned char>& salt);
    void clear();

    bool valid() const { return !key.empty(); }
    const std::vector<unsigned char>& bytes() const { return key; }
    const std::vector<unsigned char>& salt() const { return key_salt; }

private:
    std::vector<unsigned char> key;
    std::vector<unsigned char> key_salt;
};
