#pragma once
#include <string>

// Settings read from a "key: value" text file. Lines starting with '#' are
// comments; unknown keys are logged and ignored.
class Config {
public:
    std::string store_path = "recall.dat";
    std::string log_path = "recall.log";
    std::string log_level = "info";
    std::string export_dir = ".";

    // Missing file keeps the defaults and returns true.
    bool load(const std::string& filename);

    std::string serialize() const;
    void deserialize(const std::string& data);

    std::string exportPathFor(const std::string& deckName) const;
};
