#include "Config.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

static std::string trim(const std::string& s) {
    std::string t = s;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    return t;
}

bool Config::load(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        // Logging is not set up yet when the CLI reads its config
        spdlog::warn("Config file '{}' not found; using defaults", filename);
        return true;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        spdlog::error("Failed reading config file '{}'", filename);
        return false;
    }

    deserialize(buffer.str());
    return true;
}

std::string Config::serialize() const {
    std::ostringstream oss;
    oss << "store_path: " << store_path << "\n"
        << "log_path: " << log_path << "\n"
        << "log_level: " << log_level << "\n"
        << "export_dir: " << export_dir << "\n";
    return oss.str();
}

void Config::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            spdlog::warn("Config line without ':' ignored: '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (val.empty()) {
            spdlog::warn("Config key '{}' has no value; keeping default", key);
            continue;
        }

        if (key == "store_path") store_path = val;
        else if (key == "log_path") log_path = val;
        else if (key == "log_level") log_level = val;
        else if (key == "export_dir") export_dir = val;
        else spdlog::warn("Unknown config key '{}' ignored", key);
    }
}

std::string Config::exportPathFor(const std::string& deckName) const {
    std::string file;
    for (char c : deckName) {
        file += (std::isalnum((unsigned char)c) || c == '-' || c == '_') ? c : '_';
    }
    if (file.empty()) file = "deck";

    std::string dir = export_dir;
    if (!dir.empty() && dir.back() != '/') dir += '/';
    return dir + file + ".json";
}
