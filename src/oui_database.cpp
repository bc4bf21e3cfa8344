#include "oui_database.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

namespace {

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

}

bool OuiDatabase::load(const std::string& path) {
    entries_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[Oui] Error loading OUI database: cannot open '{}'", path);
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string part;
        while (fields >> part) {
            parts.push_back(part);
        }
        // prefix, short name (unused), then the full manufacturer name
        if (parts.size() < 3) continue;

        std::string manufacturer = parts[2];
        for (size_t i = 3; i < parts.size(); ++i) {
            manufacturer += " " + parts[i];
        }
        add(parts[0], manufacturer);
    }

    if (file.bad()) {
        spdlog::error("[Oui] Error loading OUI database: read failure on '{}'", path);
        entries_.clear();
        return false;
    }

    spdlog::info("[Oui] Loaded {} entries from OUI database.", entries_.size());
    return true;
}

void OuiDatabase::add(const std::string& prefix, const std::string& manufacturer) {
    entries_[toUpper(prefix)] = manufacturer;
}

std::string OuiDatabase::prefixOf(const std::string& hardwareAddress) {
    std::string prefix;
    int groups = 0;
    std::istringstream stream(hardwareAddress);
    std::string group;
    while (groups < 3 && std::getline(stream, group, ':')) {
        if (groups > 0) prefix += ":";
        prefix += group;
        ++groups;
    }
    return toUpper(prefix);
}

std::string OuiDatabase::lookup(const std::string& hardwareAddress) const {
    auto it = entries_.find(prefixOf(hardwareAddress));
    if (it != entries_.end()) {
        return it->second;
    }
    return kUnknownManufacturer;
}
