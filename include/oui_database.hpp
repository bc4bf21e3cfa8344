#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

// Manufacturer names keyed by the upper-case "XX:XX:XX" address prefix.
// Loaded once from a Wireshark-style manuf file.
class OuiDatabase {
public:
    // Returns false when the file cannot be read; the table is left empty and
    // every lookup falls back to the unknown manufacturer.
    bool load(const std::string& path);

    void add(const std::string& prefix, const std::string& manufacturer);

    std::string lookup(const std::string& hardwareAddress) const;

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    static std::string prefixOf(const std::string& hardwareAddress);

private:
    std::unordered_map<std::string, std::string> entries_;
};
