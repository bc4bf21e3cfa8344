#pragma once
#include <string>
#include <vector>

struct AccessPoint {
    std::string ssid;
    std::string bssid;
    int signal = 0;                 // percent, 0-100
    std::string channel = "N/A";
    std::string manufacturer;       // filled in by enrichment

    std::string toJson() const;
};

// Maps an RSSI in dBm onto 0-100.
int signalPercentFromDbm(int dbm);

// Integer parse with the default-to-0 policy every scanner uses.
int parseSignal(const std::string& text);

std::string channelFromFrequency(unsigned int frequencyMhz);

bool looksLikeBssid(const std::string& text);

// Strongest first; equal signals keep their input order.
void sortBySignal(std::vector<AccessPoint>& networks);
