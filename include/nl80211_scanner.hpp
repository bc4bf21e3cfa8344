#pragma once
#include "wifi_scanner.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Asks the kernel directly over generic netlink (nl80211): triggers a scan,
// waits for the scan-complete event, then dumps the BSS list. Needs root.
class Nl80211Scanner : public WifiScanner {
public:
    explicit Nl80211Scanner(std::chrono::seconds timeout = std::chrono::seconds(10));

    std::vector<AccessPoint> scanNetworks() override;
    std::string name() const override { return "nl80211"; }

private:
    std::chrono::seconds timeout_;
};

// First interface named wlan*, wlp*, wlo* or wlx*; "wlan0" if none.
std::string findWirelessInterface();

// "AA:BB:CC:DD:EE:FF" from six raw bytes.
std::string formatBssid(const uint8_t* mac);

// SSID element (id 0) from a beacon's information elements; empty when the
// element is missing, malformed or longer than 32 bytes.
std::string ssidFromInformationElements(const uint8_t* ie, int length);
