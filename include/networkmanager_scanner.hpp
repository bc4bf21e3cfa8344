#pragma once
#include "wifi_scanner.hpp"
#include <sdbus-c++/sdbus-c++.h>
#include <string>
#include <vector>

// Reads NetworkManager's cached access point list over the system D-Bus.
class NetworkManagerScanner : public WifiScanner {
public:
    NetworkManagerScanner();
    ~NetworkManagerScanner() override;

    std::vector<AccessPoint> scanNetworks() override;
    std::string name() const override { return "dbus"; }

private:
    std::vector<AccessPoint> scanWifiDevice(sdbus::IConnection& connection, const sdbus::ObjectPath& device_path);
};
