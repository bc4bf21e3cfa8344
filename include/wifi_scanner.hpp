#pragma once
#include "access_point.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

class WifiScanner {
public:
    virtual ~WifiScanner() = default;

    // Currently visible access points, strongest first. Failures are logged
    // and produce an empty list.
    virtual std::vector<AccessPoint> scanNetworks() = 0;

    virtual std::string name() const = 0;
};

// Stand-in for hosts with no known scanning utility.
class UnsupportedScanner : public WifiScanner {
public:
    explicit UnsupportedScanner(std::string platform) : platform_(std::move(platform)) {}

    std::vector<AccessPoint> scanNetworks() override;
    std::string name() const override { return "unsupported"; }

private:
    std::string platform_;
};

enum class HostPlatform {
    Linux,
    MacOS,
    Windows,
    Unsupported,
};

HostPlatform detectHostPlatform();
const char* platformName(HostPlatform platform);

// backend is "auto" or one of nmcli, airport, netsh, nl80211, dbus.
// Throws std::invalid_argument for names unknown or unavailable on this build.
std::unique_ptr<WifiScanner> makeScanner(const std::string& backend, HostPlatform host);
