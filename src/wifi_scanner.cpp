#include "wifi_scanner.hpp"
#include "command_scanners.hpp"
#ifdef __linux__
#include "networkmanager_scanner.hpp"
#include "nl80211_scanner.hpp"
#endif
#include <spdlog/spdlog.h>
#include <stdexcept>

std::vector<AccessPoint> UnsupportedScanner::scanNetworks() {
    spdlog::error("[Scanner] Unsupported operating system: {}", platform_);
    return {};
}

HostPlatform detectHostPlatform() {
#if defined(__linux__)
    return HostPlatform::Linux;
#elif defined(__APPLE__)
    return HostPlatform::MacOS;
#elif defined(_WIN32)
    return HostPlatform::Windows;
#else
    return HostPlatform::Unsupported;
#endif
}

const char* platformName(HostPlatform platform) {
    switch (platform) {
        case HostPlatform::Linux:   return "Linux";
        case HostPlatform::MacOS:   return "macOS";
        case HostPlatform::Windows: return "Windows";
        default:                    return "unknown";
    }
}

std::unique_ptr<WifiScanner> makeScanner(const std::string& backend, HostPlatform host) {
    if (backend == "auto") {
        switch (host) {
            case HostPlatform::Linux:   return std::make_unique<NmcliScanner>();
            case HostPlatform::MacOS:   return std::make_unique<AirportScanner>();
            case HostPlatform::Windows: return std::make_unique<NetshScanner>();
            default:
                return std::make_unique<UnsupportedScanner>(platformName(host));
        }
    }

    if (backend == "nmcli") return std::make_unique<NmcliScanner>();
    if (backend == "airport") return std::make_unique<AirportScanner>();
    if (backend == "netsh") return std::make_unique<NetshScanner>();

    if (backend == "nl80211" || backend == "dbus") {
#ifdef __linux__
        if (backend == "nl80211") return std::make_unique<Nl80211Scanner>();
        return std::make_unique<NetworkManagerScanner>();
#else
        throw std::invalid_argument("backend '" + backend + "' is only available on Linux");
#endif
    }

    throw std::invalid_argument("unknown backend '" + backend + "'");
}
