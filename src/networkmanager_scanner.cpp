#include "networkmanager_scanner.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>

namespace {

const char* kService = "org.freedesktop.NetworkManager";
const char* kManagerPath = "/org/freedesktop/NetworkManager";
const char* kManagerInterface = "org.freedesktop.NetworkManager";
const char* kDeviceInterface = "org.freedesktop.NetworkManager.Device";
const char* kWirelessInterface = "org.freedesktop.NetworkManager.Device.Wireless";
const char* kAccessPointInterface = "org.freedesktop.NetworkManager.AccessPoint";

constexpr uint32_t kDeviceTypeWifi = 2;  // NM_DEVICE_TYPE_WIFI

}

NetworkManagerScanner::NetworkManagerScanner() {}
NetworkManagerScanner::~NetworkManagerScanner() {}

std::vector<AccessPoint> NetworkManagerScanner::scanNetworks() {
    std::vector<AccessPoint> networks;

    try {
        auto connection = sdbus::createSystemBusConnection();
        auto manager = sdbus::createProxy(*connection, kService, kManagerPath);

        std::vector<sdbus::ObjectPath> devices;
        manager->callMethod("GetDevices").onInterface(kManagerInterface).storeResultsTo(devices);

        for (const auto& device_path : devices) {
            auto device = sdbus::createProxy(*connection, kService, device_path);
            uint32_t type = device->getProperty("DeviceType").onInterface(kDeviceInterface).get<uint32_t>();
            if (type != kDeviceTypeWifi) continue;

            std::vector<AccessPoint> found = scanWifiDevice(*connection, device_path);
            networks.insert(networks.end(), found.begin(), found.end());
        }
    } catch (const sdbus::Error& e) {
        spdlog::error("[Scanner] NetworkManager D-Bus query failed: {} ({})", e.getMessage(), e.getName());
        return {};
    }

    sortBySignal(networks);
    spdlog::debug("[Scanner] dbus reported {} access points", networks.size());
    return networks;
}

std::vector<AccessPoint> NetworkManagerScanner::scanWifiDevice(sdbus::IConnection& connection,
                                                               const sdbus::ObjectPath& device_path) {
    std::vector<AccessPoint> networks;

    auto wireless = sdbus::createProxy(connection, kService, device_path);
    std::vector<sdbus::ObjectPath> ap_paths;
    wireless->callMethod("GetAllAccessPoints").onInterface(kWirelessInterface).storeResultsTo(ap_paths);

    for (const auto& ap_path : ap_paths) {
        auto ap = sdbus::createProxy(connection, kService, ap_path);

        std::vector<uint8_t> ssid =
            ap->getProperty("Ssid").onInterface(kAccessPointInterface).get<std::vector<uint8_t>>();
        uint8_t strength = ap->getProperty("Strength").onInterface(kAccessPointInterface).get<uint8_t>();
        uint32_t frequency = ap->getProperty("Frequency").onInterface(kAccessPointInterface).get<uint32_t>();

        AccessPoint network;
        network.ssid.assign(ssid.begin(), ssid.end());
        network.bssid = ap->getProperty("HwAddress").onInterface(kAccessPointInterface).get<std::string>();
        network.signal = strength;
        network.channel = channelFromFrequency(frequency);
        networks.push_back(network);
    }
    return networks;
}
