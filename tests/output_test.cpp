#include "output.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {

AccessPoint makeNetwork(const std::string& ssid, const std::string& bssid, int signal) {
    AccessPoint network;
    network.ssid = ssid;
    network.bssid = bssid;
    network.signal = signal;
    return network;
}

}

TEST(OutputTest, EnrichFillsManufacturer) {
    OuiDatabase oui;
    oui.add("AA:BB:CC", "Test Corp");

    std::vector<AccessPoint> networks;
    networks.push_back(makeNetwork("a", "aa:bb:cc:11:22:33", 80));
    networks.push_back(makeNetwork("b", "12:34:56:78:9a:bc", 40));
    enrichManufacturers(networks, oui);

    EXPECT_EQ(networks[0].manufacturer, "Test Corp");
    EXPECT_EQ(networks[1].manufacturer, "Unknown Manufacturer");
}

TEST(OutputTest, ListLineUsesThreeBandColors) {
    AccessPoint network = makeNetwork("HomeNet", "AA:BB:CC:11:22:33", 45);
    network.manufacturer = "Test Corp";

    EXPECT_EQ(formatListLine(2, network),
              "\x1b[31m2. SSID: HomeNet, RSSI: 45%, BSSID: AA:BB:CC:11:22:33, "
              "Manufacturer: Test Corp\x1b[0m");

    network.signal = 71;
    EXPECT_EQ(formatListLine(1, network).find("\x1b[32m"), 0u);
}

TEST(OutputTest, ListHasHeaderAndNumbering) {
    std::vector<AccessPoint> networks;
    networks.push_back(makeNetwork("first", "AA:BB:CC:00:00:01", 90));
    networks.push_back(makeNetwork("second", "AA:BB:CC:00:00:02", 60));

    std::ostringstream out;
    printNetworkList(out, networks);

    EXPECT_EQ(out.str().find("Available Wi-Fi Networks (sorted by RSSI):\n"), 0u);
    EXPECT_NE(out.str().find("1. SSID: first"), std::string::npos);
    EXPECT_NE(out.str().find("2. SSID: second"), std::string::npos);
}

TEST(OutputTest, JsonArray) {
    std::ostringstream empty;
    printNetworksJson(empty, {});
    EXPECT_EQ(empty.str(), "[]\n");

    std::vector<AccessPoint> networks;
    networks.push_back(makeNetwork("a", "AA:BB:CC:00:00:01", 90));
    networks.push_back(makeNetwork("b", "AA:BB:CC:00:00:02", 30));

    std::ostringstream out;
    printNetworksJson(out, networks);

    EXPECT_EQ(out.str(),
              "[{\"ssid\":\"a\",\"bssid\":\"AA:BB:CC:00:00:01\",\"signal\":90,\"channel\":\"N/A\",\"manufacturer\":\"\"},"
              "{\"ssid\":\"b\",\"bssid\":\"AA:BB:CC:00:00:02\",\"signal\":30,\"channel\":\"N/A\",\"manufacturer\":\"\"}]\n");
}
