#include "access_point.hpp"
#include <gtest/gtest.h>

TEST(AccessPointTest, SortsStrongestFirst) {
    std::vector<AccessPoint> networks(3);
    networks[0].bssid = "a"; networks[0].signal = 10;
    networks[1].bssid = "b"; networks[1].signal = 90;
    networks[2].bssid = "c"; networks[2].signal = 50;

    sortBySignal(networks);

    EXPECT_EQ(networks[0].signal, 90);
    EXPECT_EQ(networks[1].signal, 50);
    EXPECT_EQ(networks[2].signal, 10);
}

TEST(AccessPointTest, EqualSignalsKeepInputOrder) {
    std::vector<AccessPoint> networks(4);
    networks[0].bssid = "first";  networks[0].signal = 40;
    networks[1].bssid = "second"; networks[1].signal = 60;
    networks[2].bssid = "third";  networks[2].signal = 40;
    networks[3].bssid = "fourth"; networks[3].signal = 40;

    sortBySignal(networks);

    EXPECT_EQ(networks[0].bssid, "second");
    EXPECT_EQ(networks[1].bssid, "first");
    EXPECT_EQ(networks[2].bssid, "third");
    EXPECT_EQ(networks[3].bssid, "fourth");
}

TEST(AccessPointTest, ParseSignalDefaultsToZero) {
    EXPECT_EQ(parseSignal("75"), 75);
    EXPECT_EQ(parseSignal(" 42 "), 42);
    EXPECT_EQ(parseSignal("-67"), -67);
    EXPECT_EQ(parseSignal("abc"), 0);
    EXPECT_EQ(parseSignal("80%"), 0);
    EXPECT_EQ(parseSignal(""), 0);
    EXPECT_EQ(parseSignal("99999999999999999999"), 0);
}

TEST(AccessPointTest, DbmConversion) {
    EXPECT_EQ(signalPercentFromDbm(-100), 0);
    EXPECT_EQ(signalPercentFromDbm(-120), 0);
    EXPECT_EQ(signalPercentFromDbm(-50), 100);
    EXPECT_EQ(signalPercentFromDbm(-30), 100);
    EXPECT_EQ(signalPercentFromDbm(-67), 66);
}

TEST(AccessPointTest, ChannelFromFrequency) {
    EXPECT_EQ(channelFromFrequency(2412), "1");
    EXPECT_EQ(channelFromFrequency(2437), "6");
    EXPECT_EQ(channelFromFrequency(2484), "14");
    EXPECT_EQ(channelFromFrequency(5180), "36");
    EXPECT_EQ(channelFromFrequency(5955), "1");
    EXPECT_EQ(channelFromFrequency(0), "N/A");
}

TEST(AccessPointTest, BssidShape) {
    EXPECT_TRUE(looksLikeBssid("aa:bb:cc:11:22:33"));
    EXPECT_TRUE(looksLikeBssid("AA:BB:CC:11:22:33"));
    EXPECT_FALSE(looksLikeBssid("AA:BB:CC:11:22"));
    EXPECT_FALSE(looksLikeBssid("AA-BB-CC-11-22-33"));
    EXPECT_FALSE(looksLikeBssid("GG:BB:CC:11:22:33"));
}

TEST(AccessPointTest, JsonEscapesStrings) {
    AccessPoint network;
    network.ssid = "Cafe \"Free\"\\";
    network.bssid = "AA:BB:CC:11:22:33";
    network.signal = 64;
    network.channel = "11";
    network.manufacturer = "Test Corp";

    EXPECT_EQ(network.toJson(),
              "{\"ssid\":\"Cafe \\\"Free\\\"\\\\\",\"bssid\":\"AA:BB:CC:11:22:33\","
              "\"signal\":64,\"channel\":\"11\",\"manufacturer\":\"Test Corp\"}");
}
