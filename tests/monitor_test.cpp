#include "monitor.hpp"
#include <gtest/gtest.h>
#include <csignal>
#include <sstream>

namespace {

class FakeScanner : public WifiScanner {
public:
    std::vector<AccessPoint> scanNetworks() override {
        ++scans;
        return networks;
    }
    std::string name() const override { return "fake"; }

    std::vector<AccessPoint> networks;
    int scans = 0;
};

AccessPoint makeNetwork(const std::string& ssid, const std::string& bssid, int signal) {
    AccessPoint network;
    network.ssid = ssid;
    network.bssid = bssid;
    network.signal = signal;
    return network;
}

}

TEST(MonitorTest, EnrichesWithManufacturer) {
    OuiDatabase oui;
    oui.add("AA:BB:CC", "Test Corp");
    SignalHistory history;
    FakeScanner scanner;
    scanner.networks.push_back(makeNetwork("HomeNet", "aa:bb:cc:11:22:33", 80));
    std::ostringstream out;

    Monitor monitor(scanner, oui, history, out);
    monitor.setClearScreen(false);

    EXPECT_EQ(monitor.refresh(), 1u);
    EXPECT_NE(out.str().find("Test Corp"), std::string::npos);
    EXPECT_NE(out.str().find("HomeNet"), std::string::npos);
    EXPECT_NE(out.str().find("Total networks found: 1"), std::string::npos);
    EXPECT_EQ(out.str().find("\x1b[2J"), std::string::npos);
}

TEST(MonitorTest, RecordsHistoryEveryCycle) {
    OuiDatabase oui;
    SignalHistory history;
    FakeScanner scanner;
    scanner.networks.push_back(makeNetwork("A", "AA:BB:CC:11:22:33", 60));
    scanner.networks.push_back(makeNetwork("B", "00:11:22:33:44:55", 20));
    std::ostringstream out;

    Monitor monitor(scanner, oui, history, out);
    monitor.refresh();
    scanner.networks[0].signal = 75;
    monitor.refresh();

    const auto& samples = history.samples("AA:BB:CC:11:22:33");
    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0], 60);
    EXPECT_EQ(samples[1], 75);
    EXPECT_EQ(history.samples("00:11:22:33:44:55").size(), 2u);
    EXPECT_EQ(out.str().find("\x1b[2J"), 0u);
}

TEST(MonitorTest, TableRowsFollowScanOrder) {
    OuiDatabase oui;
    SignalHistory history;
    FakeScanner scanner;
    std::ostringstream out;
    Monitor monitor(scanner, oui, history, out);

    std::vector<AccessPoint> networks;
    networks.push_back(makeNetwork("Strong", "AA:BB:CC:00:00:01", 90));
    networks.push_back(makeNetwork("Weak", "AA:BB:CC:00:00:02", 15));
    networks[0].manufacturer = "Unknown Manufacturer";

    std::ostringstream rendered;
    monitor.buildTable(networks).render(rendered);
    std::string text = rendered.str();

    ASSERT_NE(text.find("Strong"), std::string::npos);
    EXPECT_LT(text.find("Strong"), text.find("Weak"));
    EXPECT_NE(text.find("\x1b[32m90%"), std::string::npos);
    EXPECT_NE(text.find("\x1b[31m15%"), std::string::npos);
    EXPECT_NE(text.find("History"), std::string::npos);
}

TEST(MonitorTest, EmptyScanShowsNoNetworks) {
    OuiDatabase oui;
    SignalHistory history;
    FakeScanner scanner;
    std::ostringstream out;

    Monitor monitor(scanner, oui, history, out);
    EXPECT_EQ(monitor.refresh(), 0u);
    EXPECT_NE(out.str().find("No networks found."), std::string::npos);
}

TEST(MonitorTest, RunStopsWhenRequested) {
    OuiDatabase oui;
    SignalHistory history;
    FakeScanner scanner;
    std::ostringstream out;
    volatile std::sig_atomic_t stop = 1;

    Monitor monitor(scanner, oui, history, out);
    monitor.run(5, stop);

    EXPECT_EQ(scanner.scans, 0);
    EXPECT_NE(out.str().find("Exiting..."), std::string::npos);
}
