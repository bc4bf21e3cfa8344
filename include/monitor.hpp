#pragma once
#include "oui_database.hpp"
#include "signal_history.hpp"
#include "table_renderer.hpp"
#include "wifi_scanner.hpp"
#include <csignal>
#include <cstddef>
#include <ostream>
#include <vector>

// The refreshing table view: scan, record history, enrich, draw, sleep.
class Monitor {
public:
    Monitor(WifiScanner& scanner, const OuiDatabase& oui, SignalHistory& history, std::ostream& out);

    // One cycle without the sleep. Returns the number of access points drawn.
    std::size_t refresh();

    // Repeats refresh() every intervalSeconds until stopRequested becomes
    // non-zero, then prints the exit notice.
    void run(int intervalSeconds, const volatile std::sig_atomic_t& stopRequested);

    TableRenderer buildTable(const std::vector<AccessPoint>& networks) const;

    void setClearScreen(bool clear) { clearScreen_ = clear; }

private:
    WifiScanner& scanner_;
    const OuiDatabase& oui_;
    SignalHistory& history_;
    std::ostream& out_;
    bool clearScreen_ = true;
};
