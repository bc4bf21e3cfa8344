#pragma once
#include "process.hpp"
#include "wifi_scanner.hpp"
#include <string>
#include <vector>

// Scanner that shells out to a listing utility and parses what it prints.
class CommandScanner : public WifiScanner {
public:
    std::vector<AccessPoint> scanNetworks() override;

    const std::string& commandLine() const { return commandLine_; }

protected:
    CommandScanner(std::string commandLine, CommandRunner runner);

    virtual std::vector<AccessPoint> parse(const std::string& output) const = 0;

private:
    std::string commandLine_;
    CommandRunner runner_;
};

// Linux: NetworkManager's nmcli, columns SSID BSSID SIGNAL CHAN.
class NmcliScanner : public CommandScanner {
public:
    explicit NmcliScanner(CommandRunner runner = runCommand);

    std::string name() const override { return "nmcli"; }

    static std::vector<AccessPoint> parseOutput(const std::string& output);

protected:
    std::vector<AccessPoint> parse(const std::string& output) const override { return parseOutput(output); }
};

// macOS: the private airport utility, columns SSID BSSID RSSI CHANNEL ...
class AirportScanner : public CommandScanner {
public:
    explicit AirportScanner(CommandRunner runner = runCommand);

    std::string name() const override { return "airport"; }

    static std::vector<AccessPoint> parseOutput(const std::string& output);

protected:
    std::vector<AccessPoint> parse(const std::string& output) const override { return parseOutput(output); }
};

// Windows: "key : value" blocks from netsh, one record per Channel line.
class NetshScanner : public CommandScanner {
public:
    explicit NetshScanner(CommandRunner runner = runCommand);

    std::string name() const override { return "netsh"; }

    static std::vector<AccessPoint> parseOutput(const std::string& output);

protected:
    std::vector<AccessPoint> parse(const std::string& output) const override { return parseOutput(output); }
};
