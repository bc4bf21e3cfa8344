#include "nl80211_scanner.hpp"
#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <net/if.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <unistd.h>
#include <ifaddrs.h>

namespace {

struct SocketDeleter {
    void operator()(nl_sock* sock) const { nl_socket_free(sock); }
};
struct CallbackDeleter {
    void operator()(nl_cb* cb) const { nl_cb_put(cb); }
};
struct MessageDeleter {
    void operator()(nl_msg* msg) const { nlmsg_free(msg); }
};

using SocketPtr = std::unique_ptr<nl_sock, SocketDeleter>;
using CallbackPtr = std::unique_ptr<nl_cb, CallbackDeleter>;
using MessagePtr = std::unique_ptr<nl_msg, MessageDeleter>;

using Clock = std::chrono::steady_clock;

// status: 1 while the request is pending, 0 once acked or finished,
// a negative errno when the kernel rejected it.
struct Request {
    int status = 1;
};

struct ScanEvents {
    Request request;
    bool finished = false;
    bool aborted = false;
};

struct DumpResults {
    Request request;
    std::vector<AccessPoint> networks;
};

int onFinish(nl_msg*, void* arg) {
    static_cast<Request*>(arg)->status = 0;
    return NL_SKIP;
}

int onAck(nl_msg*, void* arg) {
    static_cast<Request*>(arg)->status = 0;
    return NL_STOP;
}

int onError(sockaddr_nl*, nlmsgerr* err, void* arg) {
    static_cast<Request*>(arg)->status = err->error;
    return NL_STOP;
}

// Multicast events carry sequence number 0.
int acceptAnySequence(nl_msg*, void*) {
    return NL_OK;
}

int onScanEvent(nl_msg* msg, void* arg) {
    ScanEvents* events = static_cast<ScanEvents*>(arg);
    genlmsghdr* gnlh = static_cast<genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));

    if (gnlh->cmd == NL80211_CMD_NEW_SCAN_RESULTS) {
        events->finished = true;
    } else if (gnlh->cmd == NL80211_CMD_SCAN_ABORTED) {
        events->finished = true;
        events->aborted = true;
    }
    return NL_SKIP;
}

int onScanResult(nl_msg* msg, void* arg) {
    DumpResults* results = static_cast<DumpResults*>(arg);
    genlmsghdr* gnlh = static_cast<genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    nlattr* tb[NL80211_ATTR_MAX + 1];
    nlattr* bss[NL80211_BSS_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0), genlmsg_attrlen(gnlh, 0), NULL);
    if (!tb[NL80211_ATTR_BSS] || nla_parse_nested(bss, NL80211_BSS_MAX, tb[NL80211_ATTR_BSS], NULL)) {
        return NL_SKIP;
    }
    if (!bss[NL80211_BSS_BSSID] || nla_len(bss[NL80211_BSS_BSSID]) < 6) {
        return NL_SKIP;
    }

    AccessPoint network;
    network.bssid = formatBssid(static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_BSSID])));

    if (bss[NL80211_BSS_SIGNAL_MBM]) {
        int32_t mbm = static_cast<int32_t>(nla_get_u32(bss[NL80211_BSS_SIGNAL_MBM]));
        network.signal = signalPercentFromDbm(mbm / 100);
    }
    if (bss[NL80211_BSS_FREQUENCY]) {
        network.channel = channelFromFrequency(nla_get_u32(bss[NL80211_BSS_FREQUENCY]));
    }
    if (bss[NL80211_BSS_INFORMATION_ELEMENTS]) {
        network.ssid = ssidFromInformationElements(
            static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_INFORMATION_ELEMENTS])),
            nla_len(bss[NL80211_BSS_INFORMATION_ELEMENTS]));
    }

    results->networks.push_back(network);
    return NL_SKIP;
}

// Reads until done() holds. Returns 0, a negative libnl error, or
// -NLE_AGAIN once the deadline passes.
template <typename Done>
int receiveUntil(nl_sock* sock, nl_cb* cb, Clock::time_point deadline, Done done) {
    while (!done()) {
        if (Clock::now() >= deadline) {
            return -NLE_AGAIN;
        }
        int ret = nl_recvmsgs(sock, cb);
        if (ret < 0) {
            return ret;
        }
    }
    return 0;
}

MessagePtr makeRequest(int family, int flags, uint8_t command, int ifIndex) {
    MessagePtr msg(nlmsg_alloc());
    if (!msg) {
        return msg;
    }
    if (!genlmsg_put(msg.get(), NL_AUTO_PORT, NL_AUTO_SEQ, family, 0, flags, command, 0) ||
        nla_put_u32(msg.get(), NL80211_ATTR_IFINDEX, ifIndex) < 0) {
        msg.reset();
    }
    return msg;
}

}

std::string findWirelessInterface() {
    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        spdlog::warn("[Scanner] getifaddrs failed, assuming wlan0");
        return "wlan0";
    }

    std::string interface;
    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == nullptr) continue;

        std::string name(ifa->ifa_name);
        if (name.find("wlan") == 0 || name.find("wlp") == 0 ||
            name.find("wlo") == 0 || name.find("wlx") == 0) {
            interface = name;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return interface.empty() ? "wlan0" : interface;
}

std::string formatBssid(const uint8_t* mac) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (int i = 0; i < 6; i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

std::string ssidFromInformationElements(const uint8_t* ie, int length) {
    for (int i = 0; i + 1 < length; ) {
        uint8_t id = ie[i];
        uint8_t len = ie[i + 1];
        if (i + 2 + len > length) break;

        if (id == 0) {
            return len <= 32 ? std::string(reinterpret_cast<const char*>(&ie[i + 2]), len) : "";
        }
        i += 2 + len;
    }
    return "";
}

Nl80211Scanner::Nl80211Scanner(std::chrono::seconds timeout) : timeout_(timeout) {}

std::vector<AccessPoint> Nl80211Scanner::scanNetworks() {
    if (geteuid() != 0) {
        spdlog::error("[Scanner] nl80211 scanning requires root privileges");
        return {};
    }

    SocketPtr sock(nl_socket_alloc());
    if (!sock) {
        spdlog::error("[Scanner] Failed to allocate netlink socket");
        return {};
    }
    if (genl_connect(sock.get()) < 0) {
        spdlog::error("[Scanner] Failed to connect to generic netlink");
        return {};
    }

    int family = genl_ctrl_resolve(sock.get(), "nl80211");
    if (family < 0) {
        spdlog::error("[Scanner] nl80211 not found (kernel might be too old or WiFi not available)");
        return {};
    }
    int scanGroup = genl_ctrl_resolve_grp(sock.get(), "nl80211", "scan");
    if (scanGroup < 0 || nl_socket_add_membership(sock.get(), scanGroup) < 0) {
        spdlog::error("[Scanner] Cannot subscribe to nl80211 scan events");
        return {};
    }

    // bound each blocking read so a silent kernel cannot stall the monitor
    timeval readTimeout = {static_cast<time_t>(timeout_.count()), 0};
    if (setsockopt(nl_socket_get_fd(sock.get()), SOL_SOCKET, SO_RCVTIMEO, &readTimeout, sizeof(readTimeout)) < 0) {
        spdlog::warn("[Scanner] Cannot set netlink read timeout: {}", std::strerror(errno));
    }

    std::string interface = findWirelessInterface();
    int ifIndex = if_nametoindex(interface.c_str());
    if (ifIndex == 0) {
        spdlog::error("[Scanner] Wireless interface {} not found", interface);
        return {};
    }
    spdlog::debug("[Scanner] Using wireless interface: {}", interface);

    const Clock::time_point deadline = Clock::now() + timeout_;

    ScanEvents events;
    CallbackPtr eventCb(nl_cb_alloc(NL_CB_DEFAULT));
    MessagePtr trigger = makeRequest(family, 0, NL80211_CMD_TRIGGER_SCAN, ifIndex);
    if (!eventCb || !trigger) {
        spdlog::error("[Scanner] Failed to allocate netlink scan request");
        return {};
    }
    nl_cb_err(eventCb.get(), NL_CB_CUSTOM, onError, &events.request);
    nl_cb_set(eventCb.get(), NL_CB_ACK, NL_CB_CUSTOM, onAck, &events.request);
    nl_cb_set(eventCb.get(), NL_CB_SEQ_CHECK, NL_CB_CUSTOM, acceptAnySequence, nullptr);
    nl_cb_set(eventCb.get(), NL_CB_VALID, NL_CB_CUSTOM, onScanEvent, &events);

    if (nl_send_auto(sock.get(), trigger.get()) < 0) {
        spdlog::error("[Scanner] Failed to send scan trigger");
        return {};
    }

    int ret = receiveUntil(sock.get(), eventCb.get(), deadline,
                           [&events]() { return events.request.status <= 0; });
    if (ret < 0) {
        spdlog::error("[Scanner] Scan trigger got no answer: {}", nl_geterror(ret));
        return {};
    }
    // -EBUSY: a scan is already running; its completion event still arrives
    if (events.request.status < 0 && events.request.status != -EBUSY) {
        spdlog::error("[Scanner] Scan trigger failed with error: {}", events.request.status);
        return {};
    }

    ret = receiveUntil(sock.get(), eventCb.get(), deadline, [&events]() { return events.finished; });
    if (ret < 0) {
        spdlog::warn("[Scanner] No scan-complete event ({}), dumping cached results", nl_geterror(ret));
    } else if (events.aborted) {
        spdlog::warn("[Scanner] Scan aborted by the kernel, dumping cached results");
    }

    // queued scan events may still precede the dump replies
    if (nl_socket_drop_membership(sock.get(), scanGroup) < 0) {
        spdlog::debug("[Scanner] Cannot leave nl80211 scan group");
    }

    DumpResults results;
    CallbackPtr dumpCb(nl_cb_alloc(NL_CB_DEFAULT));
    MessagePtr dump = makeRequest(family, NLM_F_DUMP, NL80211_CMD_GET_SCAN, ifIndex);
    if (!dumpCb || !dump) {
        spdlog::error("[Scanner] Failed to allocate netlink dump request");
        return {};
    }
    nl_cb_err(dumpCb.get(), NL_CB_CUSTOM, onError, &results.request);
    nl_cb_set(dumpCb.get(), NL_CB_FINISH, NL_CB_CUSTOM, onFinish, &results.request);
    nl_cb_set(dumpCb.get(), NL_CB_SEQ_CHECK, NL_CB_CUSTOM, acceptAnySequence, nullptr);
    nl_cb_set(dumpCb.get(), NL_CB_VALID, NL_CB_CUSTOM, onScanResult, &results);

    if (nl_send_auto(sock.get(), dump.get()) < 0) {
        spdlog::error("[Scanner] Failed to request scan results");
        return {};
    }

    ret = receiveUntil(sock.get(), dumpCb.get(), Clock::now() + timeout_,
                       [&results]() { return results.request.status <= 0; });
    if (ret < 0 || results.request.status < 0) {
        spdlog::error("[Scanner] Reading scan results failed: {}",
                      ret < 0 ? nl_geterror(ret) : std::strerror(-results.request.status));
        return {};
    }

    sortBySignal(results.networks);
    spdlog::debug("[Scanner] nl80211 reported {} access points", results.networks.size());
    return results.networks;
}
