#include "signal_history.hpp"
#include "signal_color.hpp"
#include <stdexcept>

namespace {

const char* const kBars[] = {"▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"};
constexpr int kBarCount = sizeof(kBars) / sizeof(kBars[0]);

const std::deque<int> kNoSamples;

}

SignalHistory::SignalHistory(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("signal history capacity must be positive");
    }
}

void SignalHistory::record(const std::string& bssid, int signal) {
    std::deque<int>& samples = history_[bssid];
    samples.push_back(signal);
    while (samples.size() > capacity_) {
        samples.pop_front();
    }
}

const std::deque<int>& SignalHistory::samples(const std::string& bssid) const {
    auto it = history_.find(bssid);
    return it != history_.end() ? it->second : kNoSamples;
}

const char* SignalHistory::glyphFor(int signal) {
    if (signal <= 0) return kBars[0];
    if (signal >= 100) return kBars[kBarCount - 1];
    return kBars[signal * kBarCount / 100];
}

std::string SignalHistory::render(const std::string& bssid, bool colored) const {
    const std::deque<int>& readings = samples(bssid);
    std::string line;
    for (int signal : readings) {
        if (colored) {
            line += colorize(glyphFor(signal), signalBand(signal));
        } else {
            line += glyphFor(signal);
        }
    }
    line.append(capacity_ - readings.size(), ' ');
    return line;
}
