#pragma once
#include "config.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>

// Most recent signal readings per BSSID, oldest evicted first once a
// sequence holds `capacity` samples. Entries live as long as the tracker.
class SignalHistory {
public:
    explicit SignalHistory(std::size_t capacity = kHistoryCapacity);

    void record(const std::string& bssid, int signal);

    // Empty for addresses never recorded.
    const std::deque<int>& samples(const std::string& bssid) const;

    // Exactly capacity() glyphs: one bar per sample, left to right, then
    // blanks for the slots not yet filled.
    std::string render(const std::string& bssid, bool colored = true) const;

    std::size_t capacity() const { return capacity_; }
    std::size_t trackedCount() const { return history_.size(); }

    static const char* glyphFor(int signal);

private:
    std::size_t capacity_;
    std::unordered_map<std::string, std::deque<int>> history_;
};
