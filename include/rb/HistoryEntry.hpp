/**
 * HistoryEntry.hpp - A single command taken from shell history
 */

#pragma once

#include <chrono>
#include <string>

namespace rb {

using Clock = std::chrono::system_clock;

struct Entry {
    int sequence_number = 0;       // Matches the number shown by `history`
    Clock::time_point timestamp;   // Only meaningful when has_timestamp is set
    std::string command;
    bool has_timestamp = false;
};

} // namespace rb
