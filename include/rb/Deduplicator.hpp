/**
 * Deduplicator.hpp - Remove redundant commands while keeping meaningful repetition
 */

#pragma once

#include "rb/CommandParser.hpp"
#include "rb/HistoryEntry.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rb {

class Deduplicator {
public:
    static constexpr std::chrono::seconds DEFAULT_TIME_GAP{30};
    
    // Repeats further apart than time_gap are treated as intentional
    explicit Deduplicator(std::chrono::seconds time_gap = DEFAULT_TIME_GAP);
    
    std::vector<Entry> process(const std::vector<Entry>& entries) const;
    
    // True when `corrected` is a minor edit of `original`
    bool isTypoCorrection(const std::string& original, const std::string& corrected) const;
    
    std::chrono::seconds timeGap() const { return time_gap_; }
    
private:
    std::chrono::seconds time_gap_;
    CommandParser parser_;
    
    bool isExactDuplicate(const Entry& a, const Entry& b) const;
    bool hasSignificantGap(const Entry& a, const Entry& b) const;
    bool shouldCollapse(const std::string& a, const std::string& b) const;
};

// Classic edit distance with unit cost for insert, delete and substitute
int levenshteinDistance(const std::string& a, const std::string& b);

} // namespace rb
