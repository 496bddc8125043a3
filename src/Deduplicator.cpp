/**
 * Deduplicator.cpp - Remove redundant commands while keeping meaningful repetition
 */

#include "rb/Deduplicator.hpp"

#include <algorithm>

namespace rb {

static const size_t MAX_LENGTH_DIFFERENCE = 5;
static const int MIN_EDIT_THRESHOLD = 2;
static const int MAX_EDIT_THRESHOLD = 5;

namespace {

bool isBlank(const std::string& command) {
    return CommandParser::trim(command).empty();
}

} // namespace

Deduplicator::Deduplicator(std::chrono::seconds time_gap)
    : time_gap_(time_gap) {}

std::vector<Entry> Deduplicator::process(const std::vector<Entry>& entries) const {
    std::vector<Entry> result;
    
    for (size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];
        
        if (isBlank(entry.command)) {
            continue;
        }
        
        if (result.empty()) {
            result.push_back(entry);
            continue;
        }
        
        const Entry& prev = result.back();
        
        if (isExactDuplicate(prev, entry)) {
            if (hasSignificantGap(prev, entry)) {
                result.push_back(entry);
            } else {
                // Quick repeats collapse onto the latest occurrence
                result.back() = entry;
            }
            continue;
        }
        
        if (isTypoCorrection(prev.command, entry.command)) {
            result.back() = entry;
            continue;
        }
        
        if (shouldCollapse(prev.command, entry.command)) {
            result.back() = entry;
            continue;
        }
        
        // Drop a command that the next processed command corrects
        size_t next = i + 1;
        while (next < entries.size() && isBlank(entries[next].command)) {
            ++next;
        }
        if (next < entries.size() && isTypoCorrection(entry.command, entries[next].command)) {
            continue;
        }
        
        result.push_back(entry);
    }
    
    return result;
}

bool Deduplicator::isExactDuplicate(const Entry& a, const Entry& b) const {
    return CommandParser::trim(a.command) == CommandParser::trim(b.command);
}

bool Deduplicator::hasSignificantGap(const Entry& a, const Entry& b) const {
    if (!a.has_timestamp || !b.has_timestamp) {
        return false;
    }
    return (b.timestamp - a.timestamp) > time_gap_;
}

bool Deduplicator::isTypoCorrection(const std::string& original, const std::string& corrected) const {
    std::string a = CommandParser::trim(original);
    std::string b = CommandParser::trim(corrected);
    
    size_t length_diff = a.size() > b.size() ? a.size() - b.size() : b.size() - a.size();
    if (length_diff > MAX_LENGTH_DIFFERENCE) {
        return false;
    }
    
    int distance = levenshteinDistance(a, b);
    
    // 2 edits for short commands, scaling with length up to 5
    int max_len = static_cast<int>(std::max(a.size(), b.size()));
    int threshold = std::clamp(max_len / 10, MIN_EDIT_THRESHOLD, MAX_EDIT_THRESHOLD);
    
    return distance > 0 && distance <= threshold;
}

bool Deduplicator::shouldCollapse(const std::string& a, const std::string& b) const {
    if (parser_.isDirectoryChange(a) && parser_.isDirectoryChange(b)) {
        return true;
    }
    
    std::string a_var = parser_.assignedVariable(a);
    if (a_var.empty()) {
        return false;
    }
    return a_var == parser_.assignedVariable(b);
}

int levenshteinDistance(const std::string& a, const std::string& b) {
    if (a.empty()) return static_cast<int>(b.size());
    if (b.empty()) return static_cast<int>(a.size());
    
    std::vector<std::vector<int>> matrix(a.size() + 1, std::vector<int>(b.size() + 1, 0));
    for (size_t i = 0; i <= a.size(); ++i) {
        matrix[i][0] = static_cast<int>(i);
    }
    for (size_t j = 0; j <= b.size(); ++j) {
        matrix[0][j] = static_cast<int>(j);
    }
    
    for (size_t i = 1; i <= a.size(); ++i) {
        for (size_t j = 1; j <= b.size(); ++j) {
            int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            matrix[i][j] = std::min({
                matrix[i - 1][j] + 1,         // deletion
                matrix[i][j - 1] + 1,         // insertion
                matrix[i - 1][j - 1] + cost   // substitution
            });
        }
    }
    
    return matrix[a.size()][b.size()];
}

} // namespace rb
