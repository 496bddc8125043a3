/**
 * HistoryExtractor.hpp - Read numbered commands from zsh extended history
 */

#pragma once

#include "rb/HistoryEntry.hpp"

#include <string>
#include <vector>

namespace rb {

struct ExtractResult {
    std::vector<Entry> entries;
    bool success = false;
    std::string error;
};

class HistoryExtractor {
public:
    // path: zsh history file, usually defaultHistoryPath()
    explicit HistoryExtractor(std::string path);
    
    // Commands numbered from..to inclusive, numbered like `history` shows them
    ExtractResult extract(int from, int to) const;
    
    const std::string& path() const { return path_; }
    
    // ~/.zsh_history, empty when HOME is unset
    static std::string defaultHistoryPath();
    
private:
    std::string path_;
};

} // namespace rb
