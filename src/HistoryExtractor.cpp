/**
 * HistoryExtractor.cpp - Read numbered commands from zsh extended history
 *
 * Extended history lines look like ": 1700000000:0;git status". Multi-line
 * commands end each line with a backslash and continue on raw lines.
 */

#include "rb/HistoryExtractor.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <utility>

namespace rb {

namespace {

// Only the header prefix is matched. The command is the match suffix, since a
// regex run over a long command would recurse once per character.
const std::regex& headerPattern() {
    static const std::regex pattern(R"re(: ([0-9]{1,32}):[0-9]{1,32};)re");
    return pattern;
}

bool parseHeader(const std::string& line, std::smatch& match) {
    return std::regex_search(line, match, headerPattern(), std::regex_constants::match_continuous);
}

// Epoch seconds that fit the clock's duration, nanoseconds on most platforms
bool toTimePoint(const std::string& text, Clock::time_point& out) {
    static const long long max_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
    
    long long seconds = 0;
    try {
        seconds = std::stoll(text);
    } catch (const std::exception&) {
        return false;
    }
    if (seconds < 0 || seconds > max_seconds) {
        return false;
    }
    
    out = Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(seconds)));
    return true;
}

bool endsWithBackslash(const std::string& text) {
    return !text.empty() && text.back() == '\\';
}

} // namespace

HistoryExtractor::HistoryExtractor(std::string path) : path_(std::move(path)) {}

std::string HistoryExtractor::defaultHistoryPath() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.zsh_history";
}

ExtractResult HistoryExtractor::extract(int from, int to) const {
    ExtractResult result;
    
    if (from > to) {
        result.error = "invalid range: 'from' must be less than or equal to 'to'";
        return result;
    }
    
    std::error_code ec;
    if (path_.empty() || !std::filesystem::exists(path_, ec)) {
        result.error = "zsh history file not found at " + (path_.empty() ? std::string("~/.zsh_history") : path_);
        return result;
    }
    
    std::ifstream file(path_);
    if (!file.is_open()) {
        result.error = "cannot read history file " + path_;
        return result;
    }
    
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    if (file.bad()) {
        result.error = "cannot read history file " + path_;
        return result;
    }
    
    int command_number = 0;
    std::smatch match;
    
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!parseHeader(lines[i], match)) {
            continue;
        }
        
        ++command_number;
        std::string timestamp_text = match[1].str();
        std::string command = match.suffix().str();
        
        std::smatch next;
        while (endsWithBackslash(command) && i + 1 < lines.size()
               && !parseHeader(lines[i + 1], next)) {
            command.pop_back();
            command += "\n" + lines[++i];
        }
        
        if (command_number < from) {
            continue;
        }
        if (command_number > to) {
            break;
        }
        
        Entry entry;
        entry.sequence_number = command_number;
        entry.command = std::move(command);
        
        entry.has_timestamp = toTimePoint(timestamp_text, entry.timestamp);
        
        result.entries.push_back(std::move(entry));
    }
    
    if (result.entries.empty()) {
        result.error = "no commands found in range " + std::to_string(from) + "-" + std::to_string(to);
        return result;
    }
    
    result.success = true;
    return result;
}

} // namespace rb
