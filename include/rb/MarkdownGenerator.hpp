/**
 * MarkdownGenerator.hpp - Render command groups as a markdown runbook
 */

#pragma once

#include "rb/CommandParser.hpp"
#include "rb/HistoryEntry.hpp"
#include "rb/IntentAnalyzer.hpp"

#include <string>
#include <vector>

namespace rb {

struct RunbookData {
    std::string title;
    Clock::time_point generated;
    std::string range;                       // e.g. "commands #10 to #42"
    std::vector<CommandGroup> groups;
    int redacted_count = 0;
    std::string ai_overview;                 // Empty = generate locally
    std::vector<std::string> ai_prerequisites;
};

class MarkdownGenerator {
public:
    explicit MarkdownGenerator(bool include_timestamps = false);
    
    std::string generate(const RunbookData& data) const;
    
    std::string generateOverview(const std::vector<CommandGroup>& groups) const;
    std::vector<std::string> inferPrerequisites(const std::vector<CommandGroup>& groups) const;
    
private:
    bool include_timestamps_;
    CommandParser parser_;
    
    std::string generateStep(int number, const CommandGroup& group) const;
};

// Readable name for a workflow intent, e.g. "git-sync" -> "Git synchronization"
std::string formatIntent(const std::string& intent);

// Writes a rendered runbook readable only by its owner, replacing any
// existing file and its mode. Returns false with `error` set on failure.
bool writeRunbookFile(const std::string& path, const std::string& content, std::string& error);

} // namespace rb
