/**
 * IntentAnalyzer.hpp - Group commands into titled runbook steps
 */

#pragma once

#include "rb/CommandParser.hpp"
#include "rb/HistoryEntry.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace rb {

// Recognized sequence of commands, matched by command prefix
struct Workflow {
    std::string name;
    std::vector<std::string> prefixes;
    std::string description;
};

struct CommandGroup {
    std::string title;
    std::string description;
    std::vector<Entry> commands;
    std::string intent;       // Workflow name, empty when none matched
    std::string explanation;  // Only filled by AI enhancement
};

std::vector<Workflow> defaultWorkflows();

// Same tool, or both tools in one family (git/gh, kubectl/helm/k9s, ...)
bool areRelatedTools(const std::string& a, const std::string& b);

// Fallback step title for a tool, e.g. "Git operations"
std::string titleForTool(const std::string& tool);

class IntentAnalyzer {
public:
    static constexpr std::chrono::seconds DEFAULT_THRESHOLD{60};
    
    explicit IntentAnalyzer(std::chrono::seconds threshold = DEFAULT_THRESHOLD,
                            std::vector<Workflow> workflows = defaultWorkflows());
    
    std::vector<CommandGroup> analyze(const std::vector<Entry>& entries) const;
    
    // Name of the first workflow whose prefix starts the command
    std::string inferIntent(const std::string& command) const;
    
    // Title and description for a finished group
    CommandGroup finalizeGroup(std::vector<Entry> commands, std::string intent) const;
    
    const std::vector<Workflow>& workflows() const { return workflows_; }
    
private:
    std::chrono::seconds threshold_;
    std::vector<Workflow> workflows_;
    CommandParser parser_;
    
    bool hasTimeGap(const Entry& prev, const Entry& curr) const;
    std::string generateTitle(const std::vector<Entry>& commands) const;
};

} // namespace rb
