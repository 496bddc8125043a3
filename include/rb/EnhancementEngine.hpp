/**
 * EnhancementEngine.hpp - AI semantic deduplication and step explanations
 */

#pragma once

#include "rb/HistoryEntry.hpp"
#include "rb/IntentAnalyzer.hpp"
#include "rb/Pipeline.hpp"

#include <string>
#include <vector>

namespace rb {

class AnthropicClient;
class Sanitizer;

// Commands the model considers one logical command
struct DedupGroup {
    int representative = -1;   // 0-based index of the command to keep
    std::vector<int> indices;  // All members, representative included
    std::string reason;
};

struct DedupSuggestion {
    std::vector<DedupGroup> groups;
    bool success = false;
    std::string error;
};

struct StepExplanation {
    std::string title;
    std::string description;
    std::string why;
    std::string notes;
};

struct ExplanationResult {
    std::string overview;
    std::vector<std::string> prerequisites;
    std::vector<StepExplanation> steps;
    bool success = false;
    std::string error;
};

// Parses the JSON object embedded in a model reply
DedupSuggestion parseDedupResponse(const std::string& reply);
ExplanationResult parseExplanationResponse(const std::string& reply);

// Drops every non-representative member of each valid group
MergedEntries applyDedup(const std::vector<Entry>& entries, const DedupSuggestion& suggestion);

// Step i relabels group i; empty fields keep the local value
std::vector<CommandGroup> enhanceGroups(const std::vector<CommandGroup>& groups,
                                        const ExplanationResult& explanations);

class EnhancementEngine {
public:
    // Commands pass through `sanitizer` before they are sent anywhere
    EnhancementEngine(AnthropicClient& client, const Sanitizer& sanitizer);
    ~EnhancementEngine();
    
    bool deduplicate(const std::vector<Entry>& entries, MergedEntries& merged, std::string& error);
    bool explain(const std::vector<CommandGroup>& groups, GroupNarrative& narrative, std::string& error);
    
    std::string buildDedupPrompt(const std::vector<Entry>& entries) const;
    std::string buildExplainPrompt(const std::vector<CommandGroup>& groups) const;
    
private:
    AnthropicClient& client_;
    const Sanitizer& sanitizer_;
};

} // namespace rb
