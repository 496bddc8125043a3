/**
 * EnhancementEngine.cpp - AI semantic deduplication and step explanations
 */

#include "rb/EnhancementEngine.hpp"
#include "rb/AnthropicClient.hpp"
#include "rb/Sanitizer.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rb {

static const char* DEDUP_SYSTEM_PROMPT = R"prompt(You are a command-line expert analyzing shell command sequences.
Your task is to identify semantically similar or duplicate commands that should be deduplicated.

Group commands that are:
- Exact duplicates
- Typo corrections (e.g., "git stauts" followed by "git status")
- Same command with minor flag variations that don't change intent
- Failed attempts followed by successful versions (keep the successful one)
- Repeated status checks (e.g., multiple "kubectl get pods" - keep the last one)

Do NOT group commands that are:
- Intentionally repeated for different purposes
- Similar but operating on different targets
- Part of a deliberate retry pattern with meaningful changes

Return a JSON object with this structure:
{
  "groups": [
    {
      "representative": 2,
      "indices": [0, 1, 2],
      "reason": "Typo correction: 'git stauts' corrected to 'git status'"
    }
  ]
}

Only include groups with more than one command. Commands not in any group will be kept as-is.
Use 0-based indices matching the input order. Values shown as <REDACTED> were removed on purpose.)prompt";

static const char* EXPLAIN_SYSTEM_PROMPT = R"prompt(You are a technical writer creating runbook documentation from shell command sequences.
Your task is to analyze commands and generate clear, actionable explanations.

For each group of commands, provide:
1. A concise title (3-7 words)
2. A description of what the commands do
3. The "why" - explain the purpose and when someone would need to do this
4. Optional notes about prerequisites, gotchas, or alternatives

Also provide:
- An overview summarizing what this entire runbook accomplishes
- A list of prerequisites (tools, access, permissions needed)

Return a JSON object with this structure:
{
  "overview": "This runbook guides you through deploying a containerized application to Kubernetes.",
  "prerequisites": ["kubectl configured", "Docker installed", "Access to container registry"],
  "steps": [
    {
      "title": "Build the Docker Image",
      "description": "Compile the application and create a container image.",
      "why": "The container image packages your application with all dependencies for consistent deployment across environments.",
      "notes": "Ensure you're in the project root directory before building."
    }
  ]
}

Return exactly one step per group, in group order.
Be practical and helpful. Focus on what engineers actually need to know.
Avoid generic filler text - every sentence should add value.)prompt";

namespace {

// Claude may wrap the object in prose or a code fence
bool extractJsonObject(const std::string& reply, json& object, std::string& error) {
    size_t start = reply.find('{');
    size_t end = reply.rfind('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        error = "no JSON object in response";
        return false;
    }
    
    try {
        object = json::parse(reply.substr(start, end - start + 1));
    } catch (const std::exception& e) {
        error = std::string("JSON parse error: ") + e.what();
        return false;
    }
    
    if (!object.is_object()) {
        error = "response is not a JSON object";
        return false;
    }
    return true;
}

} // namespace

DedupSuggestion parseDedupResponse(const std::string& reply) {
    DedupSuggestion suggestion;
    json object;
    if (!extractJsonObject(reply, object, suggestion.error)) {
        return suggestion;
    }
    
    try {
        if (object.contains("groups")) {
            for (const auto& item : object.at("groups")) {
                DedupGroup group;
                group.representative = item.at("representative").get<int>();
                group.indices = item.at("indices").get<std::vector<int>>();
                group.reason = item.value("reason", "");
                suggestion.groups.push_back(std::move(group));
            }
        }
    } catch (const std::exception& e) {
        suggestion.groups.clear();
        suggestion.error = std::string("unexpected dedup response: ") + e.what();
        return suggestion;
    }
    
    suggestion.success = true;
    return suggestion;
}

ExplanationResult parseExplanationResponse(const std::string& reply) {
    ExplanationResult result;
    json object;
    if (!extractJsonObject(reply, object, result.error)) {
        return result;
    }
    
    try {
        result.overview = object.value("overview", "");
        if (object.contains("prerequisites")) {
            result.prerequisites = object.at("prerequisites").get<std::vector<std::string>>();
        }
        if (object.contains("steps")) {
            for (const auto& item : object.at("steps")) {
                StepExplanation step;
                step.title = item.value("title", "");
                step.description = item.value("description", "");
                step.why = item.value("why", "");
                step.notes = item.value("notes", "");
                result.steps.push_back(std::move(step));
            }
        }
    } catch (const std::exception& e) {
        ExplanationResult failed;
        failed.error = std::string("unexpected explanation response: ") + e.what();
        return failed;
    }
    
    result.success = true;
    return result;
}

MergedEntries applyDedup(const std::vector<Entry>& entries, const DedupSuggestion& suggestion) {
    MergedEntries merged;
    std::set<int> removed;
    const int count = static_cast<int>(entries.size());
    
    for (const auto& group : suggestion.groups) {
        if (group.representative < 0 || group.representative >= count) {
            continue;
        }
        if (std::find(group.indices.begin(), group.indices.end(), group.representative) == group.indices.end()) {
            continue;
        }
        
        int dropped = 0;
        for (int index : group.indices) {
            if (index != group.representative && index >= 0 && index < count) {
                if (removed.insert(index).second) {
                    ++dropped;
                }
            }
        }
        if (dropped == 0) {
            continue;
        }
        
        merged.summaries.push_back(group.reason.empty()
            ? "Merged " + std::to_string(dropped + 1) + " commands into #"
                  + std::to_string(entries[group.representative].sequence_number)
            : group.reason);
    }
    
    for (int i = 0; i < count; ++i) {
        if (!removed.count(i)) {
            merged.entries.push_back(entries[i]);
        }
    }
    
    return merged;
}

std::vector<CommandGroup> enhanceGroups(const std::vector<CommandGroup>& groups,
                                        const ExplanationResult& explanations) {
    std::vector<CommandGroup> enhanced = groups;
    
    for (size_t i = 0; i < enhanced.size() && i < explanations.steps.size(); ++i) {
        const auto& step = explanations.steps[i];
        auto& group = enhanced[i];
        
        if (!step.title.empty()) {
            group.title = step.title;
        }
        if (!step.description.empty()) {
            group.description = step.description;
        }
        if (!step.notes.empty()) {
            group.description += (group.description.empty() ? "" : "\n\n");
            group.description += "**Note:** " + step.notes;
        }
        if (!step.why.empty()) {
            group.explanation = step.why;
        }
    }
    
    return enhanced;
}

EnhancementEngine::EnhancementEngine(AnthropicClient& client, const Sanitizer& sanitizer)
    : client_(client), sanitizer_(sanitizer) {}

EnhancementEngine::~EnhancementEngine() = default;

std::string EnhancementEngine::buildDedupPrompt(const std::vector<Entry>& entries) const {
    std::ostringstream prompt;
    prompt << "Analyze these commands for semantic duplicates:\n\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        prompt << i << ": " << sanitizer_.sanitizeText(entries[i].command) << "\n";
    }
    return prompt.str();
}

std::string EnhancementEngine::buildExplainPrompt(const std::vector<CommandGroup>& groups) const {
    std::ostringstream prompt;
    prompt << "Generate explanations for this command sequence:\n\n";
    for (size_t i = 0; i < groups.size(); ++i) {
        prompt << "## Group " << (i + 1);
        if (!groups[i].title.empty()) {
            prompt << ": " << groups[i].title;
        }
        prompt << "\n";
        for (const auto& entry : groups[i].commands) {
            prompt << "  $ " << sanitizer_.sanitizeText(entry.command) << "\n";
        }
        prompt << "\n";
    }
    return prompt.str();
}

bool EnhancementEngine::deduplicate(const std::vector<Entry>& entries, MergedEntries& merged,
                                    std::string& error) {
    if (entries.empty()) {
        merged = MergedEntries();
        return true;
    }
    
    auto response = client_.sendMessage(DEDUP_SYSTEM_PROMPT, buildDedupPrompt(entries));
    if (!response.success) {
        error = response.error;
        return false;
    }
    
    auto suggestion = parseDedupResponse(response.content);
    if (!suggestion.success) {
        error = suggestion.error;
        return false;
    }
    
    merged = applyDedup(entries, suggestion);
    return true;
}

bool EnhancementEngine::explain(const std::vector<CommandGroup>& groups, GroupNarrative& narrative,
                                std::string& error) {
    if (groups.empty()) {
        narrative = GroupNarrative();
        return true;
    }
    
    auto response = client_.sendMessage(EXPLAIN_SYSTEM_PROMPT, buildExplainPrompt(groups));
    if (!response.success) {
        error = response.error;
        return false;
    }
    
    auto explanations = parseExplanationResponse(response.content);
    if (!explanations.success) {
        error = explanations.error;
        return false;
    }
    
    narrative.groups = enhanceGroups(groups, explanations);
    narrative.overview = explanations.overview;
    narrative.prerequisites = explanations.prerequisites;
    return true;
}

} // namespace rb
