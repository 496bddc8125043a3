/**
 * Pipeline.cpp - Deduplicate, sanitize and group commands in a fixed order
 */

#include "rb/Pipeline.hpp"

#include <algorithm>
#include <utility>

namespace rb {

namespace {

std::vector<Pattern> patternsFor(const PipelineOptions& options) {
    auto specs = defaultPatternSpecs();
    specs.insert(specs.end(), options.extra_patterns.begin(), options.extra_patterns.end());
    return buildPatterns(specs);
}

bool sameEntry(const Entry& a, const Entry& b) {
    return a.sequence_number == b.sequence_number && a.command == b.command;
}

bool isBlank(const Entry& entry) {
    return CommandParser::trim(entry.command).empty();
}

} // namespace

bool isOrderedSubsequence(const std::vector<Entry>& input, const std::vector<Entry>& output) {
    size_t i = 0;
    for (const auto& entry : output) {
        while (i < input.size() && input[i].sequence_number != entry.sequence_number) {
            ++i;
        }
        if (i == input.size() || !sameEntry(input[i], entry)) {
            return false;
        }
        ++i;
    }
    return true;
}

bool samePartition(const std::vector<CommandGroup>& a, const std::vector<CommandGroup>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        const auto& left = a[i].commands;
        const auto& right = b[i].commands;
        if (left.size() != right.size()
            || !std::equal(left.begin(), left.end(), right.begin(), sameEntry)) {
            return false;
        }
    }
    return true;
}

Pipeline::Pipeline(const PipelineOptions& options)
    : deduplicator_(options.dedup_gap),
      sanitizer_(patternsFor(options), options.strict),
      analyzer_(options.group_gap, options.workflows) {}

PipelineResult Pipeline::run(const std::vector<Entry>& entries) const {
    PipelineResult result;
    
    result.deduplicated = deduplicate(entries, result);
    
    auto sanitized = sanitizer_.process(result.deduplicated);
    result.sanitized = std::move(sanitized.entries);
    result.redactions = std::move(sanitized.redactions);
    
    result.groups = analyzer_.analyze(result.sanitized);
    
    narrate(result);
    
    return result;
}

std::vector<Entry> Pipeline::deduplicate(const std::vector<Entry>& entries, PipelineResult& result) const {
    if (dedup_hook_ && !entries.empty()) {
        MergedEntries merged;
        std::string error;
        
        if (!dedup_hook_(entries, merged, error)) {
            result.warnings.push_back("AI deduplication failed, using standard deduplication: " + error);
        } else if (!isOrderedSubsequence(entries, merged.entries)) {
            result.warnings.push_back("AI deduplication reordered or altered commands, using standard deduplication");
        } else {
            merged.entries.erase(std::remove_if(merged.entries.begin(), merged.entries.end(), isBlank),
                                 merged.entries.end());
            result.merge_summaries = std::move(merged.summaries);
            result.semantic_dedup_applied = true;
            return merged.entries;
        }
    }
    
    return deduplicator_.process(entries);
}

void Pipeline::narrate(PipelineResult& result) const {
    if (!narrative_hook_ || result.groups.empty()) {
        return;
    }
    
    GroupNarrative narrative;
    std::string error;
    
    if (!narrative_hook_(result.groups, narrative, error)) {
        result.warnings.push_back("AI explanation generation failed: " + error);
        return;
    }
    if (!samePartition(result.groups, narrative.groups)) {
        result.warnings.push_back("AI explanations changed the step layout, keeping local titles");
        return;
    }
    
    result.groups = std::move(narrative.groups);
    result.overview = std::move(narrative.overview);
    result.prerequisites = std::move(narrative.prerequisites);
    result.narrative_applied = true;
}

} // namespace rb
