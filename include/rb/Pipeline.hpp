/**
 * Pipeline.hpp - Deduplicate, sanitize and group commands in a fixed order
 *
 * Optional hooks may replace the deduplication result or relabel the final
 * groups. A hook result is used only when it keeps the local contract;
 * otherwise the local result stands and a warning is recorded.
 */

#pragma once

#include "rb/Deduplicator.hpp"
#include "rb/HistoryEntry.hpp"
#include "rb/IntentAnalyzer.hpp"
#include "rb/Patterns.hpp"
#include "rb/Sanitizer.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace rb {

// Entries kept by a semantic merge, one summary per merged set
struct MergedEntries {
    std::vector<Entry> entries;
    std::vector<std::string> summaries;
};

// Relabeled groups plus runbook-level text
struct GroupNarrative {
    std::vector<CommandGroup> groups;
    std::string overview;
    std::vector<std::string> prerequisites;
};

// Hooks return false and set the error string on failure
using DedupHook = std::function<bool(const std::vector<Entry>&, MergedEntries&, std::string&)>;
using NarrativeHook = std::function<bool(const std::vector<CommandGroup>&, GroupNarrative&, std::string&)>;

struct PipelineOptions {
    std::chrono::seconds dedup_gap = Deduplicator::DEFAULT_TIME_GAP;
    std::chrono::seconds group_gap = IntentAnalyzer::DEFAULT_THRESHOLD;
    bool strict = false;
    std::vector<PatternSpec> extra_patterns;  // Appended after the built-in rules
    std::vector<Workflow> workflows = defaultWorkflows();
};

struct PipelineResult {
    std::vector<Entry> deduplicated;
    std::vector<Entry> sanitized;
    std::vector<Redaction> redactions;
    std::vector<CommandGroup> groups;
    std::vector<std::string> merge_summaries;
    std::string overview;
    std::vector<std::string> prerequisites;
    std::vector<std::string> warnings;
    bool semantic_dedup_applied = false;
    bool narrative_applied = false;
};

class Pipeline {
public:
    // Throws std::invalid_argument when a pattern cannot be built
    explicit Pipeline(const PipelineOptions& options = PipelineOptions());
    
    PipelineResult run(const std::vector<Entry>& entries) const;
    
    void setDedupHook(DedupHook hook) { dedup_hook_ = std::move(hook); }
    void setNarrativeHook(NarrativeHook hook) { narrative_hook_ = std::move(hook); }
    
    const Sanitizer& sanitizer() const { return sanitizer_; }
    
private:
    Deduplicator deduplicator_;
    Sanitizer sanitizer_;
    IntentAnalyzer analyzer_;
    DedupHook dedup_hook_;
    NarrativeHook narrative_hook_;
    
    std::vector<Entry> deduplicate(const std::vector<Entry>& entries, PipelineResult& result) const;
    void narrate(PipelineResult& result) const;
};

// True when `output` is an order-preserving subsequence of `input` with
// unchanged sequence numbers and command text
bool isOrderedSubsequence(const std::vector<Entry>& input, const std::vector<Entry>& output);

// True when both lists partition the same entries the same way
bool samePartition(const std::vector<CommandGroup>& a, const std::vector<CommandGroup>& b);

} // namespace rb
