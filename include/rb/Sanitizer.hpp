/**
 * Sanitizer.hpp - Mask or remove secrets from commands
 */

#pragma once

#include "rb/HistoryEntry.hpp"
#include "rb/Patterns.hpp"

#include <optional>
#include <string>
#include <vector>

namespace rb {

// One applied rule on one entry
struct Redaction {
    int sequence_number;
    std::string pattern_name;
    std::optional<std::string> original;  // Only set in strict mode
};

struct SanitizeResult {
    std::vector<Entry> entries;
    std::vector<Redaction> redactions;
};

class Sanitizer {
public:
    static const std::string REMOVED_PLACEHOLDER;
    
    // strict_mode keeps original commands in redactions for review
    explicit Sanitizer(bool strict_mode = false);
    Sanitizer(std::vector<Pattern> patterns, bool strict_mode);
    
    SanitizeResult process(const std::vector<Entry>& entries) const;
    
    // Best-effort scrub of a single string, for prompts and ad-hoc use
    std::string sanitizeText(const std::string& command) const;
    
    bool strictMode() const { return strict_mode_; }
    const std::vector<Pattern>& patterns() const { return patterns_; }
    
private:
    const std::vector<Pattern> patterns_;
    const bool strict_mode_;
    
    // Returns false when the entry must be dropped
    bool sanitizeEntry(const Entry& entry, Entry& sanitized, std::vector<Redaction>& redactions) const;
    Redaction makeRedaction(const Entry& entry, const Pattern& pattern) const;
};

} // namespace rb
