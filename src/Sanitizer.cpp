/**
 * Sanitizer.cpp - Mask or remove secrets from commands
 */

#include "rb/Sanitizer.hpp"

#include <regex>
#include <string>
#include <utility>

namespace rb {

namespace {

// Enough passes to cover a secret several times longer than a rule's bound
constexpr int MAX_MASK_PASSES = 8;

// Reapplies a mask until the text stops changing, so a value longer than
// the rule's bounded run is masked in full rather than leaving a tail
std::string applyMask(const std::string& text, const Pattern& pattern) {
    std::string current = text;
    for (int pass = 0; pass < MAX_MASK_PASSES; ++pass) {
        std::string next = std::regex_replace(current, pattern.matcher, pattern.replacement);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

} // namespace

const std::string Sanitizer::REMOVED_PLACEHOLDER = "[REDACTED - contains sensitive data]";

Sanitizer::Sanitizer(bool strict_mode)
    : patterns_(defaultPatterns()), strict_mode_(strict_mode) {}

Sanitizer::Sanitizer(std::vector<Pattern> patterns, bool strict_mode)
    : patterns_(std::move(patterns)), strict_mode_(strict_mode) {}

SanitizeResult Sanitizer::process(const std::vector<Entry>& entries) const {
    SanitizeResult result;
    
    for (const auto& entry : entries) {
        Entry sanitized;
        std::vector<Redaction> entry_redactions;
        
        if (sanitizeEntry(entry, sanitized, entry_redactions)) {
            result.entries.push_back(std::move(sanitized));
        }
        
        result.redactions.insert(result.redactions.end(),
                                 entry_redactions.begin(), entry_redactions.end());
    }
    
    return result;
}

bool Sanitizer::sanitizeEntry(const Entry& entry, Entry& sanitized,
                              std::vector<Redaction>& redactions) const {
    std::string command = entry.command;
    
    for (const auto& pattern : patterns_) {
        if (!std::regex_search(command, pattern.matcher)) {
            continue;
        }
        
        if (pattern.full_remove) {
            // One redaction stands for the whole command
            redactions.clear();
            redactions.push_back(makeRedaction(entry, pattern));
            return false;
        }
        
        std::string replaced = applyMask(command, pattern);
        if (replaced != command) {
            redactions.push_back(makeRedaction(entry, pattern));
            command = std::move(replaced);
        }
    }
    
    sanitized = entry;
    sanitized.command = command;
    return true;
}

Redaction Sanitizer::makeRedaction(const Entry& entry, const Pattern& pattern) const {
    Redaction redaction{entry.sequence_number, pattern.name, std::nullopt};
    if (strict_mode_) {
        redaction.original = entry.command;
    }
    return redaction;
}

std::string Sanitizer::sanitizeText(const std::string& command) const {
    std::string text = command;
    for (const auto& pattern : patterns_) {
        if (pattern.full_remove) {
            if (std::regex_search(text, pattern.matcher)) {
                return REMOVED_PLACEHOLDER;
            }
            continue;
        }
        text = applyMask(text, pattern);
    }
    return text;
}

} // namespace rb
