/**
 * Patterns.hpp - Ordered secret detection rules used by the Sanitizer
 */

#pragma once

#include <regex>
#include <string>
#include <vector>

namespace rb {

// Uncompiled rule description
struct PatternSpec {
    std::string name;
    std::string matcher;       // ECMAScript regular expression
    std::string replacement;   // May reference capture groups as $1, $2...
    bool full_remove = false;  // Drop the whole command instead of masking
    bool ignore_case = false;
};

struct Pattern {
    std::string name;
    std::regex matcher;
    std::string replacement;
    bool full_remove;
};

// Built-in rules. Order matters: specific rules come before generic ones.
std::vector<PatternSpec> defaultPatternSpecs();

// Compiles the rules in order. Throws std::invalid_argument for an invalid
// matcher, an empty name or a duplicate name.
std::vector<Pattern> buildPatterns(const std::vector<PatternSpec>& specs);

std::vector<Pattern> defaultPatterns();

} // namespace rb
