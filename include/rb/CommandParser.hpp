/**
 * CommandParser.hpp - Split shell commands into tool, wrappers and arguments
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace rb {

struct ParsedCommand {
    std::string tool;                      // Real command after unwrapping sudo/time/nice/nohup
    std::vector<std::string> wrappers;     // Wrappers that were stripped, in order
    std::vector<std::string> assignments;  // Leading NAME=value environment assignments
    std::vector<std::string> args;
    std::vector<std::string> flags;
    std::string raw_input;
};

class CommandParser {
public:
    CommandParser();
    ~CommandParser();
    
    ParsedCommand parse(const std::string& input) const;
    
    // First whitespace-delimited token of the command once wrappers are removed
    std::string extractTool(const std::string& input) const;
    
    // `cd <path>` style directory change
    bool isDirectoryChange(const std::string& input) const;
    
    // Variable name for `export NAME=value` or a bare `NAME=value`, empty otherwise
    std::string assignedVariable(const std::string& input) const;
    
    static std::vector<std::string> tokenize(const std::string& input);
    static std::string trim(const std::string& input);
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rb
