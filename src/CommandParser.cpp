/**
 * CommandParser.cpp - Split shell commands into tool, wrappers and arguments
 */

#include "rb/CommandParser.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>

namespace rb {

namespace {

bool isIdentifier(const std::string& name) {
    if (name.empty()) return false;
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

bool isAssignment(const std::string& token) {
    size_t eq = token.find('=');
    return eq != std::string::npos && isIdentifier(token.substr(0, eq));
}

} // namespace

struct CommandParser::Impl {
    std::set<std::string> wrappers = {"sudo", "time", "nice", "nohup"};

    // Wrapper options that consume the following token
    std::map<std::string, std::set<std::string>> options_with_argument = {
        {"sudo", {"-u", "-g", "-C", "-D", "-h", "-p", "-r", "-t", "-T", "-U"}},
        {"nice", {"-n"}},
        {"time", {"-f", "-o"}},
        {"nohup", {}}
    };

    size_t skipWrapperOptions(const std::string& wrapper,
                              const std::vector<std::string>& tokens, size_t i) const {
        const auto& with_arg = options_with_argument.at(wrapper);
        while (i < tokens.size() && !tokens[i].empty() && tokens[i].front() == '-') {
            std::string option = tokens[i++];
            if (option == "--") break;
            if (with_arg.count(option) && i < tokens.size()) {
                ++i;
            }
        }
        return i;
    }
};

CommandParser::CommandParser() : impl_(std::make_unique<Impl>()) {}

CommandParser::~CommandParser() = default;

std::string CommandParser::trim(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(" \t\n\r");
    return input.substr(start, end - start + 1);
}

std::vector<std::string> CommandParser::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::string current;
    bool has_token = false;
    char quote = '\0';

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];

        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else if (c == '\\' && quote == '"' && i + 1 < input.size()) {
                current += input[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (c == '"' || c == '\'') {
            quote = c;
            has_token = true;
        } else if (c == '\\' && i + 1 < input.size()) {
            current += input[++i];
            has_token = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (has_token) {
                tokens.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }

    // An unterminated quote still yields what was collected
    if (has_token) {
        tokens.push_back(current);
    }

    return tokens;
}

ParsedCommand CommandParser::parse(const std::string& input) const {
    ParsedCommand result;
    result.raw_input = input;

    auto tokens = tokenize(input);
    if (tokens.empty()) {
        return result;
    }

    size_t i = 0;
    while (i < tokens.size()) {
        if (isAssignment(tokens[i]) && i + 1 < tokens.size()) {
            result.assignments.push_back(tokens[i++]);
            continue;
        }
        if (impl_->wrappers.count(tokens[i]) && i + 1 < tokens.size()) {
            std::string wrapper = tokens[i++];
            result.wrappers.push_back(wrapper);
            i = impl_->skipWrapperOptions(wrapper, tokens, i);
            continue;
        }
        break;
    }

    if (i >= tokens.size()) {
        // Only wrappers and their options, e.g. `sudo -i`
        result.tool = result.wrappers.empty() ? tokens.back() : result.wrappers.back();
        return result;
    }

    result.tool = tokens[i];

    for (size_t j = i + 1; j < tokens.size(); ++j) {
        const auto& token = tokens[j];
        if (!token.empty() && token.front() == '-') {
            result.flags.push_back(token);
        } else {
            result.args.push_back(token);
        }
    }

    return result;
}

std::string CommandParser::extractTool(const std::string& input) const {
    return parse(input).tool;
}

bool CommandParser::isDirectoryChange(const std::string& input) const {
    auto tokens = tokenize(input);
    return tokens.size() >= 2 && tokens[0] == "cd";
}

std::string CommandParser::assignedVariable(const std::string& input) const {
    std::string cmd = trim(input);

    if (cmd.rfind("export ", 0) == 0 || cmd.rfind("export\t", 0) == 0) {
        std::string rest = trim(cmd.substr(7));
        size_t eq = rest.find('=');
        if (eq == std::string::npos) {
            return "";
        }
        std::string name = trim(rest.substr(0, eq));
        return isIdentifier(name) ? name : "";
    }

    auto tokens = tokenize(cmd);
    if (tokens.size() == 1 && isAssignment(tokens[0])) {
        return tokens[0].substr(0, tokens[0].find('='));
    }

    return "";
}

} // namespace rb
