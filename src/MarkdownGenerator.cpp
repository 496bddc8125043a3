/**
 * MarkdownGenerator.cpp - Render command groups as a markdown runbook
 */

#include "rb/MarkdownGenerator.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace rb {

namespace {

std::string formatTime(Clock::time_point time, const char* format) {
    std::time_t t = Clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

const std::map<std::string, std::string>& prerequisiteTable() {
    static const std::map<std::string, std::string> table = {
        {"git", "Git CLI installed"},
        {"docker", "Docker installed and running"},
        {"docker-compose", "Docker Compose installed"},
        {"kubectl", "kubectl installed with cluster access configured"},
        {"helm", "Helm CLI installed"},
        {"terraform", "Terraform CLI installed"},
        {"aws", "AWS CLI installed and configured"},
        {"gcloud", "Google Cloud SDK installed and configured"},
        {"az", "Azure CLI installed and configured"},
        {"npm", "Node.js and npm installed"},
        {"yarn", "Yarn package manager installed"},
        {"go", "Go toolchain installed"},
        {"python", "Python installed"},
        {"python3", "Python 3 installed"},
        {"pip", "pip package manager installed"},
        {"pip3", "pip3 package manager installed"},
        {"ssh", "SSH client and appropriate key access"},
        {"scp", "SSH/SCP access to remote hosts"},
        {"mysql", "MySQL client installed with database access"},
        {"psql", "PostgreSQL client installed with database access"},
        {"redis-cli", "Redis CLI installed with server access"},
        {"mongosh", "MongoDB shell installed with database access"},
        {"make", "Make build tool installed"},
        {"cargo", "Rust toolchain installed"},
        {"bundle", "Ruby and Bundler installed"},
        {"rails", "Ruby on Rails installed"},
        {"composer", "PHP Composer installed"}
    };
    return table;
}

} // namespace

std::string formatIntent(const std::string& intent) {
    static const std::map<std::string, std::string> names = {
        {"git-commit", "Git version control"},
        {"git-branch", "Git branching"},
        {"git-sync", "Git synchronization"},
        {"docker-build", "Docker image building"},
        {"docker-run", "Docker container management"},
        {"docker-compose", "Docker Compose orchestration"},
        {"npm-build", "Node.js build process"},
        {"npm-dev", "Node.js development"},
        {"go-build", "Go compilation"},
        {"go-mod", "Go module management"},
        {"python-venv", "Python environment setup"},
        {"kubectl-deploy", "Kubernetes deployment"},
        {"kubectl-debug", "Kubernetes debugging"},
        {"terraform", "Infrastructure provisioning"},
        {"ssh-scp", "Remote operations"}
    };
    
    auto it = names.find(intent);
    if (it != names.end()) {
        return it->second;
    }
    
    std::string readable = intent;
    std::replace(readable.begin(), readable.end(), '-', ' ');
    return readable;
}

MarkdownGenerator::MarkdownGenerator(bool include_timestamps)
    : include_timestamps_(include_timestamps) {}

std::string MarkdownGenerator::generate(const RunbookData& data) const {
    std::ostringstream out;
    
    out << "# " << data.title << "\n\n";
    
    out << "## Overview\n\n";
    out << (data.ai_overview.empty() ? generateOverview(data.groups) : data.ai_overview);
    out << "\n\n";
    
    auto prereqs = data.ai_prerequisites.empty() ? inferPrerequisites(data.groups) : data.ai_prerequisites;
    if (!prereqs.empty()) {
        out << "## Prerequisites\n\n";
        for (const auto& prereq : prereqs) {
            out << "- " << prereq << "\n";
        }
        out << "\n";
    }
    
    out << "## Steps\n\n";
    for (size_t i = 0; i < data.groups.size(); ++i) {
        out << generateStep(static_cast<int>(i + 1), data.groups[i]) << "\n";
    }
    
    out << "## Notes\n\n";
    out << "- Generated from shell history on " << formatTime(data.generated, "%Y-%m-%d %H:%M:%S") << "\n";
    if (!data.range.empty()) {
        out << "- Range: " << data.range << "\n";
    }
    if (data.redacted_count > 0) {
        out << "- Commands sanitized: " << data.redacted_count << "\n";
    }
    
    return out.str();
}

std::string MarkdownGenerator::generateOverview(const std::vector<CommandGroup>& groups) const {
    if (groups.empty()) {
        return "This runbook contains no commands.";
    }
    
    std::vector<std::string> intents;
    size_t total_commands = 0;
    for (const auto& group : groups) {
        total_commands += group.commands.size();
        if (!group.intent.empty()
            && std::find(intents.begin(), intents.end(), group.intent) == intents.end()) {
            intents.push_back(group.intent);
        }
    }
    
    std::ostringstream out;
    if (!intents.empty()) {
        out << "This runbook covers: ";
        for (size_t i = 0; i < intents.size(); ++i) {
            if (i > 0) out << ", ";
            out << formatIntent(intents[i]);
        }
        out << ". ";
    }
    out << "It contains " << groups.size() << " steps with " << total_commands << " commands total.";
    
    return out.str();
}

std::vector<std::string> MarkdownGenerator::inferPrerequisites(const std::vector<CommandGroup>& groups) const {
    const auto& table = prerequisiteTable();
    std::vector<std::string> prereqs;
    std::set<std::string> seen;
    
    for (const auto& group : groups) {
        for (const auto& cmd : group.commands) {
            auto it = table.find(parser_.extractTool(cmd.command));
            if (it != table.end() && seen.insert(it->second).second) {
                prereqs.push_back(it->second);
            }
        }
    }
    
    return prereqs;
}

std::string MarkdownGenerator::generateStep(int number, const CommandGroup& group) const {
    std::ostringstream out;
    
    out << "### Step " << number << ": " << group.title << "\n\n";
    
    if (!group.description.empty()) {
        out << group.description << "\n\n";
    }
    
    out << "```bash\n";
    for (const auto& cmd : group.commands) {
        if (include_timestamps_ && cmd.has_timestamp) {
            out << "# " << formatTime(cmd.timestamp, "%H:%M:%S") << "\n";
        }
        out << cmd.command << "\n";
    }
    out << "```\n";
    
    if (!group.explanation.empty()) {
        out << "\n**Why:** " << group.explanation << "\n";
    }
    
    return out.str();
}

bool writeRunbookFile(const std::string& path, const std::string& content, std::string& error) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        error = std::strerror(errno);
        return false;
    }
    
    // O_CREAT's mode only applies to new files
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        error = std::strerror(errno);
        ::close(fd);
        return false;
    }
    
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            error = std::strerror(errno);
            ::close(fd);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    
    if (::close(fd) != 0) {
        error = std::strerror(errno);
        return false;
    }
    return true;
}

} // namespace rb
