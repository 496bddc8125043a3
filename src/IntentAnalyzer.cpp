/**
 * IntentAnalyzer.cpp - Group commands into titled runbook steps
 */

#include "rb/IntentAnalyzer.hpp"

#include <cctype>
#include <map>
#include <utility>

namespace rb {

namespace {

const std::map<std::string, int>& toolFamilies() {
    static const std::map<std::string, int> families = [] {
        const std::vector<std::vector<std::string>> groups = {
            {"git", "gh"},
            {"docker", "docker-compose"},
            {"kubectl", "helm", "k9s"},
            {"npm", "npx", "yarn", "pnpm"},
            {"go", "gofmt", "golangci-lint"},
            {"python", "pip", "python3", "pip3"},
            {"terraform", "tf"},
            {"aws", "awscli"},
            {"gcloud", "gsutil"},
            {"az", "azure"}
        };
        std::map<std::string, int> result;
        for (size_t i = 0; i < groups.size(); ++i) {
            for (const auto& tool : groups[i]) {
                result[tool] = static_cast<int>(i);
            }
        }
        return result;
    }();
    return families;
}

bool startsWithWord(const std::string& command, const std::string& prefix) {
    if (prefix.empty() || command.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    if (command.size() == prefix.size()) {
        return true;
    }
    unsigned char next = static_cast<unsigned char>(command[prefix.size()]);
    return !std::isalnum(next) && next != '-' && next != '_';
}

// Accumulator for the fold in analyze()
struct DraftGroup {
    std::vector<Entry> commands;
    std::string intent;
    std::string last_tool;
};

} // namespace

std::vector<Workflow> defaultWorkflows() {
    return {
        {"git-commit", {"git add", "git commit", "git push"}, "Commit and push changes"},
        {"git-branch", {"git checkout", "git branch", "git switch"}, "Branch management"},
        {"git-sync", {"git fetch", "git pull", "git merge", "git rebase"}, "Sync with remote"},
        {"docker-build", {"docker build", "docker tag", "docker push"}, "Build and publish container image"},
        {"docker-run", {"docker run", "docker exec", "docker logs"}, "Run and manage containers"},
        {"docker-compose", {"docker-compose", "docker compose"}, "Manage multi-container application"},
        {"npm-build", {"npm install", "npm run build", "npm test"}, "Install dependencies and build"},
        {"npm-dev", {"npm install", "npm run dev", "npm start"}, "Set up development environment"},
        {"go-build", {"go build", "go test", "go run"}, "Build and test Go application"},
        {"go-mod", {"go mod init", "go mod tidy", "go get"}, "Manage Go modules"},
        {"python-venv", {"python -m venv", "source", "pip install"}, "Set up Python virtual environment"},
        {"kubectl-deploy", {"kubectl apply", "kubectl rollout", "kubectl get"}, "Deploy to Kubernetes"},
        {"kubectl-debug", {"kubectl describe", "kubectl logs", "kubectl exec"}, "Debug Kubernetes resources"},
        {"terraform", {"terraform init", "terraform plan", "terraform apply"}, "Provision infrastructure"},
        {"ssh-scp", {"ssh", "scp", "rsync"}, "Remote file operations"}
    };
}

bool areRelatedTools(const std::string& a, const std::string& b) {
    if (a == b) {
        return true;
    }
    const auto& families = toolFamilies();
    auto fa = families.find(a);
    auto fb = families.find(b);
    return fa != families.end() && fb != families.end() && fa->second == fb->second;
}

std::string titleForTool(const std::string& tool) {
    static const std::map<std::string, std::string> titles = {
        {"git", "Git operations"},
        {"docker", "Docker operations"},
        {"docker-compose", "Docker operations"},
        {"kubectl", "Kubernetes operations"},
        {"helm", "Kubernetes operations"},
        {"npm", "Node.js package operations"},
        {"yarn", "Node.js package operations"},
        {"pnpm", "Node.js package operations"},
        {"go", "Go operations"},
        {"python", "Python operations"},
        {"pip", "Python operations"},
        {"python3", "Python operations"},
        {"terraform", "Terraform operations"},
        {"tf", "Terraform operations"},
        {"ssh", "Remote operations"},
        {"scp", "Remote operations"},
        {"rsync", "Remote operations"},
        {"curl", "HTTP requests"},
        {"wget", "HTTP requests"},
        {"cd", "File system operations"},
        {"ls", "File system operations"},
        {"mkdir", "File system operations"},
        {"rm", "File system operations"},
        {"cp", "File system operations"},
        {"mv", "File system operations"}
    };
    
    if (tool.empty()) {
        return "Shell commands";
    }
    auto it = titles.find(tool);
    return it != titles.end() ? it->second : tool + " operations";
}

IntentAnalyzer::IntentAnalyzer(std::chrono::seconds threshold, std::vector<Workflow> workflows)
    : threshold_(threshold), workflows_(std::move(workflows)) {}

std::vector<CommandGroup> IntentAnalyzer::analyze(const std::vector<Entry>& entries) const {
    std::vector<CommandGroup> groups;
    DraftGroup draft;
    
    for (const auto& entry : entries) {
        std::string tool = parser_.extractTool(entry.command);
        std::string intent = inferIntent(entry.command);
        
        bool start_new = draft.commands.empty()
            || !areRelatedTools(draft.last_tool, tool)
            || hasTimeGap(draft.commands.back(), entry)
            || (!draft.intent.empty() && draft.intent != intent);
        
        if (start_new) {
            if (!draft.commands.empty()) {
                groups.push_back(finalizeGroup(std::move(draft.commands), std::move(draft.intent)));
            }
            draft = DraftGroup{{entry}, intent, tool};
            continue;
        }
        
        draft.commands.push_back(entry);
        draft.last_tool = tool;
        if (draft.intent.empty()) {
            draft.intent = intent;
        }
    }
    
    if (!draft.commands.empty()) {
        groups.push_back(finalizeGroup(std::move(draft.commands), std::move(draft.intent)));
    }
    
    return groups;
}

std::string IntentAnalyzer::inferIntent(const std::string& command) const {
    std::string cmd = CommandParser::trim(command);
    for (const auto& workflow : workflows_) {
        for (const auto& prefix : workflow.prefixes) {
            if (startsWithWord(cmd, prefix)) {
                return workflow.name;
            }
        }
    }
    return "";
}

CommandGroup IntentAnalyzer::finalizeGroup(std::vector<Entry> commands, std::string intent) const {
    CommandGroup group;
    group.commands = std::move(commands);
    group.intent = std::move(intent);
    
    if (!group.intent.empty()) {
        for (const auto& workflow : workflows_) {
            if (workflow.name == group.intent) {
                group.title = workflow.description;
                break;
            }
        }
    }
    
    if (group.title.empty()) {
        group.title = generateTitle(group.commands);
    }
    
    return group;
}

bool IntentAnalyzer::hasTimeGap(const Entry& prev, const Entry& curr) const {
    if (!prev.has_timestamp || !curr.has_timestamp) {
        return false;
    }
    return (curr.timestamp - prev.timestamp) > threshold_;
}

std::string IntentAnalyzer::generateTitle(const std::vector<Entry>& commands) const {
    if (commands.empty()) {
        return "Commands";
    }
    
    // Keep first-seen order so ties go to the earliest tool
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& cmd : commands) {
        std::string tool = parser_.extractTool(cmd.command);
        if (tool.empty()) continue;
        
        bool found = false;
        for (auto& count : counts) {
            if (count.first == tool) {
                ++count.second;
                found = true;
                break;
            }
        }
        if (!found) {
            counts.emplace_back(tool, 1);
        }
    }
    
    std::string primary;
    int best = 0;
    for (const auto& count : counts) {
        if (count.second > best) {
            best = count.second;
            primary = count.first;
        }
    }
    
    return titleForTool(primary);
}

} // namespace rb
