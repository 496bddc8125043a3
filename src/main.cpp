/**
 * main.cpp - runbook-gen CLI entry point
 *
 * Usage:
 *   runbook-gen --from 120 --to 158                   # Runbook to stdout
 *   runbook-gen --from 120 --to 158 -o deploy.md      # Runbook to file
 *   runbook-gen --auth                                # Store API key securely
 *   runbook-gen --config model=<name>                 # Set Claude model
 */

#include "rb/AnthropicClient.hpp"
#include "rb/EnhancementEngine.hpp"
#include "rb/HistoryExtractor.hpp"
#include "rb/MarkdownGenerator.hpp"
#include "rb/Pipeline.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <termios.h>
#include <unistd.h>
#include <vector>

#include <libsecret/secret.h>

#ifndef RB_VERSION
#define RB_VERSION "dev"
#endif

namespace {

const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string YELLOW = "\033[33m";
const std::string GREEN = "\033[32m";
const std::string RED = "\033[31m";
const std::string CYAN = "\033[36m";

// libsecret schema for storing the API key and model
const SecretSchema RB_API_SCHEMA = {
    "com.runbookgen.credentials",
    SECRET_SCHEMA_NONE,
    {
        {"type", SECRET_SCHEMA_ATTRIBUTE_STRING},
        {NULL, SECRET_SCHEMA_ATTRIBUTE_STRING}
    }
};

std::string getFromKeyring(const std::string& type) {
    GError* error = nullptr;
    gchar* value = secret_password_lookup_sync(
        &RB_API_SCHEMA,
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        g_error_free(error);
        return "";
    }

    if (value == nullptr) {
        return "";
    }

    std::string result(value);
    secret_password_free(value);
    return result;
}

bool storeInKeyring(const std::string& type, const std::string& value, const std::string& label) {
    GError* error = nullptr;
    gboolean success = secret_password_store_sync(
        &RB_API_SCHEMA,
        SECRET_COLLECTION_DEFAULT,
        label.c_str(),
        value.c_str(),
        nullptr,
        &error,
        "type", type.c_str(),
        NULL
    );

    if (error != nullptr) {
        std::cerr << RED << "Error saving: " << error->message << RESET << "\n";
        g_error_free(error);
        return false;
    }

    return success == TRUE;
}

std::string getApiKey() {
    // 1. Try libsecret/keyring first (most secure)
    std::string key = getFromKeyring("api_key");
    if (!key.empty()) {
        return key;
    }

    // 2. Try environment variable
    const char* env_key = std::getenv("ANTHROPIC_API_KEY");
    if (env_key && strlen(env_key) > 0) {
        return env_key;
    }

    // 3. Try config file (fallback)
    const char* home = std::getenv("HOME");
    if (!home) {
        return "";
    }
    std::filesystem::path config_path = std::filesystem::path(home) / ".config" / "runbook-gen" / "api_key";
    std::error_code ec;
    if (std::filesystem::exists(config_path, ec)) {
        std::ifstream file(config_path);
        std::getline(file, key);
        if (!key.empty()) {
            return key;
        }
    }

    return "";
}

std::string getModel() {
    std::string model = getFromKeyring("model");
    if (!model.empty()) {
        return model;
    }
    return rb::AnthropicClient::getDefaultModel();
}

void printUsage() {
    std::cout << BOLD << "runbook-gen" << RESET << " - turn shell history into a markdown runbook\n\n"
              << BOLD << "Usage:" << RESET << "\n"
              << "  runbook-gen --from N --to M [options]   Generate a runbook from history #N..#M\n"
              << "  runbook-gen --auth                      Store API key securely\n"
              << "  runbook-gen --config list               Show current configuration\n"
              << "  runbook-gen --config reset              Reset to defaults\n"
              << "  runbook-gen --config model=<name>       Set Claude model\n"
              << "  runbook-gen --help                      Show this help\n"
              << "  runbook-gen --version                   Show version\n\n"
              << BOLD << "Options:" << RESET << "\n"
              << "  -o, --output FILE      Write the runbook to FILE (default: stdout)\n"
              << "  --title TEXT           Runbook title (default: Runbook)\n"
              << "  --history-file PATH    zsh history file (default: ~/.zsh_history)\n"
              << "  --strict               Keep original text of redacted commands for review\n"
              << "  --timestamps           Show command times in the steps\n"
              << "  --no-ai                Skip AI deduplication and explanations\n"
              << "  --dedup-gap SEC        Repeats further apart are kept (default: 30)\n"
              << "  --group-gap SEC        Pauses longer than this start a new step (default: 60)\n"
              << "  --redact REGEX         Extra pattern to mask, may be repeated\n\n"
              << BOLD << "Examples:" << RESET << "\n"
              << "  runbook-gen --from 120 --to 158 --title \"Deploy API\" -o deploy.md\n"
              << "  runbook-gen -f 10 -t 20 --no-ai --redact 'acme_[a-z0-9]+'\n\n"
              << BOLD << "Current Config:" << RESET << "\n"
              << "  Model: " << getModel() << "\n";
}

std::string readHiddenLine() {
    struct termios old_term, new_term;
    bool is_tty = tcgetattr(STDIN_FILENO, &old_term) == 0;
    if (is_tty) {
        new_term = old_term;
        new_term.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &new_term);
    }

    std::string line;
    std::getline(std::cin, line);

    if (is_tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_term);
    }
    return line;
}

int runAuth() {
    // Prompt for API key without echoing (like password input)
    std::cout << "Paste your Anthropic API key (hidden input): ";
    std::cout.flush();
    std::string new_key = readHiddenLine();
    std::cout << "\n";

    if (new_key.empty()) {
        std::cerr << RED << "Error: Empty API key." << RESET << "\n";
        return 1;
    }

    std::cout << "Validating API key...\n";
    rb::AnthropicClient test_client(new_key, getModel());
    std::string error_msg;
    if (!test_client.validate(error_msg)) {
        std::cerr << RED << "Error: Invalid API key - " << error_msg << RESET << "\n";
        return 1;
    }

    if (!storeInKeyring("api_key", new_key, "runbook-gen API Key")) {
        return 1;
    }
    std::cout << GREEN << "API key validated and saved!" << RESET << "\n";
    return 0;
}

int runConfig(const std::string& config_arg) {
    if (config_arg == "list") {
        std::string api_key = getApiKey();
        std::cout << BOLD << "Current Configuration:" << RESET << "\n"
                  << "  Model:   " << getModel() << "\n"
                  << "  API key: " << (api_key.empty() ? "not configured" : "configured") << "\n";
        return 0;
    }

    if (config_arg == "reset") {
        // libsecret has no simple delete, so the default is stored instead
        if (!storeInKeyring("model", rb::AnthropicClient::getDefaultModel(), "runbook-gen Model")) {
            return 1;
        }
        std::cout << GREEN << "Configuration reset to defaults." << RESET << "\n";
        return 0;
    }

    if (config_arg.rfind("model=", 0) == 0) {
        std::string new_model = config_arg.substr(6);
        if (new_model.empty()) {
            std::cerr << RED << "Error: Empty model name." << RESET << "\n";
            return 1;
        }

        std::string api_key = getApiKey();
        if (api_key.empty()) {
            std::cerr << RED << "Error: Configure API key first with 'runbook-gen --auth'" << RESET << "\n";
            return 1;
        }

        std::cout << "Validating model " << new_model << "...\n";
        rb::AnthropicClient test_client(api_key, new_model);
        std::string error_msg;
        if (!test_client.validate(error_msg)) {
            std::cerr << RED << "Error: Invalid model - " << error_msg << RESET << "\n";
            return 1;
        }

        if (!storeInKeyring("model", new_model, "runbook-gen Model")) {
            return 1;
        }
        std::cout << GREEN << "Model validated and set: " << new_model << RESET << "\n";
        return 0;
    }

    std::cerr << RED << "Unknown config. Use: runbook-gen --config list|reset|model=<name>" << RESET << "\n";
    return 1;
}

// Non-negative integer flag value, prints an error on failure
bool parseNumber(const std::string& flag, const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(text, &consumed);
        if (consumed != text.size() || parsed < 0) {
            throw std::invalid_argument(text);
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << RED << "Error: " << flag << " expects a non-negative number, got '"
                  << text << "'" << RESET << "\n";
        return false;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage();
        return 0;
    }

    std::string first_arg = argv[1];

    if (first_arg == "--help" || first_arg == "-h") {
        printUsage();
        return 0;
    }

    if (first_arg == "--version") {
        std::cout << "runbook-gen " << RB_VERSION << "\n";
        return 0;
    }

    if (first_arg == "--auth") {
        // --auth must be standalone with no other arguments
        if (argc != 2) {
            std::cerr << RED << "Error: --auth must be used alone." << RESET << "\n";
            std::cerr << "Usage: runbook-gen --auth\n";
            return 1;
        }
        return runAuth();
    }

    if (first_arg == "--config") {
        // --config must be standalone (only with its own argument)
        if (argc != 3) {
            std::cerr << RED << "Error: --config must be used alone with its argument." << RESET << "\n";
            std::cerr << "Usage: runbook-gen --config list|reset|model=<name>\n";
            return 1;
        }
        return runConfig(argv[2]);
    }

    // Parse all flags (in any order)
    int from = -1;
    int to = -1;
    int dedup_gap = static_cast<int>(rb::Deduplicator::DEFAULT_TIME_GAP.count());
    int group_gap = static_cast<int>(rb::IntentAnalyzer::DEFAULT_THRESHOLD.count());
    std::string output_path;
    std::string title = "Runbook";
    std::string history_path = rb::HistoryExtractor::defaultHistoryPath();
    bool strict = false;
    bool timestamps = false;
    bool no_ai = false;
    std::vector<std::string> custom_patterns;

    for (int arg_idx = 1; arg_idx < argc; ++arg_idx) {
        std::string arg = argv[arg_idx];

        if (arg == "--strict") {
            strict = true;
        }
        else if (arg == "--timestamps") {
            timestamps = true;
        }
        else if (arg == "--no-ai") {
            no_ai = true;
        }
        else if (arg == "--from" || arg == "-f" || arg == "--to" || arg == "-t" ||
                 arg == "--output" || arg == "-o" || arg == "--title" || arg == "--history-file" ||
                 arg == "--dedup-gap" || arg == "--group-gap" || arg == "--redact") {
            if (arg_idx + 1 >= argc) {
                std::cerr << RED << "Error: " << arg << " requires a value" << RESET << "\n";
                return 1;
            }
            std::string value = argv[++arg_idx];

            if (arg == "--from" || arg == "-f") {
                if (!parseNumber(arg, value, from)) return 1;
            } else if (arg == "--to" || arg == "-t") {
                if (!parseNumber(arg, value, to)) return 1;
            } else if (arg == "--dedup-gap") {
                if (!parseNumber(arg, value, dedup_gap)) return 1;
            } else if (arg == "--group-gap") {
                if (!parseNumber(arg, value, group_gap)) return 1;
            } else if (arg == "--output" || arg == "-o") {
                output_path = value;
            } else if (arg == "--title") {
                title = value;
            } else if (arg == "--history-file") {
                history_path = value;
            } else {
                custom_patterns.push_back(value);
            }
        }
        else {
            std::cerr << RED << "Error: Unknown argument '" << arg << "'" << RESET << "\n";
            std::cerr << "Run 'runbook-gen --help' for usage.\n";
            return 1;
        }
    }

    if (from < 0 || to < 0) {
        std::cerr << RED << "Error: --from and --to are required." << RESET << "\n";
        std::cerr << "Usage: runbook-gen --from N --to M [options]\n";
        return 1;
    }

    rb::PipelineOptions options;
    options.dedup_gap = std::chrono::seconds(dedup_gap);
    options.group_gap = std::chrono::seconds(group_gap);
    options.strict = strict;
    for (size_t i = 0; i < custom_patterns.size(); ++i) {
        rb::PatternSpec spec;
        spec.name = "custom-" + std::to_string(i + 1);
        spec.matcher = custom_patterns[i];
        spec.replacement = "<REDACTED>";
        options.extra_patterns.push_back(spec);
    }

    // Pattern errors are fatal before any history is read
    std::unique_ptr<rb::Pipeline> pipeline;
    try {
        pipeline = std::make_unique<rb::Pipeline>(options);
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << "\n";
        return 1;
    }

    rb::HistoryExtractor extractor(history_path);
    auto extracted = extractor.extract(from, to);
    if (!extracted.success) {
        std::cerr << RED << "Error: failed to extract history: " << extracted.error << RESET << "\n";
        return 1;
    }
    std::cerr << "Extracted " << extracted.entries.size() << " commands from history\n";

    // Client and engine must outlive pipeline->run()
    std::unique_ptr<rb::AnthropicClient> client;
    std::unique_ptr<rb::EnhancementEngine> engine;
    if (!no_ai) {
        std::string api_key = getApiKey();
        if (!api_key.empty()) {
            client = std::make_unique<rb::AnthropicClient>(api_key, getModel());
            engine = std::make_unique<rb::EnhancementEngine>(*client, pipeline->sanitizer());
            std::cerr << CYAN << "AI features enabled (" << client->model() << ")" << RESET << "\n";

            rb::EnhancementEngine* ai = engine.get();
            pipeline->setDedupHook([ai](const std::vector<rb::Entry>& entries, rb::MergedEntries& merged,
                                        std::string& error) {
                return ai->deduplicate(entries, merged, error);
            });
            pipeline->setNarrativeHook([ai](const std::vector<rb::CommandGroup>& groups,
                                            rb::GroupNarrative& narrative, std::string& error) {
                return ai->explain(groups, narrative, error);
            });
        }
    }

    auto result = pipeline->run(extracted.entries);

    for (const auto& warning : result.warnings) {
        std::cerr << YELLOW << warning << RESET << "\n";
    }
    if (result.semantic_dedup_applied && !result.merge_summaries.empty()) {
        std::cerr << "AI deduplication applied: " << result.merge_summaries.size() << " groups merged\n";
    }
    std::cerr << "After deduplication: " << result.deduplicated.size() << " commands\n";

    if (!result.redactions.empty()) {
        std::cerr << "Sanitized " << result.redactions.size() << " sensitive values\n";
    }
    if (strict) {
        for (const auto& redaction : result.redactions) {
            std::cerr << YELLOW << "#" << redaction.sequence_number << " [" << redaction.pattern_name << "] "
                      << RESET << redaction.original.value_or("") << "\n";
        }
    }

    std::cerr << "Organized into " << result.groups.size() << " steps\n";
    if (result.narrative_applied) {
        std::cerr << "AI explanations added\n";
    }

    rb::RunbookData data;
    data.title = title;
    data.generated = rb::Clock::now();
    data.range = "commands #" + std::to_string(from) + " to #" + std::to_string(to);
    data.groups = result.groups;
    data.redacted_count = static_cast<int>(result.redactions.size());
    data.ai_overview = result.overview;
    data.ai_prerequisites = result.prerequisites;

    rb::MarkdownGenerator generator(timestamps);
    std::string output = generator.generate(data);

    if (output_path.empty()) {
        std::cout << output;
        return 0;
    }

    std::string write_error;
    if (!rb::writeRunbookFile(output_path, output, write_error)) {
        std::cerr << RED << "Error: failed to write output file " << output_path << ": " << write_error << RESET << "\n";
        return 1;
    }
    std::cerr << GREEN << "Runbook written to " << output_path << RESET << "\n";
    return 0;
}
