/**
 * test_deduplicator.cpp - Unit tests for Deduplicator
 */

#include "rb/Deduplicator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

const long long T0 = 1700000000;

rb::Entry makeEntry(int seq, const std::string& command) {
    rb::Entry entry;
    entry.sequence_number = seq;
    entry.command = command;
    return entry;
}

rb::Entry timedEntry(int seq, const std::string& command, int offset_seconds) {
    rb::Entry entry = makeEntry(seq, command);
    entry.timestamp = rb::Clock::time_point(std::chrono::seconds(T0 + offset_seconds));
    entry.has_timestamp = true;
    return entry;
}

std::vector<rb::Entry> fromCommands(const std::vector<std::string>& commands) {
    std::vector<rb::Entry> entries;
    for (size_t i = 0; i < commands.size(); ++i) {
        entries.push_back(makeEntry(static_cast<int>(i + 1), commands[i]));
    }
    return entries;
}

} // namespace

void test_collapse_exact_duplicates() {
    rb::Deduplicator dedup;
    
    auto result = dedup.process(fromCommands({"ls -la", "ls -la", "ls -la", "pwd"}));
    
    assert(result.size() == 2);
    assert(result[0].command == "ls -la");
    assert(result[1].command == "pwd");
    
    std::cout << "[PASS] test_collapse_exact_duplicates\n";
}

void test_keep_intentional_repeats() {
    rb::Deduplicator dedup(std::chrono::seconds(30));
    
    auto result = dedup.process({
        timedEntry(1, "kubectl get pods", 0),
        timedEntry(2, "kubectl get pods", 45),
        timedEntry(3, "kubectl get pods", 90)
    });
    
    assert(result.size() == 3);
    assert(result[2].sequence_number == 3);
    
    std::cout << "[PASS] test_keep_intentional_repeats\n";
}

void test_quick_repeats_keep_latest() {
    rb::Deduplicator dedup(std::chrono::seconds(30));
    
    auto result = dedup.process({
        timedEntry(1, "ls", 0),
        timedEntry(2, "ls", 2),
        timedEntry(3, "ls", 4)
    });
    
    assert(result.size() == 1);
    assert(result[0].sequence_number == 3);
    assert(result[0].timestamp == rb::Clock::time_point(std::chrono::seconds(T0 + 4)));
    
    std::cout << "[PASS] test_quick_repeats_keep_latest\n";
}

void test_repeats_without_timestamps_collapse() {
    rb::Deduplicator dedup(std::chrono::seconds(30));
    
    auto result = dedup.process({
        timedEntry(1, "make test", 0),
        makeEntry(2, "make test")
    });
    
    assert(result.size() == 1);
    assert(result[0].sequence_number == 2);
    
    std::cout << "[PASS] test_repeats_without_timestamps_collapse\n";
}

void test_typo_correction_replaces() {
    rb::Deduplicator dedup;
    
    auto result = dedup.process(fromCommands({"git stauts", "git status"}));
    
    assert(result.size() == 1);
    assert(result[0].command == "git status");
    assert(result[0].sequence_number == 2);
    
    std::cout << "[PASS] test_typo_correction_replaces\n";
}

void test_lookahead_drops_corrected_command() {
    rb::Deduplicator dedup;
    
    auto result = dedup.process(fromCommands({
        "cd /srv/app", "git comit -m fix", "   ", "git commit -m fix", "make"
    }));
    
    assert(result.size() == 3);
    assert(result[0].command == "cd /srv/app");
    assert(result[1].command == "git commit -m fix");
    assert(result[1].sequence_number == 4);
    assert(result[2].command == "make");
    
    std::cout << "[PASS] test_lookahead_drops_corrected_command\n";
}

void test_blank_entries_dropped() {
    rb::Deduplicator dedup;
    
    assert(dedup.process({}).empty());
    assert(dedup.process(fromCommands({"", "  ", "\t"})).empty());
    
    auto result = dedup.process(fromCommands({"", "uname -a"}));
    assert(result.size() == 1);
    assert(result[0].sequence_number == 2);
    
    std::cout << "[PASS] test_blank_entries_dropped\n";
}

void test_directory_changes_collapse() {
    rb::Deduplicator dedup;
    
    auto result = dedup.process(fromCommands({"cd /tmp", "cd /var/log", "ls"}));
    
    assert(result.size() == 2);
    assert(result[0].command == "cd /var/log");
    assert(result[1].command == "ls");
    
    std::cout << "[PASS] test_directory_changes_collapse\n";
}

void test_same_variable_assignments_collapse() {
    rb::Deduplicator dedup;
    
    auto exported = dedup.process(fromCommands({"export REGION=us-east-1", "export REGION=eu-west-1"}));
    assert(exported.size() == 1);
    assert(exported[0].command == "export REGION=eu-west-1");
    
    auto bare = dedup.process(fromCommands({"REGION=us-east-1", "REGION=eu-west-1"}));
    assert(bare.size() == 1);
    assert(bare[0].command == "REGION=eu-west-1");
    
    auto different = dedup.process(fromCommands({"export KUBECONFIG=~/.kube/dev", "export PATH=/opt/bin"}));
    assert(different.size() == 2);
    
    std::cout << "[PASS] test_same_variable_assignments_collapse\n";
}

void test_levenshtein_distance() {
    assert(rb::levenshteinDistance("", "") == 0);
    assert(rb::levenshteinDistance("abc", "") == 3);
    assert(rb::levenshteinDistance("", "abcd") == 4);
    assert(rb::levenshteinDistance("kitten", "sitting") == 3);
    assert(rb::levenshteinDistance("flaw", "lawn") == 2);
    assert(rb::levenshteinDistance("git stauts", "git status") == 2);
    
    std::cout << "[PASS] test_levenshtein_distance\n";
}

void test_typo_thresholds() {
    rb::Deduplicator dedup;
    
    assert(!dedup.isTypoCorrection("git status", "git status"));
    assert(!dedup.isTypoCorrection("  git status", "git status  "));
    assert(dedup.isTypoCorrection("gti log", "git log"));
    assert(!dedup.isTypoCorrection("ls", "ls -la --color=auto"));
    
    // Threshold grows with length: 50 characters allow 5 edits
    std::string base = "docker run --rm -it -v /srv/data:/data alpine:3.19";
    std::string edited = base;
    edited[20] = 'X';
    edited[30] = 'Y';
    edited[40] = 'Z';
    edited[45] = 'Q';
    assert(base.size() >= 50);
    assert(rb::levenshteinDistance(base, edited) == 4);
    assert(dedup.isTypoCorrection(base, edited));
    
    // Short commands only tolerate 2 edits
    assert(!dedup.isTypoCorrection("make all", "mike bat"));
    
    std::cout << "[PASS] test_typo_thresholds\n";
}

void test_order_preserved_and_never_expands() {
    rb::Deduplicator dedup;
    
    auto input = fromCommands({
        "git pull", "npm ci", "npm ci", "npm run build", "cd dist", "cd ..",
        "export NODE_ENV=production", "export NODE_ENV=staging", "", "npm start"
    });
    auto result = dedup.process(input);
    
    assert(result.size() <= input.size());
    for (size_t i = 1; i < result.size(); ++i) {
        assert(result[i - 1].sequence_number < result[i].sequence_number);
    }
    
    std::cout << "[PASS] test_order_preserved_and_never_expands\n";
}

int main() {
    std::cout << "Running Deduplicator tests...\n\n";
    
    test_collapse_exact_duplicates();
    test_keep_intentional_repeats();
    test_quick_repeats_keep_latest();
    test_repeats_without_timestamps_collapse();
    test_typo_correction_replaces();
    test_lookahead_drops_corrected_command();
    test_blank_entries_dropped();
    test_directory_changes_collapse();
    test_same_variable_assignments_collapse();
    test_levenshtein_distance();
    test_typo_thresholds();
    test_order_preserved_and_never_expands();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
