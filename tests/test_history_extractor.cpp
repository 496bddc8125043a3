/**
 * test_history_extractor.cpp - Unit tests for HistoryExtractor
 */

#include "rb/HistoryExtractor.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <unistd.h>

namespace {

std::string writeHistory(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() /
                ("rb_history_" + std::to_string(getpid()) + "_" + name);
    std::ofstream file(path);
    file << content;
    return path.string();
}

const std::string SAMPLE =
    ": 1700000000:0;cd ~/src/api\n"
    ": 1700000005:0;git pull\n"
    "garbage line without header\n"
    ": 1700000010:2;docker build \\\n"
    "  -t api:dev \\\n"
    "  .\n"
    ": 1700000020:0;docker run --rm api:dev\n"
    ": 1700000030:0;make test\n";

} // namespace

void test_extract_range() {
    std::string path = writeHistory("range", SAMPLE);
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(2, 4);
    
    assert(result.success);
    assert(result.error.empty());
    assert(result.entries.size() == 3);
    assert(result.entries[0].sequence_number == 2);
    assert(result.entries[0].command == "git pull");
    assert(result.entries[2].sequence_number == 4);
    assert(result.entries[2].command == "docker run --rm api:dev");
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_extract_range\n";
}

void test_timestamps_parsed() {
    std::string path = writeHistory("timestamps", SAMPLE);
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(1, 1);
    
    assert(result.success);
    assert(result.entries[0].has_timestamp);
    assert(rb::Clock::to_time_t(result.entries[0].timestamp) == 1700000000);
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_timestamps_parsed\n";
}

void test_multiline_commands_joined() {
    std::string path = writeHistory("multiline", SAMPLE);
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(3, 3);
    
    assert(result.success);
    assert(result.entries.size() == 1);
    assert(result.entries[0].command == "docker build \n  -t api:dev \n  .");
    
    // Continuation lines are not numbered
    auto last = extractor.extract(5, 5);
    assert(last.success);
    assert(last.entries[0].command == "make test");
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_multiline_commands_joined\n";
}

void test_out_of_range_timestamp() {
    std::string path = writeHistory("overflow", ": 99999999999999999999999:0;echo hi\n");
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(1, 1);
    
    assert(result.success);
    assert(result.entries[0].command == "echo hi");
    assert(!result.entries[0].has_timestamp);
    std::filesystem::remove(path);
    
    // Fits in a long long but not in the clock's duration
    long long max_seconds =
        std::chrono::duration_cast<std::chrono::seconds>(rb::Clock::duration::max()).count();
    path = writeHistory("overflow_clock",
                        ": " + std::to_string(max_seconds + 1) + ":0;echo hi\n"
                        ": 1700000000:0;echo a\n");
    rb::HistoryExtractor clock_extractor(path);
    
    auto clock_result = clock_extractor.extract(1, 2);
    
    assert(clock_result.success);
    assert(clock_result.entries.size() == 2);
    assert(!clock_result.entries[0].has_timestamp);
    assert(clock_result.entries[1].has_timestamp);
    assert(rb::Clock::to_time_t(clock_result.entries[1].timestamp) == 1700000000);
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_out_of_range_timestamp\n";
}

void test_long_command_line() {
    std::string payload(64 * 1024, 'x');
    std::string path = writeHistory("long",
                                    ": 1700000000:0;curl -d '" + payload + "' https://h/api\n"
                                    ": 1700000001:0;ls\n");
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(1, 2);
    
    assert(result.success);
    assert(result.entries.size() == 2);
    assert(result.entries[0].command == "curl -d '" + payload + "' https://h/api");
    assert(result.entries[1].command == "ls");
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_long_command_line\n";
}

void test_invalid_range() {
    std::string path = writeHistory("invalid", SAMPLE);
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(5, 2);
    
    assert(!result.success);
    assert(result.entries.empty());
    assert(result.error.find("invalid range") != std::string::npos);
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_invalid_range\n";
}

void test_empty_result() {
    std::string path = writeHistory("empty", SAMPLE);
    rb::HistoryExtractor extractor(path);
    
    auto result = extractor.extract(40, 50);
    
    assert(!result.success);
    assert(result.error.find("no commands found") != std::string::npos);
    
    std::filesystem::remove(path);
    std::cout << "[PASS] test_empty_result\n";
}

void test_missing_file() {
    rb::HistoryExtractor extractor("/nonexistent/dir/.zsh_history");
    
    auto result = extractor.extract(1, 10);
    
    assert(!result.success);
    assert(result.error.find("not found") != std::string::npos);
    
    std::cout << "[PASS] test_missing_file\n";
}

int main() {
    std::cout << "Running HistoryExtractor tests...\n\n";
    
    test_extract_range();
    test_timestamps_parsed();
    test_multiline_commands_joined();
    test_out_of_range_timestamp();
    test_long_command_line();
    test_invalid_range();
    test_empty_result();
    test_missing_file();
    
    std::cout << "\nAll tests passed!\n";
    return 0;
}
