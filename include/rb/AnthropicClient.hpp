/**
 * AnthropicClient.hpp - HTTP client for the Anthropic Messages API
 */

#pragma once

#include <memory>
#include <string>

namespace rb {

struct AnthropicResponse {
    std::string content;
    bool success = false;
    std::string error;
};

class AnthropicClient {
public:
    // model: empty = getDefaultModel()
    explicit AnthropicClient(const std::string& api_key, const std::string& model = "");
    ~AnthropicClient();
    
    // One user turn with an optional system prompt, returns the first text block
    AnthropicResponse sendMessage(const std::string& system_prompt, const std::string& user_message);
    
    // Validate API key and model by making a test request
    bool validate(std::string& error_message);
    
    const std::string& model() const;
    
    static std::string getDefaultModel();
    
private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rb
