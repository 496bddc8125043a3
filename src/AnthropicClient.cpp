/**
 * AnthropicClient.cpp - HTTP client for the Anthropic Messages API
 *
 * Uses cpp-httplib for HTTPS requests to api.anthropic.com.
 */

#include "rb/AnthropicClient.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rb {

static const std::string ANTHROPIC_API_HOST = "api.anthropic.com";
static const std::string MESSAGES_ENDPOINT = "/v1/messages";
static const std::string API_VERSION = "2023-06-01";
static const std::string DEFAULT_MODEL = "claude-3-5-haiku-latest";
static const int MAX_TOKENS = 4096;

struct AnthropicClient::Impl {
    std::string api_key;
    std::string model;
    std::unique_ptr<httplib::SSLClient> client;
    
    Impl(const std::string& key, const std::string& model_name)
        : api_key(key),
          model(model_name.empty() ? DEFAULT_MODEL : model_name) {
        client = std::make_unique<httplib::SSLClient>(ANTHROPIC_API_HOST);
        client->set_connection_timeout(30);
        client->set_read_timeout(120);
        client->set_write_timeout(30);
    }
    
    AnthropicResponse sendRequest(const std::string& system_prompt, const std::string& user_message,
                                  int max_tokens = MAX_TOKENS) {
        AnthropicResponse response;
        
        json request_body = {
            {"model", model},
            {"max_tokens", max_tokens},
            {"messages", json::array({
                {{"role", "user"}, {"content", user_message}}
            })}
        };
        if (!system_prompt.empty()) {
            request_body["system"] = system_prompt;
        }
        
        httplib::Headers headers = {
            {"x-api-key", api_key},
            {"anthropic-version", API_VERSION}
        };
        
        auto res = client->Post(MESSAGES_ENDPOINT, headers, request_body.dump(), "application/json");
        
        if (!res) {
            response.error = "Network error: " + httplib::to_string(res.error());
            return response;
        }
        
        if (res->status != 200) {
            response.error = "API error: HTTP " + std::to_string(res->status);
            try {
                json error_json = json::parse(res->body);
                if (error_json.contains("error") && error_json["error"].contains("message")) {
                    response.error += " - " + error_json["error"]["message"].get<std::string>();
                }
            } catch (const std::exception&) {
                // Body is not JSON, the status is all we have
            }
            return response;
        }
        
        try {
            json res_json = json::parse(res->body);
            
            if (res_json.contains("content") && res_json["content"].is_array()) {
                for (const auto& block : res_json["content"]) {
                    if (block.value("type", "") == "text") {
                        response.content = block.value("text", "");
                        response.success = true;
                        return response;
                    }
                }
            }
            response.error = "Invalid response structure";
        } catch (const std::exception& e) {
            response.error = std::string("JSON parse error: ") + e.what();
        }
        
        return response;
    }
};

AnthropicClient::AnthropicClient(const std::string& api_key, const std::string& model)
    : impl_(std::make_unique<Impl>(api_key, model)) {}

AnthropicClient::~AnthropicClient() = default;

std::string AnthropicClient::getDefaultModel() {
    return DEFAULT_MODEL;
}

const std::string& AnthropicClient::model() const {
    return impl_->model;
}

AnthropicResponse AnthropicClient::sendMessage(const std::string& system_prompt,
                                               const std::string& user_message) {
    return impl_->sendRequest(system_prompt, user_message);
}

bool AnthropicClient::validate(std::string& error_message) {
    auto response = impl_->sendRequest("", "Respond with only the word OK", 16);
    if (!response.success) {
        error_message = response.error;
        return false;
    }
    return true;
}

} // namespace rb
