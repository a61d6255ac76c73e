#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config_schema.hpp"

namespace llmtrigger::providers {

class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Message {
    std::string role;
    std::string content;
};

struct LLMResponse {
    std::string content;
    std::string finish_reason = "stop";
    std::unordered_map<std::string, int> usage;

    bool HasContent() const;
};

class LLMProvider {
public:
    virtual ~LLMProvider() = default;

    // Throws ProviderError when the request cannot be completed.
    virtual LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) = 0;
    virtual std::string GetDefaultModel() const = 0;

    // Single-turn generation: system instruction, prior turns, then the prompt.
    LLMResponse TextChat(
        const std::string& prompt,
        const std::vector<Message>& context,
        const std::string& system_prompt,
        int max_tokens = 1024,
        double temperature = 0.7);
};

class ProviderRegistry {
public:
    void Register(const std::string& name, std::unique_ptr<LLMProvider> provider);
    LLMProvider* Get(const std::string& name);

private:
    std::unordered_map<std::string, std::unique_ptr<LLMProvider>> providers_;
};

std::unique_ptr<LLMProvider> CreateProvider(const llmtrigger::config::ProviderConfig& config,
                                            bool use_proxy_for_llm);
// One provider per configured entry, registered under its config key.
std::unique_ptr<ProviderRegistry> CreateProviderRegistry(const llmtrigger::config::Config& config);

}  // namespace llmtrigger::providers
