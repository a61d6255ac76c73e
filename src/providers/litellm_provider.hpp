#pragma once

#include <string>
#include <vector>

#include "providers/llm_provider.hpp"

namespace llmtrigger::providers {

// OpenAI-compatible /chat/completions client, switching to the Anthropic
// /messages wire format for Anthropic and Moonshot endpoints.
class LiteLLMProvider : public LLMProvider {
public:
    LiteLLMProvider(std::string api_key,
                    std::string api_base,
                    std::string default_model,
                    int timeout_s,
                    bool use_proxy_for_llm);

    LLMResponse Chat(
        const std::vector<Message>& messages,
        const std::string& model,
        int max_tokens,
        double temperature) override;

    std::string GetDefaultModel() const override { return default_model_; }

private:
    std::string api_key_;
    std::string api_base_;
    std::string default_model_;
    int timeout_s_ = 60;
    bool is_openrouter_ = false;
    bool use_proxy_for_llm_ = false;
};

}  // namespace llmtrigger::providers
