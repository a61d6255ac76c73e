#include "providers/llm_provider.hpp"

#include "providers/litellm_provider.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace llmtrigger::providers {

bool LLMResponse::HasContent() const {
    return !utils::Trim(content).empty();
}

LLMResponse LLMProvider::TextChat(
    const std::string& prompt,
    const std::vector<Message>& context,
    const std::string& system_prompt,
    int max_tokens,
    double temperature) {
    std::vector<Message> messages;
    messages.reserve(context.size() + 2);
    if (!system_prompt.empty()) {
        messages.push_back(Message{"system", system_prompt});
    }
    messages.insert(messages.end(), context.begin(), context.end());
    messages.push_back(Message{"user", prompt});
    return Chat(messages, GetDefaultModel(), max_tokens, temperature);
}

void ProviderRegistry::Register(const std::string& name, std::unique_ptr<LLMProvider> provider) {
    providers_[name] = std::move(provider);
}

LLMProvider* ProviderRegistry::Get(const std::string& name) {
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::unique_ptr<LLMProvider> CreateProvider(const llmtrigger::config::ProviderConfig& config,
                                            bool use_proxy_for_llm) {
    return std::make_unique<LiteLLMProvider>(
        config.api_key,
        config.api_base,
        config.model,
        config.timeout_s,
        use_proxy_for_llm);
}

std::unique_ptr<ProviderRegistry> CreateProviderRegistry(const llmtrigger::config::Config& config) {
    auto registry = std::make_unique<ProviderRegistry>();
    for (const auto& [name, entry] : config.providers.entries) {
        if (entry.api_key.empty() && entry.api_base.empty()) {
            utils::LogWarn("llm", "provider '" + name + "' has neither apiKey nor apiBase; skipped");
            continue;
        }
        registry->Register(name, CreateProvider(entry, config.providers.use_proxy_for_llm));
        utils::LogInfo("llm", "registered provider '" + name + "'");
    }
    return registry;
}

}  // namespace llmtrigger::providers
