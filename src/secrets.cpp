#include "secrets.hpp"
#include "util.hpp"
#include <algorithm>

namespace troupe {

namespace {

struct SecretSource {
    const char* provider;
    const char* character_key;  // key under settings.secrets
    const char* setting_key;    // process-wide setting
};

// OpenRouter's character-level key is historically named without the suffix
constexpr SecretSource kSecretSources[] = {
    {"openai",     "OPENAI_API_KEY",    "OPENAI_API_KEY"},
    {"openrouter", "OPENROUTER",        "OPENROUTER_API_KEY"},
    {"anthropic",  "ANTHROPIC_API_KEY", "ANTHROPIC_API_KEY"},
    {"groq",       "GROQ_API_KEY",      "GROQ_API_KEY"},
};

} // namespace

const std::vector<std::string>& known_model_providers() {
    static const std::vector<std::string> providers = {
        "openai", "anthropic", "openrouter", "groq", "grok", "google",
        "ollama", "llama_local", "llama_cloud", "together", "redpill",
    };
    return providers;
}

bool is_known_model_provider(const std::string& provider) {
    const auto& all = known_model_providers();
    return std::find(all.begin(), all.end(), to_lower(provider)) != all.end();
}

std::optional<std::string> resolve_provider_token(const std::string& provider,
                                                  const Character& character,
                                                  const Config& config) {
    std::string name = to_lower(provider);
    for (const auto& src : kSecretSources) {
        if (name != src.provider) continue;

        std::string token = character.secret(src.character_key);
        if (token.empty()) token = config.setting(src.setting_key);
        if (token.empty()) return std::nullopt;
        return token;
    }
    return std::nullopt;
}

} // namespace troupe
