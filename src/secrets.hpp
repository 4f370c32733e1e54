#pragma once
#include "character.hpp"
#include "config.hpp"
#include <optional>
#include <string>
#include <vector>

namespace troupe {

// Model provider identities a runtime can be built for
const std::vector<std::string>& known_model_providers();
bool is_known_model_provider(const std::string& provider);

// Credential for the given provider: character secret override first, then
// the process-wide setting. nullopt when the provider has no secret source
// or neither is set; some providers run without one.
std::optional<std::string> resolve_provider_token(const std::string& provider,
                                                  const Character& character,
                                                  const Config& config);

} // namespace troupe
