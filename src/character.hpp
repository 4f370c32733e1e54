#pragma once
#include <string>
#include <vector>
#include <stdexcept>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace troupe {

// A plugin named by a character, optionally declaring its own clients
struct PluginDeclaration {
    std::string name;
    std::vector<std::string> clients;
};

struct Character {
    std::string id;              // derived from name when absent
    std::string name;
    std::string username;        // defaults to name
    std::string model_provider;
    std::string system;
    std::vector<std::string> bio;
    std::vector<std::string> lore;
    std::vector<std::string> topics;
    std::vector<std::string> adjectives;
    std::vector<std::string> knowledge;
    std::vector<std::string> clients;
    std::vector<PluginDeclaration> plugins;
    std::unordered_map<std::string, std::string> secrets;
    std::string model;           // settings.model
    std::string voice_model;     // settings.voice.model

    nlohmann::json raw = nlohmann::json::object();

    // Character-level secret override; empty if absent
    std::string secret(const std::string& key) const;
};

class CharacterValidationError : public std::runtime_error {
public:
    CharacterValidationError(const std::string& path, const std::string& message)
        : std::runtime_error(path + ": " + message), path_(path) {}

    // JSON-pointer style location of the offending field
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Throws CharacterValidationError on the first schema violation.
void validate_character_json(const nlohmann::json& j);

// Validate and convert a character document.
Character character_from_json(const nlohmann::json& j);

// Fill id (from name) and username (= name) if unset. Idempotent.
void ensure_identity(Character& character);

// Deterministic UUID-formatted identifier from SHA-1 of the
// URI-component-encoded input.
std::string string_to_uuid(const std::string& target);

// Built-in character used when none are supplied
Character default_character();

} // namespace troupe
