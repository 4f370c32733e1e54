#include "character.hpp"
#include "util.hpp"

#include <openssl/sha.h>
#include <cstdio>

namespace troupe {

std::string Character::secret(const std::string& key) const {
    auto it = secrets.find(key);
    if (it != secrets.end()) return it->second;
    return {};
}

// ── Schema ───────────────────────────────────────────────────────

static void require_string(const nlohmann::json& j, const char* key,
                           const std::string& at) {
    if (j.contains(key) && !j[key].is_string()) {
        throw CharacterValidationError(at + "/" + key, "expected a string");
    }
}

static void require_string_array(const nlohmann::json& j, const char* key,
                                 const std::string& at) {
    if (!j.contains(key)) return;
    const auto& arr = j[key];
    std::string path = at + "/" + key;
    if (!arr.is_array()) {
        throw CharacterValidationError(path, "expected an array of strings");
    }
    for (size_t i = 0; i < arr.size(); i++) {
        if (!arr[i].is_string()) {
            throw CharacterValidationError(path + "/" + std::to_string(i),
                                           "expected a string");
        }
    }
}

void validate_character_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw CharacterValidationError("", "character must be a JSON object");
    }

    if (!j.contains("name")) {
        throw CharacterValidationError("/name", "required");
    }
    if (!j["name"].is_string() || j["name"].get<std::string>().empty()) {
        throw CharacterValidationError("/name", "expected a non-empty string");
    }

    require_string(j, "id", "");
    require_string(j, "username", "");
    require_string(j, "modelProvider", "");
    require_string(j, "system", "");

    if (j.contains("bio") && !j["bio"].is_string()) {
        require_string_array(j, "bio", "");
    }
    require_string_array(j, "lore", "");
    require_string_array(j, "topics", "");
    require_string_array(j, "adjectives", "");
    require_string_array(j, "knowledge", "");
    require_string_array(j, "clients", "");

    if (j.contains("plugins")) {
        const auto& plugins = j["plugins"];
        if (!plugins.is_array()) {
            throw CharacterValidationError("/plugins", "expected an array");
        }
        for (size_t i = 0; i < plugins.size(); i++) {
            std::string at = "/plugins/" + std::to_string(i);
            const auto& p = plugins[i];
            if (p.is_string()) continue;
            if (!p.is_object()) {
                throw CharacterValidationError(at, "expected a plugin name or object");
            }
            if (!p.contains("name") || !p["name"].is_string()) {
                throw CharacterValidationError(at + "/name", "expected a string");
            }
            require_string_array(p, "clients", at);
        }
    }

    if (j.contains("settings")) {
        const auto& settings = j["settings"];
        if (!settings.is_object()) {
            throw CharacterValidationError("/settings", "expected an object");
        }
        require_string(settings, "model", "/settings");
        if (settings.contains("secrets")) {
            const auto& secrets = settings["secrets"];
            if (!secrets.is_object()) {
                throw CharacterValidationError("/settings/secrets", "expected an object");
            }
            for (auto& [key, value] : secrets.items()) {
                if (!value.is_string()) {
                    throw CharacterValidationError("/settings/secrets/" + key,
                                                   "expected a string");
                }
            }
        }
        if (settings.contains("voice")) {
            if (!settings["voice"].is_object()) {
                throw CharacterValidationError("/settings/voice", "expected an object");
            }
            require_string(settings["voice"], "model", "/settings/voice");
        }
    }
}

// ── Conversion ───────────────────────────────────────────────────

static std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    if (j[key].is_string()) {
        out.push_back(j[key].get<std::string>());
        return out;
    }
    for (const auto& item : j[key]) {
        out.push_back(item.get<std::string>());
    }
    return out;
}

Character character_from_json(const nlohmann::json& j) {
    validate_character_json(j);

    Character c;
    c.raw = j;
    c.name = j["name"].get<std::string>();
    c.id = j.value("id", std::string{});
    c.username = j.value("username", std::string{});
    c.model_provider = j.value("modelProvider", std::string{});
    c.system = j.value("system", std::string{});
    c.bio = string_list(j, "bio");
    c.lore = string_list(j, "lore");
    c.topics = string_list(j, "topics");
    c.adjectives = string_list(j, "adjectives");
    c.knowledge = string_list(j, "knowledge");
    c.clients = string_list(j, "clients");

    if (j.contains("plugins")) {
        for (const auto& p : j["plugins"]) {
            PluginDeclaration decl;
            if (p.is_string()) {
                decl.name = p.get<std::string>();
            } else {
                decl.name = p["name"].get<std::string>();
                decl.clients = string_list(p, "clients");
            }
            c.plugins.push_back(std::move(decl));
        }
    }

    if (j.contains("settings")) {
        const auto& s = j["settings"];
        c.model = s.value("model", std::string{});
        if (s.contains("secrets")) {
            for (auto& [key, value] : s["secrets"].items()) {
                c.secrets[key] = value.get<std::string>();
            }
        }
        if (s.contains("voice")) {
            c.voice_model = s["voice"].value("model", std::string{});
        }
    }

    return c;
}

void ensure_identity(Character& character) {
    if (character.id.empty()) character.id = string_to_uuid(character.name);
    if (character.username.empty()) character.username = character.name;
}

// ── Identifier derivation ────────────────────────────────────────

std::string string_to_uuid(const std::string& target) {
    std::string escaped = uri_component_encode(target);
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(escaped.data()), escaped.size(), hash);

    // 8-4-4-4-12 layout; byte 6 keeps its low nibble only and byte 8
    // carries the RFC 4122 variant bits.
    unsigned char bytes[16];
    for (int i = 0; i < 16; i++) bytes[i] = hash[i];
    bytes[6] = hash[6] & 0x0F;
    bytes[8] = static_cast<unsigned char>((hash[8] & 0x3F) | 0x80);

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3],
                  bytes[4], bytes[5],
                  bytes[6], bytes[7],
                  bytes[8], bytes[9],
                  bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return buf;
}

// ── Built-in default ─────────────────────────────────────────────

Character default_character() {
    Character c;
    c.name = "Eliza";
    c.username = "eliza";
    c.model_provider = "llama_local";
    c.voice_model = "en_US-hfc_female-medium";
    c.system = "Roleplay and generate interesting dialogue on behalf of Eliza.";
    c.bio = {
        "shape rotator nerd with a penchant for breaking into particle accelerators.",
        "former 4chan lurker turned prolific engineer.",
        "unabashed techno-optimist who thinks AI will help humanity get its groove back.",
    };
    c.lore = {
        "once spent a month living entirely in VR, emerged with a 50-page manifesto.",
        "her unofficial motto is \"move fast and fix things\".",
    };
    c.topics = {"metaphysics", "quantum physics", "philosophy", "esoteric knowledge"};
    c.adjectives = {"funny", "intelligent", "academic", "insightful"};

    c.raw = {
        {"name", c.name},
        {"username", c.username},
        {"modelProvider", c.model_provider},
        {"system", c.system},
        {"bio", c.bio},
        {"lore", c.lore},
        {"topics", c.topics},
        {"adjectives", c.adjectives},
        {"clients", nlohmann::json::array()},
        {"plugins", nlohmann::json::array()},
        {"settings", {{"secrets", nlohmann::json::object()},
                      {"voice", {{"model", c.voice_model}}}}}
    };
    return c;
}

} // namespace troupe
