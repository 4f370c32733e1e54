#include "character_loader.hpp"
#include "util.hpp"

#include <filesystem>
#include <iostream>

namespace troupe {

std::string resolve_character_path(const std::string& entry,
                                   const std::string& characters_dir) {
    std::filesystem::path p(entry);
    if (p.filename() == p) {
        p = std::filesystem::path(characters_dir) / p;
    }
    return std::filesystem::absolute(p).lexically_normal().string();
}

Character load_character_file(const std::string& path) {
    std::string content;
    try {
        content = read_file(path);
    } catch (const std::exception& e) {
        throw CharacterLoadError(path, e.what());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw CharacterLoadError(path, e.what());
    }

    try {
        return character_from_json(j);
    } catch (const CharacterValidationError& e) {
        throw CharacterLoadError(path, std::string("invalid character: ") + e.what());
    }
}

std::vector<Character> load_characters(const std::string& characters_arg,
                                       const Config& config) {
    std::vector<std::string> paths;
    for (const auto& entry : split(characters_arg, ',')) {
        std::string trimmed = trim(entry);
        if (trimmed.empty()) continue;
        paths.push_back(resolve_character_path(trimmed, config.characters_dir));
    }

    std::vector<Character> loaded;
    for (const auto& path : paths) {
        std::cerr << "[characters] Loading " << path << "\n";
        loaded.push_back(load_character_file(path));
    }

    if (loaded.empty()) {
        std::cerr << "[characters] No characters found, using default character\n";
        loaded.push_back(default_character());
    }

    std::cerr << "[characters] Using " << loaded.size() << " character(s):";
    for (const auto& c : loaded) std::cerr << " " << c.name;
    std::cerr << "\n";

    return loaded;
}

} // namespace troupe
