#pragma once
#include "character.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <stdexcept>

namespace troupe {

// An explicitly named character file could not be read, parsed or
// validated. Fatal for the whole process.
class CharacterLoadError : public std::runtime_error {
public:
    CharacterLoadError(const std::string& path, const std::string& reason)
        : std::runtime_error("Error loading character from " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Resolve one entry of --characters: a bare filename is looked up in
// characters_dir, then the result is made absolute against the cwd.
std::string resolve_character_path(const std::string& entry,
                                   const std::string& characters_dir);

// Load a single character file. Throws CharacterLoadError.
Character load_character_file(const std::string& path);

// Load a comma-separated list of character files, in order. Throws
// CharacterLoadError on the first failing path. Returns the built-in
// default character when nothing was loaded.
std::vector<Character> load_characters(const std::string& characters_arg,
                                       const Config& config);

} // namespace troupe
