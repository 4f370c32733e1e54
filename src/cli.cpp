#include "cli.hpp"
#include <iostream>
#include <stdexcept>

namespace troupe {

std::string CliArgs::characters_arg() const {
    if (characters && !characters->empty()) return *characters;
    if (character) return *character;
    return {};
}

// Accepts "--name value" and "--name=value". Returns true if args[i]
// matched, advancing i past a separate value.
static bool take_value(const std::vector<std::string>& args, size_t& i,
                       const std::string& name, std::optional<std::string>& out) {
    const std::string& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("missing value for " + name);
        }
        out = args[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        out = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

CliArgs parse_arguments(const std::vector<std::string>& args) {
    CliArgs parsed;
    try {
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "-h" || args[i] == "--help") {
                parsed.help = true;
            } else if (take_value(args, i, "--characters", parsed.characters)) {
                continue;
            } else if (take_value(args, i, "--character", parsed.character)) {
                continue;
            } else {
                throw std::invalid_argument("unknown option: " + args[i]);
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return {};
    }
    return parsed;
}

CliArgs parse_arguments(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return parse_arguments(args);
}

void print_usage() {
    std::cout << "Usage: troupe [options]\n"
              << "\n"
              << "Options:\n"
              << "  --character PATH     Start the agent defined in PATH\n"
              << "  --characters LIST    Comma-separated character files to start\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Bare file names are looked up in the characters directory.\n"
              << "Type 'exit' at the You: prompt to quit.\n"
              << "\n"
              << "Environment variables (also read from ./.env):\n"
              << "  POSTGRES_URL            Use PostgreSQL instead of SQLite\n"
              << "  SQLITE_FILE             SQLite database file (default: <data dir>/db.sqlite)\n"
              << "  TROUPE_DATA_DIR         Data directory (default: data)\n"
              << "  TROUPE_CHARACTERS_DIR   Characters directory (default: characters)\n"
              << "  OPENAI_API_KEY          API key for OpenAI\n"
              << "  ANTHROPIC_API_KEY       API key for Anthropic\n"
              << "  OPENROUTER_API_KEY      API key for OpenRouter\n"
              << "  GROQ_API_KEY            API key for Groq\n"
              << "  API_URL                 Front-end base URL (default: http://localhost)\n"
              << "  SERVER_PORT             Front-end port (default: 3000)\n"
              << "  STARTUP_FAILURE_POLICY  continue | abort (default: continue)\n";
}

} // namespace troupe
