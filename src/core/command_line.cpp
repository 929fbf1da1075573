#include "core/command_line.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace flit {

namespace {
bool allDigits(const std::string& text) {
    if (text.empty()) return false;
    for (unsigned char c : text) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}
}

std::optional<uint64_t> parseSeed(const std::string& text) {
    if (!allDigits(text)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) return std::nullopt;
    return static_cast<uint64_t>(v);
}

std::optional<int> parseHintCount(const std::string& text) {
    if (!allDigits(text)) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size() ||
        v > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(v);
}

void printUsage() {
    std::cerr << "Usage: flit [--config PATH] [--seed N] [--region NAME] "
                 "[--difficulty easy|normal|hard] [--hints K]" << std::endl;
}

std::optional<CommandLine> parseCommandLine(const std::vector<std::string>& args) {
    CommandLine cmd;
    bool shapesRandomRound = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (i + 1 >= args.size()) {
            printUsage();
            return std::nullopt;
        }
        const std::string& value = args[++i];

        if (arg == "--config") {
            cmd.configPath = value;
        } else if (arg == "--seed") {
            cmd.seed = parseSeed(value);
            if (!cmd.seed) {
                std::cerr << "Invalid seed: " << value << std::endl;
                printUsage();
                return std::nullopt;
            }
        } else if (arg == "--region") {
            auto region = regionFromName(value);
            if (!region) {
                std::cerr << "Unknown region: " << value << std::endl;
                return std::nullopt;
            }
            cmd.round.region = *region;
            shapesRandomRound = true;
        } else if (arg == "--difficulty") {
            auto difficulty = difficultyFromName(value);
            if (!difficulty) {
                std::cerr << "Unknown difficulty: " << value << std::endl;
                return std::nullopt;
            }
            cmd.round.difficulty = *difficulty;
            shapesRandomRound = true;
        } else if (arg == "--hints") {
            auto hints = parseHintCount(value);
            if (!hints) {
                std::cerr << "Invalid hint count: " << value << std::endl;
                printUsage();
                return std::nullopt;
            }
            cmd.hints = *hints;
        } else {
            printUsage();
            return std::nullopt;
        }
    }

    if (cmd.seed && shapesRandomRound) {
        std::cerr << "Warning: --region and --difficulty are ignored for seeded rounds" << std::endl;
    }
    return cmd;
}

} // namespace flit
