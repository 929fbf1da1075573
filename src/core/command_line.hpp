#pragma once

#include "core/session/round_options.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flit {

// Options for one run of the flit driver.
struct CommandLine {
    std::string configPath = "assets/config/flit.json";
    std::optional<uint64_t> seed;
    RoundOptions round;
    int hints = 0;
};

// Whole-string decimal parses. Signs, blanks and trailing text are rejected.
std::optional<uint64_t> parseSeed(const std::string& text);
std::optional<int> parseHintCount(const std::string& text);

/**
 * @brief Parses the driver arguments (argv without the program name).
 *
 * Returns an empty optional after reporting the problem on std::cerr.
 * --region and --difficulty only shape random rounds, so combining them
 * with --seed prints a warning.
 */
std::optional<CommandLine> parseCommandLine(const std::vector<std::string>& args);

void printUsage();

} // namespace flit
