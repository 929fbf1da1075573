#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flit {

enum class ClueType {
    Flag,
    Outline,
    Borders,
    Capital,
    Stats,
    // Regional clue types
    SportsTeam,
    Leader,
    Nickname,
    Landmark,
    FlagDescription
};

// Country-level types in declaration order.
const std::vector<ClueType>& countryClueTypes();

// Stable name used in options, config and results ("flag", "sportsTeam").
const char* clueTypeName(ClueType type);
std::optional<ClueType> clueTypeFromName(const std::string& name);

/**
 * @brief A clue shown to the player for one round.
 *
 * displayData is a JSON object whose keys depend on the type, e.g.
 * "flagEmoji", "neighbors", "capitalName", or the stats fields.
 */
struct Clue {
    ClueType type = ClueType::Flag;
    std::string targetCode;
    nlohmann::json displayData = nlohmann::json::object();

    // Rejects clues with missing, empty or "unknown" data.
    bool isValid() const;

    std::string displayText() const;
};

} // namespace flit
