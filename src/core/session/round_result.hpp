#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace flit {

class GameSession;

/**
 * @brief Score submission record for the leaderboard service.
 */
struct RoundResult {
    std::string targetCode;
    std::string clueType;
    int64_t elapsedMs = 0;
    int score = 0;

    static RoundResult fromSession(const GameSession& session);

    // {"targetCode", "clueType", "elapsedMs", "score"}
    nlohmann::json toJson() const;
};

} // namespace flit
