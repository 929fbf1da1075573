#include "core/session/round_result.hpp"
#include "core/session/game_session.hpp"

namespace flit {

RoundResult RoundResult::fromSession(const GameSession& session) {
    RoundResult result;
    result.targetCode = session.target().code;
    result.clueType = clueTypeName(session.clue().type);
    result.elapsedMs = static_cast<int64_t>(session.elapsed().count());
    result.score = session.score();
    return result;
}

nlohmann::json RoundResult::toJson() const {
    return {
        {"targetCode", targetCode},
        {"clueType", clueType},
        {"elapsedMs", elapsedMs},
        {"score", score}
    };
}

}
