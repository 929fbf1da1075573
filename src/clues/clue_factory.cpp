#include "clues/clue_factory.hpp"
#include "data/target_source.hpp"
#include "math/rng.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace flit {

namespace {
using json = nlohmann::json;

constexpr int kMaxClueAttempts = 10;

// Regional indicator symbols: 'A' maps to U+1F1E6.
std::string flagEmoji(const std::string& code) {
    std::string out;
    for (char ch : code) {
        unsigned char c = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(ch)));
        if (c < 'A' || c > 'Z') continue;
        uint32_t cp = 0x1F1E6u + (c - 'A');
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

json pointsToJson(const std::vector<Vec2>& points) {
    json ring = json::array();
    for (const auto& p : points) {
        ring.push_back({p.x, p.y});
    }
    return ring;
}

std::string formatPopulation(int64_t population) {
    char buffer[32];
    if (population >= 1000000) {
        std::snprintf(buffer, sizeof(buffer), "%.1fM", static_cast<double>(population) / 1000000.0);
    } else if (population >= 1000) {
        std::snprintf(buffer, sizeof(buffer), "%.0fK", static_cast<double>(population) / 1000.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lld", static_cast<long long>(population));
    }
    return buffer;
}

Clue makeClue(ClueType type, const std::string& code, json data) {
    Clue clue;
    clue.type = type;
    clue.targetCode = code;
    clue.displayData = std::move(data);
    return clue;
}

bool containsUnknown(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("unknown") != std::string::npos;
}
}

namespace ClueFactory {

Clue flag(const std::string& countryCode) {
    return makeClue(ClueType::Flag, countryCode, {{"flagEmoji", flagEmoji(countryCode)}});
}

Clue outline(const TargetSource& source, const std::string& countryCode) {
    json polygons = json::array();
    if (auto country = source.country(countryCode)) {
        for (const auto& ring : country->polygons) {
            polygons.push_back(pointsToJson(ring));
        }
    }
    return makeClue(ClueType::Outline, countryCode, {{"polygons", polygons}});
}

Clue borders(const TargetSource& source, const std::string& countryCode) {
    json neighbors = json::array();
    for (const auto& name : source.neighbors(countryCode)) {
        neighbors.push_back(name);
    }
    return makeClue(ClueType::Borders, countryCode, {{"neighbors", neighbors}});
}

Clue capital(const TargetSource& source, const std::string& countryCode) {
    std::string name;
    if (auto cap = source.capital(countryCode)) {
        name = cap->name;
    } else if (auto country = source.country(countryCode)) {
        name = country->capitalName.value_or("");
    }
    return makeClue(ClueType::Capital, countryCode, {{"capitalName", name}});
}

Clue stats(const TargetSource& source, const std::string& countryCode) {
    return makeClue(ClueType::Stats, countryCode, source.stats(countryCode));
}

Clue forCountry(const TargetSource& source,
                const std::string& countryCode,
                Rng& rng,
                const std::set<ClueType>& allowed,
                std::optional<ClueType> preferred,
                int boost) {
    std::vector<ClueType> types;
    for (ClueType type : countryClueTypes()) {
        if (allowed.empty() || allowed.count(type)) {
            types.push_back(type);
        }
    }
    if (types.empty()) {
        types = countryClueTypes();
    }

    std::optional<ClueType> preferredType;
    if (preferred && boost > 0 &&
        std::find(types.begin(), types.end(), *preferred) != types.end()) {
        preferredType = preferred;
    }

    std::set<ClueType> tried;
    for (int attempt = 0; attempt < kMaxClueAttempts; ++attempt) {
        std::vector<ClueType> available;
        for (ClueType type : types) {
            if (!tried.count(type)) available.push_back(type);
        }
        if (available.empty()) break;

        ClueType type;
        if (preferredType && !tried.count(*preferredType) && rng.nextInt(100) < boost) {
            type = *preferredType;
        } else {
            type = available[static_cast<std::size_t>(rng.nextInt(static_cast<int>(available.size())))];
        }
        tried.insert(type);

        Clue clue;
        switch (type) {
            case ClueType::Outline: clue = outline(source, countryCode); break;
            case ClueType::Borders: clue = borders(source, countryCode); break;
            case ClueType::Capital: clue = capital(source, countryCode); break;
            case ClueType::Stats: clue = stats(source, countryCode); break;
            default: clue = flag(countryCode); break;
        }

        if (clue.isValid()) {
            return clue;
        }
    }

    return flag(countryCode);
}

Clue forRegionalArea(const RegionalArea& area, Rng& rng) {
    std::vector<Clue> candidates;

    candidates.push_back(makeClue(ClueType::Outline, area.code,
                                  {{"points", pointsToJson(area.points)}, {"areaName", area.name}}));

    if (area.capital && !area.capital->empty() && !containsUnknown(*area.capital)) {
        candidates.push_back(makeClue(ClueType::Capital, area.code,
                                      {{"capitalName", *area.capital}, {"areaName", area.name}}));
    }

    if (area.population && *area.population > 0) {
        json data = {{"population", formatPopulation(*area.population)}, {"areaName", area.name}};
        if (area.funFact) data["funFact"] = *area.funFact;
        candidates.push_back(makeClue(ClueType::Stats, area.code, data));
    }

    if (!area.sportsTeams.empty()) {
        std::size_t pick = 0;
        if (area.sportsTeams.size() > 1) {
            pick = static_cast<std::size_t>(rng.nextInt(static_cast<int>(area.sportsTeams.size())));
        }
        candidates.push_back(makeClue(ClueType::SportsTeam, area.code, {{"team", area.sportsTeams[pick]}}));
    }
    if (area.leader) {
        candidates.push_back(makeClue(ClueType::Leader, area.code, {{"leader", *area.leader}}));
    }
    if (area.nickname) {
        candidates.push_back(makeClue(ClueType::Nickname, area.code, {{"nickname", *area.nickname}}));
    }
    if (area.landmark) {
        candidates.push_back(makeClue(ClueType::Landmark, area.code, {{"landmark", *area.landmark}}));
    }
    if (area.flagDescription) {
        candidates.push_back(makeClue(ClueType::FlagDescription, area.code, {{"flagDesc", *area.flagDescription}}));
    }

    return candidates[static_cast<std::size_t>(rng.nextInt(static_cast<int>(candidates.size())))];
}

} // namespace ClueFactory

} // namespace flit
