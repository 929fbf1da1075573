#include "clues/clue.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace flit {

namespace {
using json = nlohmann::json;

constexpr std::size_t kMinOutlineVertices = 10;

const ClueType kAllTypes[] = {
    ClueType::Flag, ClueType::Outline, ClueType::Borders, ClueType::Capital, ClueType::Stats,
    ClueType::SportsTeam, ClueType::Leader, ClueType::Nickname, ClueType::Landmark,
    ClueType::FlagDescription
};

bool containsUnknown(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("unknown") != std::string::npos;
}

bool hasText(const json& data, const char* key) {
    if (!data.contains(key) || !data[key].is_string()) return false;
    return !data[key].get<std::string>().empty();
}

std::string textOf(const json& data, const char* key) {
    if (!data.contains(key)) return {};
    const auto& value = data[key];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::string formatStats(const json& stats) {
    static const std::pair<const char*, const char*> kLabels[] = {
        {"population", "Pop"},
        {"continent", "Continent"},
        {"language", "Predominant language"},
        {"currency", "Currency"},
        {"religion", "Predominant religion"},
        {"headOfState", "Leader"},
        {"sport", "Sport"},
        {"celebrity", "Celebrity"},
        {"funFact", "Fun fact"},
    };

    std::ostringstream out;
    bool first = true;
    for (const auto& [key, value] : stats.items()) {
        if (key == "areaName") continue;
        std::string label = key;
        for (const auto& [k, l] : kLabels) {
            if (key == k) {
                label = l;
                break;
            }
        }
        if (!first) out << '\n';
        out << label << ": " << (value.is_string() ? value.get<std::string>() : value.dump());
        first = false;
    }
    return out.str();
}
}

const std::vector<ClueType>& countryClueTypes() {
    static const std::vector<ClueType> kTypes = {
        ClueType::Flag, ClueType::Outline, ClueType::Borders, ClueType::Capital, ClueType::Stats
    };
    return kTypes;
}

const char* clueTypeName(ClueType type) {
    switch (type) {
        case ClueType::Flag: return "flag";
        case ClueType::Outline: return "outline";
        case ClueType::Borders: return "borders";
        case ClueType::Capital: return "capital";
        case ClueType::Stats: return "stats";
        case ClueType::SportsTeam: return "sportsTeam";
        case ClueType::Leader: return "leader";
        case ClueType::Nickname: return "nickname";
        case ClueType::Landmark: return "landmark";
        case ClueType::FlagDescription: return "flagDescription";
    }
    return "flag";
}

std::optional<ClueType> clueTypeFromName(const std::string& name) {
    for (ClueType type : kAllTypes) {
        if (name == clueTypeName(type)) return type;
    }
    return std::nullopt;
}

bool Clue::isValid() const {
    const json& data = displayData;
    switch (type) {
        case ClueType::Flag:
            return true;
        case ClueType::Outline: {
            // Fewer than 10 vertices reads as a generic rectangle.
            std::size_t vertices = 0;
            if (data.contains("polygons") && data["polygons"].is_array()) {
                for (const auto& ring : data["polygons"]) {
                    if (ring.is_array()) vertices += ring.size();
                }
            } else if (data.contains("points") && data["points"].is_array()) {
                vertices = data["points"].size();
            }
            return vertices >= kMinOutlineVertices;
        }
        case ClueType::Borders: {
            if (!data.contains("neighbors") || !data["neighbors"].is_array()) return false;
            const auto& neighbors = data["neighbors"];
            if (neighbors.empty()) return false;
            for (const auto& n : neighbors) {
                if (!n.is_string() || containsUnknown(n.get<std::string>())) return false;
            }
            return true;
        }
        case ClueType::Capital:
            return hasText(data, "capitalName") && !containsUnknown(data["capitalName"].get<std::string>());
        case ClueType::Stats: {
            if (!data.is_object() || data.empty()) return false;
            for (const auto& [key, value] : data.items()) {
                if (value.is_null()) return false;
                std::string text = value.is_string() ? value.get<std::string>() : value.dump();
                if (text.empty() || containsUnknown(text)) return false;
            }
            return true;
        }
        case ClueType::SportsTeam: return hasText(data, "team");
        case ClueType::Leader: return hasText(data, "leader");
        case ClueType::Nickname: return hasText(data, "nickname");
        case ClueType::Landmark: return hasText(data, "landmark");
        case ClueType::FlagDescription: return hasText(data, "flagDesc");
    }
    return false;
}

std::string Clue::displayText() const {
    switch (type) {
        case ClueType::Flag:
            return textOf(displayData, "flagEmoji");
        case ClueType::Outline:
            return "[Country Outline]";
        case ClueType::Borders: {
            std::ostringstream out;
            out << "Borders: ";
            bool first = true;
            if (displayData.contains("neighbors")) {
                for (const auto& n : displayData["neighbors"]) {
                    if (!first) out << ", ";
                    out << (n.is_string() ? n.get<std::string>() : n.dump());
                    first = false;
                }
            }
            return out.str();
        }
        case ClueType::Capital:
            return "Capital: " + textOf(displayData, "capitalName");
        case ClueType::Stats:
            return formatStats(displayData);
        case ClueType::SportsTeam: return textOf(displayData, "team");
        case ClueType::Leader: return textOf(displayData, "leader");
        case ClueType::Nickname: return textOf(displayData, "nickname");
        case ClueType::Landmark: return textOf(displayData, "landmark");
        case ClueType::FlagDescription: return textOf(displayData, "flagDesc");
    }
    return {};
}

} // namespace flit
