#include "data/json_target_source.hpp"
#include "utils/config_loader.hpp"
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

namespace flit {

namespace {

std::optional<Vec2> parsePoint(const json& value) {
    if (!value.is_array() || value.size() != 2 ||
        !value[0].is_number() || !value[1].is_number()) {
        return std::nullopt;
    }
    return Vec2(value[0].get<double>(), value[1].get<double>());
}

std::vector<Vec2> parseRing(const json& value) {
    std::vector<Vec2> ring;
    if (!value.is_array()) return ring;
    ring.reserve(value.size());
    for (const auto& p : value) {
        if (auto point = parsePoint(p)) {
            ring.push_back(*point);
        }
    }
    return ring;
}

std::optional<std::string> optionalString(const json& entry, const char* key) {
    if (entry.contains(key) && entry[key].is_string()) {
        std::string value = entry[key].get<std::string>();
        if (!value.empty()) return value;
    }
    return std::nullopt;
}

bool isString(const json& v) { return v.is_string(); }
bool isNumber(const json& v) { return v.is_number(); }
bool isBoolean(const json& v) { return v.is_boolean(); }
bool isArray(const json& v) { return v.is_array(); }
bool isObject(const json& v) { return v.is_object(); }

struct FieldRule {
    const char* key;
    bool (*check)(const json&);
};

// First field that is present with the wrong JSON type, or nullptr.
const char* mistypedField(const json& entry, std::initializer_list<FieldRule> rules) {
    for (const auto& rule : rules) {
        auto it = entry.find(rule.key);
        if (it != entry.end() && !rule.check(*it)) return rule.key;
    }
    return nullptr;
}

}

JsonTargetSource JsonTargetSource::load(const std::string& path) {
    auto document = loadJsonConfig(path, "JsonTargetSource");
    if (!document) {
        throw std::runtime_error("Failed to load target data: " + path);
    }
    JsonTargetSource source = fromJson(*document);
    std::cout << "[JsonTargetSource] Loaded " << source.countryCount() << " countries ("
              << source.playableCountries().size() << " playable) from " << path << std::endl;
    return source;
}

JsonTargetSource JsonTargetSource::fromJson(const json& document) {
    JsonTargetSource source;

    if (document.contains("countries") && document["countries"].is_array()) {
        for (const auto& entry : document["countries"]) {
            source.parseCountry(entry);
        }
    }

    if (document.contains("regions") && document["regions"].is_object()) {
        for (const auto& [name, entries] : document["regions"].items()) {
            auto region = regionFromName(name);
            if (!region || *region == GameRegion::World) {
                std::cerr << "[JsonTargetSource] Ignoring unknown region: " << name << std::endl;
                continue;
            }
            source.parseRegion(*region, entries);
        }
    }

    return source;
}

void JsonTargetSource::parseCountry(const json& entry) {
    if (!entry.is_object()) {
        std::cerr << "[JsonTargetSource] Skipping country entry that is not an object" << std::endl;
        return;
    }
    const char* bad = mistypedField(entry, {
        {"code", isString}, {"name", isString}, {"playable", isBoolean},
        {"difficulty", isNumber}, {"polygons", isArray}, {"points", isArray},
        {"capital", isObject}, {"neighbors", isArray}, {"stats", isObject},
    });
    if (!bad && entry.contains("capital")) {
        bad = mistypedField(entry["capital"], {{"name", isString}, {"lng", isNumber}, {"lat", isNumber}});
    }
    if (bad) {
        std::cerr << "[JsonTargetSource] Skipping country " << entry.value("code", json("?")).dump()
                  << ": wrong type for '" << bad << "'" << std::endl;
        return;
    }

    std::string code = entry.value("code", "");
    std::string name = entry.value("name", "");
    if (code.empty() || name.empty()) {
        std::cerr << "[JsonTargetSource] Skipping country without code or name" << std::endl;
        return;
    }
    if (m_index.count(code)) {
        std::cerr << "[JsonTargetSource] Skipping duplicate country: " << code << std::endl;
        return;
    }

    CountryShape shape;
    shape.code = code;
    shape.name = name;

    if (entry.contains("polygons")) {
        for (const auto& ring : entry["polygons"]) {
            auto points = parseRing(ring);
            if (!points.empty()) shape.polygons.push_back(std::move(points));
        }
    } else if (entry.contains("points")) {
        auto points = parseRing(entry["points"]);
        if (!points.empty()) shape.polygons.push_back(std::move(points));
    }

    if (shape.polygons.empty()) {
        std::cerr << "[JsonTargetSource] Skipping country without boundary: " << code << std::endl;
        return;
    }

    if (entry.contains("capital")) {
        const auto& cap = entry["capital"];
        std::string capName = cap.value("name", "");
        if (!capName.empty()) {
            shape.capitalName = capName;
            if (cap.contains("lng") && cap.contains("lat")) {
                m_capitals[code] = CapitalCity{capName, Vec2(cap["lng"].get<double>(), cap["lat"].get<double>())};
            }
        }
    }

    if (entry.contains("difficulty")) {
        m_ratings[code] = clampRating(entry["difficulty"].get<double>());
    }

    if (entry.contains("neighbors")) {
        std::vector<std::string> names;
        for (const auto& n : entry["neighbors"]) {
            if (n.is_string()) names.push_back(n.get<std::string>());
        }
        m_neighbors[code] = std::move(names);
    }

    if (entry.contains("stats")) {
        m_stats[code] = entry["stats"];
    }

    m_index[code] = m_countries.size();
    m_countries.push_back(shape);
    if (entry.value("playable", true)) {
        m_playable.push_back(std::move(shape));
    }
}

void JsonTargetSource::parseRegion(GameRegion region, const json& entries) {
    if (!entries.is_array()) {
        std::cerr << "[JsonTargetSource] Region " << regionName(region) << " is not a list" << std::endl;
        return;
    }

    auto& areas = m_regions[region];
    for (const auto& entry : entries) {
        if (!entry.is_object()) {
            std::cerr << "[JsonTargetSource] Skipping area in " << regionName(region)
                      << " that is not an object" << std::endl;
            continue;
        }
        const char* bad = mistypedField(entry, {
            {"code", isString}, {"name", isString}, {"points", isArray},
            {"capital", isString}, {"population", isNumber}, {"funFact", isString},
            {"difficulty", isNumber}, {"sportsTeams", isArray}, {"leader", isString},
            {"nickname", isString}, {"landmark", isString}, {"flagDescription", isString},
        });
        if (bad) {
            std::cerr << "[JsonTargetSource] Skipping area " << entry.value("code", json("?")).dump()
                      << " in " << regionName(region) << ": wrong type for '" << bad << "'" << std::endl;
            continue;
        }

        RegionalArea area;
        area.code = entry.value("code", "");
        area.name = entry.value("name", "");
        if (entry.contains("points")) {
            area.points = parseRing(entry["points"]);
        }
        if (area.code.empty() || area.name.empty() || area.points.empty()) {
            std::cerr << "[JsonTargetSource] Skipping malformed area in " << regionName(region) << std::endl;
            continue;
        }

        area.capital = optionalString(entry, "capital");
        area.funFact = optionalString(entry, "funFact");
        area.leader = optionalString(entry, "leader");
        area.nickname = optionalString(entry, "nickname");
        area.landmark = optionalString(entry, "landmark");
        area.flagDescription = optionalString(entry, "flagDescription");
        if (entry.contains("population")) {
            area.population = static_cast<int64_t>(entry["population"].get<double>());
        }
        if (entry.contains("difficulty")) {
            area.difficulty = clampRating(entry["difficulty"].get<double>());
        }
        if (entry.contains("sportsTeams")) {
            for (const auto& team : entry["sportsTeams"]) {
                if (team.is_string()) area.sportsTeams.push_back(team.get<std::string>());
            }
        }

        areas.push_back(std::move(area));
    }
}

std::optional<CountryShape> JsonTargetSource::country(const std::string& code) const {
    auto it = m_index.find(code);
    if (it == m_index.end()) return std::nullopt;
    return m_countries[it->second];
}

std::optional<CapitalCity> JsonTargetSource::capital(const std::string& code) const {
    auto it = m_capitals.find(code);
    if (it == m_capitals.end()) return std::nullopt;
    return it->second;
}

double JsonTargetSource::difficultyRating(const std::string& code) const {
    auto it = m_ratings.find(code);
    return it != m_ratings.end() ? it->second : kDefaultDifficultyRating;
}

std::vector<std::string> JsonTargetSource::neighbors(const std::string& code) const {
    auto it = m_neighbors.find(code);
    if (it == m_neighbors.end()) return {};
    return it->second;
}

json JsonTargetSource::stats(const std::string& code) const {
    auto it = m_stats.find(code);
    if (it == m_stats.end()) return json::object();
    return it->second;
}

std::vector<RegionalArea> JsonTargetSource::areas(GameRegion region) const {
    if (region == GameRegion::World) {
        std::vector<RegionalArea> result;
        result.reserve(m_playable.size());
        for (const auto& c : m_playable) {
            RegionalArea area;
            area.code = c.code;
            area.name = c.name;
            area.points = c.allPoints();
            area.capital = c.capitalName;
            result.push_back(std::move(area));
        }
        return result;
    }
    auto it = m_regions.find(region);
    if (it == m_regions.end()) return {};
    return it->second;
}

} // namespace flit
