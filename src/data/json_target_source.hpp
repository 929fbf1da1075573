#pragma once

#include "data/target_source.hpp"
#include <map>
#include <unordered_map>

namespace flit {

/**
 * @brief TargetSource backed by a JSON data set (assets/data/world.json).
 */
class JsonTargetSource : public TargetSource {
public:
    // Throws std::runtime_error if the file cannot be read or parsed.
    static JsonTargetSource load(const std::string& path);
    static JsonTargetSource fromJson(const nlohmann::json& document);

    const std::vector<CountryShape>& playableCountries() const override { return m_playable; }

    std::optional<CountryShape> country(const std::string& code) const override;
    std::optional<CapitalCity> capital(const std::string& code) const override;
    double difficultyRating(const std::string& code) const override;
    std::vector<std::string> neighbors(const std::string& code) const override;
    nlohmann::json stats(const std::string& code) const override;
    std::vector<RegionalArea> areas(GameRegion region) const override;

    std::size_t countryCount() const { return m_countries.size(); }

private:
    void parseCountry(const nlohmann::json& entry);
    void parseRegion(GameRegion region, const nlohmann::json& entries);

    std::vector<CountryShape> m_countries;
    std::vector<CountryShape> m_playable;
    std::unordered_map<std::string, std::size_t> m_index;
    std::unordered_map<std::string, CapitalCity> m_capitals;
    std::unordered_map<std::string, double> m_ratings;
    std::unordered_map<std::string, std::vector<std::string>> m_neighbors;
    std::unordered_map<std::string, nlohmann::json> m_stats;
    std::map<GameRegion, std::vector<RegionalArea>> m_regions;
};

} // namespace flit
