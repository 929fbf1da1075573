#pragma once

#include "data/country_shape.hpp"
#include "data/game_region.hpp"
#include "scoring/difficulty.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flit {

class Rng;

/**
 * @brief Read-only source of round targets and the facts clues are built from.
 *
 * Ratings are in [0, 1]: 0 is universally known, 1 is extremely obscure.
 */
class TargetSource {
public:
    virtual ~TargetSource() = default;

    // Countries eligible as round targets, in a stable order.
    virtual const std::vector<CountryShape>& playableCountries() const = 0;

    virtual std::optional<CountryShape> country(const std::string& code) const = 0;
    virtual std::optional<CapitalCity> capital(const std::string& code) const = 0;
    virtual double difficultyRating(const std::string& code) const = 0;
    virtual std::vector<std::string> neighbors(const std::string& code) const = 0;

    // Flat object of display facts (population, currency, ...). Empty if unknown.
    virtual nlohmann::json stats(const std::string& code) const = 0;

    virtual std::vector<RegionalArea> areas(GameRegion region) const = 0;

    // Playable countries whose rating lies within the given inclusive bounds.
    std::vector<CountryShape> targetsFiltered(std::optional<double> minRating,
                                              std::optional<double> maxRating) const;

    // Uniform pick from the playable pool. Throws std::runtime_error when empty.
    CountryShape randomTarget(Rng& rng) const;
};

} // namespace flit
