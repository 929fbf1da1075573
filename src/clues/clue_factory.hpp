#pragma once

#include "clues/clue.hpp"
#include "data/country_shape.hpp"
#include <optional>
#include <set>
#include <string>

namespace flit {

class Rng;
class TargetSource;

namespace ClueFactory {

Clue flag(const std::string& countryCode);
Clue outline(const TargetSource& source, const std::string& countryCode);
Clue borders(const TargetSource& source, const std::string& countryCode);
Clue capital(const TargetSource& source, const std::string& countryCode);
Clue stats(const TargetSource& source, const std::string& countryCode);

/**
 * @brief Picks a valid clue for a country.
 *
 * The type pool is the country clue types restricted to @p allowed (empty
 * means unrestricted; a filter that leaves nothing falls back to all
 * country types). Each attempt draws an untried type, taking @p preferred
 * directly with @p boost percent probability while it is untried. Returns
 * the first valid clue, or a flag clue after 10 attempts.
 *
 * Every random choice comes from @p rng, so a seeded generator reproduces
 * the same clue.
 */
Clue forCountry(const TargetSource& source,
                const std::string& countryCode,
                Rng& rng,
                const std::set<ClueType>& allowed = {},
                std::optional<ClueType> preferred = std::nullopt,
                int boost = 0);

// Uniform pick among the clues the area's facts support. Outline is always offered.
Clue forRegionalArea(const RegionalArea& area, Rng& rng);

} // namespace ClueFactory

} // namespace flit
