#include "data/target_source.hpp"
#include "math/rng.hpp"
#include <stdexcept>

namespace flit {

std::vector<CountryShape> TargetSource::targetsFiltered(std::optional<double> minRating,
                                                        std::optional<double> maxRating) const {
    std::vector<CountryShape> result;
    for (const auto& c : playableCountries()) {
        double rating = difficultyRating(c.code);
        if (minRating && rating < *minRating) continue;
        if (maxRating && rating > *maxRating) continue;
        result.push_back(c);
    }
    return result;
}

CountryShape TargetSource::randomTarget(Rng& rng) const {
    const auto& pool = playableCountries();
    if (pool.empty()) {
        throw std::runtime_error("Target source has no playable countries");
    }
    return pool[static_cast<std::size_t>(rng.nextInt(static_cast<int>(pool.size())))];
}

} // namespace flit
