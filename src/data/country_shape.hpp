#pragma once

#include "math/vec2.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flit {

struct CapitalCity {
    std::string name;
    Vec2 location;
};

/**
 * @brief A country-level target. Boundary polygons are lng/lat rings.
 */
struct CountryShape {
    std::string code;
    std::string name;
    std::vector<std::vector<Vec2>> polygons;
    std::optional<std::string> capitalName;

    // Every boundary point of every polygon, in polygon order.
    std::vector<Vec2> allPoints() const {
        std::vector<Vec2> points;
        for (const auto& polygon : polygons) {
            points.insert(points.end(), polygon.begin(), polygon.end());
        }
        return points;
    }

    std::size_t vertexCount() const {
        std::size_t count = 0;
        for (const auto& polygon : polygons) {
            count += polygon.size();
        }
        return count;
    }
};

/**
 * @brief A sub-national target (state, county, island).
 *
 * The optional facts feed regional clues; a missing fact means that clue
 * type is not offered for the area.
 */
struct RegionalArea {
    std::string code;
    std::string name;
    std::vector<Vec2> points;
    std::optional<std::string> capital;
    std::optional<int64_t> population;
    std::optional<std::string> funFact;
    std::optional<double> difficulty;

    std::vector<std::string> sportsTeams;
    std::optional<std::string> leader;
    std::optional<std::string> nickname;
    std::optional<std::string> landmark;
    std::optional<std::string> flagDescription;

    // Country-shaped view of the area, used as the session target.
    CountryShape asCountry() const {
        CountryShape shape;
        shape.code = code;
        shape.name = name;
        shape.polygons.push_back(points);
        shape.capitalName = capital;
        return shape;
    }
};

} // namespace flit
