#include <doctest/doctest.h>

#include "core/app.hpp"
#include "scoring/round_score.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace flit;

namespace {

std::string writeAppConfig(const std::string& difficulty, int clueBoost = 25) {
    auto path = std::filesystem::temp_directory_path() /
                ("flit_app_" + difficulty + "_" + std::to_string(clueBoost) + ".json");
    std::ofstream out(path);
    out << R"({ "data": { "path": ")" << FLIT_SOURCE_DIR << R"(/assets/data/world.json" },)"
        << R"( "gameplay": { "difficulty": ")" << difficulty << R"(", "clueBoost": )" << clueBoost << " } }";
    return path.string();
}

int flyToTarget(App& app) {
    int steps = 0;
    while (app.session() && !app.session()->isCompleted() && steps < 10000) {
        app.update(App::FIXED_DT);
        ++steps;
    }
    return steps;
}

}

TEST_CASE("App fails to init without a data set") {
    auto path = std::filesystem::temp_directory_path() / "flit_app_nodata.json";
    {
        std::ofstream out(path);
        out << R"({ "data": { "path": "/nonexistent/world.json" } })";
    }
    App app;
    CHECK_FALSE(app.init(path.string()));
    std::filesystem::remove(path);
}

TEST_CASE("Seeded round flies to the target and scores") {
    std::string path = writeAppConfig("normal");
    App app;
    REQUIRE(app.init(path));
    REQUIRE(app.startSeededRound(2024, {}));
    REQUIRE(app.isRoundActive());

    GameSession* session = app.session();
    CHECK(session->flightPath().size() == 1);

    app.useHint();
    int steps = flyToTarget(app);
    CHECK(steps < 10000);
    REQUIRE(session->isCompleted());

    CHECK(session->hintsUsed() == 1);
    CHECK(session->fuelFraction() == doctest::Approx(app.fuelFraction()));
    CHECK(session->score() >= 0);
    CHECK(session->score() <= kMaxRoundScore - kHintTierPenalties[0]);
    CHECK(session->flightPath().size() == static_cast<std::size_t>(steps) + 1);

    // Further updates leave the finished round alone.
    app.update(App::FIXED_DT);
    CHECK(session->flightPath().size() == static_cast<std::size_t>(steps) + 1);

    std::filesystem::remove(path);
}

TEST_CASE("Same seed picks the same round in two apps") {
    std::string path = writeAppConfig("normal");
    App a;
    App b;
    REQUIRE(a.init(path));
    REQUIRE(b.init(path));
    REQUIRE(a.startSeededRound(77, {}));
    REQUIRE(b.startSeededRound(77, {}));

    CHECK(a.session()->target().code == b.session()->target().code);
    CHECK(a.session()->clue().type == b.session()->clue().type);
    CHECK(a.session()->startPosition() == b.session()->startPosition());
    std::filesystem::remove(path);
}

TEST_CASE("Random round follows the configured difficulty") {
    std::string path = writeAppConfig("easy");
    App app;
    REQUIRE(app.init(path));
    CHECK(app.config().difficulty == GameDifficulty::Easy);

    for (int i = 0; i < 10; ++i) {
        REQUIRE(app.startRound(RoundOptions{}));
        CHECK(app.session()->difficultyRating() <= kEasyThreshold);
    }
    std::filesystem::remove(path);
}

TEST_CASE("Clue boost comes from config only when the round leaves it unset") {
    std::string path = writeAppConfig("normal", 100);
    App app;
    REQUIRE(app.init(path));

    RoundOptions options;
    options.clues.preferredClueType = ClueType::Flag;
    for (int i = 0; i < 10; ++i) {
        REQUIRE(app.startRound(options));
        CHECK(app.session()->clue().type == ClueType::Flag);
    }

    options.clues.clueBoost = 0;
    bool sawOther = false;
    for (int i = 0; i < 40; ++i) {
        REQUIRE(app.startRound(options));
        if (app.session()->clue().type != ClueType::Flag) sawOther = true;
    }
    CHECK(sawOther);
    std::filesystem::remove(path);
}

TEST_CASE("Regional round lands inside the region") {
    std::string path = writeAppConfig("normal");
    App app;
    REQUIRE(app.init(path));

    RoundOptions options;
    options.region = GameRegion::Ireland;
    REQUIRE(app.startRound(options));
    REQUIRE(app.session()->targetArea());
    CHECK(regionBounds(GameRegion::Ireland).contains(app.session()->startPosition()));

    flyToTarget(app);
    CHECK(app.session()->isCompleted());
    std::filesystem::remove(path);
}

TEST_CASE("Hints are capped at four tiers") {
    std::string path = writeAppConfig("normal");
    App app;
    REQUIRE(app.init(path));
    REQUIRE(app.startSeededRound(5, {}));
    for (int i = 0; i < 6; ++i) app.useHint();
    CHECK(app.hintsUsed() == App::kMaxHints);

    app.endRound();
    CHECK_FALSE(app.isRoundActive());
    CHECK(app.hintsUsed() == 0);
    std::filesystem::remove(path);
}
