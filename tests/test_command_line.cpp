#include <doctest/doctest.h>

#include "core/command_line.hpp"

#include <string>
#include <vector>

using namespace flit;

TEST_CASE("Seeds must be plain decimal numbers") {
    CHECK(parseSeed("0") == std::optional<uint64_t>(0));
    CHECK(parseSeed("2024") == std::optional<uint64_t>(2024));
    CHECK(parseSeed("18446744073709551615") == std::optional<uint64_t>(UINT64_MAX));

    CHECK_FALSE(parseSeed(""));
    CHECK_FALSE(parseSeed("abc"));
    CHECK_FALSE(parseSeed("12abc"));
    CHECK_FALSE(parseSeed("-1"));
    CHECK_FALSE(parseSeed(" 7"));
    CHECK_FALSE(parseSeed("18446744073709551616"));
}

TEST_CASE("Hint counts must be plain decimal numbers") {
    CHECK(parseHintCount("3") == std::optional<int>(3));
    CHECK_FALSE(parseHintCount("x"));
    CHECK_FALSE(parseHintCount("2.5"));
    CHECK_FALSE(parseHintCount("-2"));
    CHECK_FALSE(parseHintCount("99999999999999"));
}

TEST_CASE("Command line fills the round options") {
    auto cmd = parseCommandLine({"--config", "my.json", "--region", "ireland",
                                 "--difficulty", "hard", "--hints", "2"});
    REQUIRE(cmd);
    CHECK(cmd->configPath == "my.json");
    CHECK_FALSE(cmd->seed);
    CHECK(cmd->round.region == GameRegion::Ireland);
    CHECK(cmd->round.difficulty == std::optional<GameDifficulty>(GameDifficulty::Hard));
    CHECK(cmd->hints == 2);

    auto defaults = parseCommandLine({});
    REQUIRE(defaults);
    CHECK(defaults->configPath == "assets/config/flit.json");
    CHECK(defaults->hints == 0);
}

TEST_CASE("Bad command line values are rejected") {
    CHECK_FALSE(parseCommandLine({"--seed", "abc"}));
    CHECK_FALSE(parseCommandLine({"--hints", "x"}));
    CHECK_FALSE(parseCommandLine({"--region", "mars"}));
    CHECK_FALSE(parseCommandLine({"--difficulty", "brutal"}));
    CHECK_FALSE(parseCommandLine({"--seed"}));
    CHECK_FALSE(parseCommandLine({"--fuel", "0.5"}));
}

TEST_CASE("Seeded runs still parse with random-round options") {
    auto cmd = parseCommandLine({"--seed", "42", "--region", "ireland"});
    REQUIRE(cmd);
    CHECK(cmd->seed == std::optional<uint64_t>(42));
    CHECK(cmd->round.region == GameRegion::Ireland);
}
