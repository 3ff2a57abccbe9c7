// tests/test_command_line.cpp

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "app/CommandLine.hpp"

using game2048::app::ParseOutcome;
using game2048::app::parseCommandLine;
using game2048::app::usage;

using Args = std::vector<std::string>;

TEST_CASE("CommandLine: defaults without arguments", "[config]")
{
    const auto cmd = parseCommandLine(Args{});
    REQUIRE(cmd.outcome == ParseOutcome::Run);

    const auto& cfg = cmd.config;
    CHECK(cfg.boardSize == 4);
    CHECK(cfg.target == 2048);
    CHECK(cfg.bestScorePath == "best_score.dat");
    CHECK(cfg.fourProbability == 0.1);
    CHECK_FALSE(cfg.seed.has_value());
}

TEST_CASE("CommandLine: all options", "[config]")
{
    const auto cmd = parseCommandLine(Args{
        "--size", "5",
        "--target", "8192",
        "--best-file", "/tmp/scores.dat",
        "--seed", "4242",
    });
    REQUIRE(cmd.outcome == ParseOutcome::Run);

    const auto& cfg = cmd.config;
    CHECK(cfg.boardSize == 5);
    CHECK(cfg.target == 8192);
    CHECK(cfg.bestScorePath == "/tmp/scores.dat");
    REQUIRE(cfg.seed.has_value());
    CHECK(*cfg.seed == 4242u);
}

TEST_CASE("CommandLine: help is not an error", "[config]")
{
    CHECK(parseCommandLine(Args{"--help"}).outcome == ParseOutcome::ShowHelp);
    CHECK(parseCommandLine(Args{"-h"}).outcome == ParseOutcome::ShowHelp);

    // Help wins over whatever follows it
    CHECK(parseCommandLine(Args{"--size", "5", "--help", "--bogus"}).outcome
          == ParseOutcome::ShowHelp);
}

TEST_CASE("CommandLine: rejects bad input", "[config]")
{
    auto outcomeOf = [](const Args& args) { return parseCommandLine(args).outcome; };

    CHECK(outcomeOf({"--fullscreen", "1"}) == ParseOutcome::Error);
    CHECK(outcomeOf({"--size"}) == ParseOutcome::Error);

    CHECK(outcomeOf({"--size", "1"}) == ParseOutcome::Error);
    CHECK(outcomeOf({"--size", "9"}) == ParseOutcome::Error);
    CHECK(outcomeOf({"--size", "four"}) == ParseOutcome::Error);

    CHECK(outcomeOf({"--target", "1024"}) == ParseOutcome::Error);
    CHECK(outcomeOf({"--target", "-2048"}) == ParseOutcome::Error);

    CHECK(outcomeOf({"--seed", "4294967296"}) == ParseOutcome::Error);
}

TEST_CASE("CommandLine: argc/argv skips the program name", "[config]")
{
    char prog[] = "game2048_sdl";
    char opt[] = "--size";
    char val[] = "3";
    char* argv[] = {prog, opt, val};

    const auto cmd = parseCommandLine(3, argv);
    REQUIRE(cmd.outcome == ParseOutcome::Run);
    CHECK(cmd.config.boardSize == 3);

    CHECK(usage("game2048_sdl").find("--best-file") != std::string::npos);
}
