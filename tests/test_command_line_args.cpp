// tests/test_command_line_args.cpp
//
// Regression coverage for tools/townlife_sim/CommandLine.{hpp,cpp}.
//
// Goals:
//   - Option names are case-insensitive, values are not
//   - Both "--opt value" and "--opt=value" are supported
//   - Unknown options and bad values are reported in order

#include <doctest/doctest.h>

#include "townlife_sim/CommandLine.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace {

[[nodiscard]] townlife::demo::CommandLineArgs Parse(std::initializer_list<const char*> argv)
{
    std::vector<std::string> storage(argv.begin(), argv.end());
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size());
    for (auto& s : storage)
        ptrs.push_back(s.data());
    return townlife::demo::ParseCommandLineArgs(static_cast<int>(ptrs.size()), ptrs.data());
}

} // namespace

TEST_CASE("CommandLineArgs parses basic flags (case-insensitive)")
{
    const auto args = Parse({"townlife_sim", "--VERBOSE", "--Restore", "-h"});

    CHECK(args.verbose);
    CHECK(args.restore);
    CHECK(args.showHelp);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs accepts both value forms")
{
    const auto args = Parse({
        "townlife_sim",
        "--config=Sim.json",
        "--data-dir", "./Save",
        "--SECONDS=0",
        "--seed", "42",
        "--log-dir=logs",
    });

    CHECK(args.configPath == std::optional<std::string>{"Sim.json"});
    CHECK(args.dataDir == std::optional<std::string>{"./Save"});
    CHECK(args.logDir == std::optional<std::string>{"logs"});
    REQUIRE(args.seconds.has_value());
    CHECK(*args.seconds == 0);
    REQUIRE(args.seed.has_value());
    CHECK(*args.seed == 42u);
    CHECK(args.unknown.empty());
}

TEST_CASE("CommandLineArgs reports unknown options and bad values in order")
{
    const auto args = Parse({
        "townlife_sim",
        "--frobnicate",
        "--seconds=-5",
        "--seed", "abc",
        "--config",
    });

    CHECK_FALSE(args.seconds.has_value());
    CHECK_FALSE(args.seed.has_value());
    CHECK_FALSE(args.configPath.has_value());
    REQUIRE(args.unknown.size() == 4);
    CHECK(args.unknown[0] == "--frobnicate");
    CHECK(args.unknown[1] == "--seconds=-5");
    CHECK(args.unknown[2] == "--seed");
    CHECK(args.unknown[3] == "--config");
}

TEST_CASE("CommandLineArgs help text lists every option")
{
    const std::string help = townlife::demo::BuildCommandLineHelpText();
    for (const char* opt : {"--config", "--data-dir", "--restore", "--seconds", "--seed", "--log-dir", "--verbose"})
        CHECK(help.find(opt) != std::string::npos);
}
