/**
 * @file test_pak_tool_args.cpp
 * @brief Command-line parsing for pak_tool.
 */

#include <catch2/catch_test_macros.hpp>

#include "pak_tool_args.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace {

// Runs parse_args over "pak_tool <args...>".
bool parse(std::initializer_list<const char*> args, pak_tool::Options& opts) {
    std::vector<std::string> storage{"pak_tool"};
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& s : storage) {
        argv.push_back(s.data());
    }
    return pak_tool::parse_args(static_cast<int>(argv.size()), argv.data(), opts);
}

} // namespace

TEST_CASE("pak_tool parses commands and options", "[tools][cli]") {
    pak_tool::Options opts;
    REQUIRE(parse({"pack", "index.xml", "data", "-o", "out.pak", "--level", "3", "--store", "-v"}, opts));
    REQUIRE(opts.command == "pack");
    REQUIRE(opts.positional == std::vector<std::string>{"index.xml", "data"});
    REQUIRE(opts.output == "out.pak");
    REQUIRE(opts.level == 3);
    REQUIRE(opts.store);
    REQUIRE(opts.verbose);
}

TEST_CASE("pak_tool rejects bad compression levels", "[tools][cli]") {
    for (const char* level : {"abc", "", "5x", "-1", "10", "99999999999999999999"}) {
        pak_tool::Options opts;
        INFO("level = \"" << level << "\"");
        REQUIRE_FALSE(parse({"pack", "index.xml", "data", "-o", "out.pak", "--level", level}, opts));
    }

    pak_tool::Options opts;
    REQUIRE(parse({"pack", "index.xml", "data", "-o", "out.pak", "--level", "0"}, opts));
    REQUIRE(opts.level == 0);
}

TEST_CASE("pak_tool validates required arguments", "[tools][cli]") {
    pak_tool::Options opts;

    SECTION("extract needs --output") {
        REQUIRE_FALSE(parse({"extract", "a.pak"}, opts));
    }

    SECTION("list takes exactly one archive") {
        REQUIRE_FALSE(parse({"list"}, opts));

        pak_tool::Options two;
        REQUIRE_FALSE(parse({"list", "a.pak", "b.pak"}, two));
    }

    SECTION("unknown command") {
        REQUIRE_FALSE(parse({"frobnicate"}, opts));
    }

    SECTION("unknown option") {
        REQUIRE_FALSE(parse({"list", "a.pak", "--bogus"}, opts));
    }
}
