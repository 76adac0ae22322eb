#include <catch2/catch_test_macros.hpp>
#include "candidate_reader.hpp"
#include "puzzle_writer.hpp"
#include "irodori/puzzle.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace irodori;
using namespace irodori::tool;

// ============================================================================
// Cell characters
// ============================================================================

TEST_CASE("Cell characters map to color indices", "[reader]") {
    REQUIRE(decode_cell('.') == 0);
    REQUIRE(decode_cell('1') == 1);
    REQUIRE(decode_cell('9') == 9);
    REQUIRE(decode_cell('a') == 10);
    REQUIRE(decode_cell('v') == 31);
    REQUIRE(decode_cell('w') == -1);
    REQUIRE(decode_cell('0') == -1);
    REQUIRE(decode_cell('#') == -1);

    for (int c = 0; c <= 31; ++c) {
        REQUIRE(decode_cell(encode_cell(static_cast<ColorIndex>(c))) == c);
    }
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Parse a single candidate", "[reader]") {
    auto candidates = parse_string(R"(
        # plus sign
        candidate "plus" {
            palette = [#1F2937];
            grid = [
                "..1..",
                "..1..",
                "11111",
                "..1..",
                "..1..",
            ];
        }
    )");

    REQUIRE(candidates.size() == 1);
    const auto& c = candidates[0];
    REQUIRE(c.name == "plus");
    REQUIRE(c.palette.size() == 1);
    REQUIRE(c.palette.color(1) == Rgb{0x1f, 0x29, 0x37});
    REQUIRE(c.grid.width() == 5);
    REQUIRE(c.grid.height() == 5);
    REQUIRE(c.grid.at(2, 0) == 1);
    REQUIRE(c.grid.at(0, 0) == 0);
    REQUIRE(c.grid.filled_count() == 9);
}

TEST_CASE("Parse several candidates in order", "[reader]") {
    auto candidates = parse_string(R"(
        candidate "first" { grid = ["1"]; palette = [#000000]; }
        #
        candidate "second" {
            palette = [#000000, #ffffff, #ff0000, #00ff00, #0000ff, #ffff00, #00ffff,
                       #ff00ff, #808080, #400000,];
            grid = ["12a", ".9."];
        }
    )");

    REQUIRE(candidates.size() == 2);
    REQUIRE(candidates[0].name == "first");
    REQUIRE(candidates[1].name == "second");
    REQUIRE(candidates[1].palette.size() == 10);
    REQUIRE(candidates[1].grid.at(0, 2) == 10);
    REQUIRE(candidates[1].grid.at(1, 1) == 9);
}

TEST_CASE("Empty input has no candidates", "[reader]") {
    REQUIRE(parse_string("").empty());
    REQUIRE(parse_string("# nothing here\n").empty());
}

TEST_CASE("Candidate without palette parses with an empty palette", "[reader]") {
    auto candidates = parse_string(R"(candidate "bare" { grid = ["..."]; })");
    REQUIRE(candidates.size() == 1);
    REQUIRE(candidates[0].palette.empty());
    REQUIRE(candidates[0].grid.filled_count() == 0);
}

TEST_CASE("Parse errors", "[reader]") {
    SECTION("syntax") {
        REQUIRE_THROWS_AS(parse_string(R"(candidate "x" { grid = "1"; })"), std::runtime_error);
    }

    SECTION("unterminated candidate") {
        REQUIRE_THROWS_AS(parse_string(R"(candidate "x" { grid = ["1"];)"), std::runtime_error);
    }

    SECTION("duplicate grid") {
        try {
            parse_string(R"(candidate "x" { grid = ["1"]; grid = ["1"]; })");
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("duplicate grid") != std::string::npos);
        }
    }

    SECTION("duplicate palette") {
        REQUIRE_THROWS_AS(
            parse_string(R"(candidate "x" { palette = [#000000]; palette = []; grid = ["1"]; })"),
            std::runtime_error);
    }

    SECTION("missing grid") {
        try {
            parse_string(R"(candidate "x" { palette = [#000000]; })");
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("has no grid") != std::string::npos);
        }
    }

    SECTION("ragged rows") {
        REQUIRE_THROWS_AS(parse_string(R"(candidate "x" { grid = ["11", "1"]; })"),
                          std::runtime_error);
    }

    SECTION("bad cell character") {
        try {
            parse_string(R"(candidate "x" { grid = ["1x"]; })");
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("invalid cell 'x'") != std::string::npos);
        }
    }

    SECTION("error message carries the line number") {
        try {
            parse_string("candidate \"x\" {\n\n  grid = [\"1\"]\n}\n");
            FAIL("expected an exception");
        } catch (const std::runtime_error& e) {
            REQUIRE(std::string(e.what()).find("line 4") != std::string::npos);
        }
    }
}

TEST_CASE("parse_file reports missing files", "[reader]") {
    REQUIRE_THROWS_AS(parse_file("/nonexistent/candidates.txt"), std::runtime_error);
}

// ============================================================================
// JSON output
// ============================================================================

TEST_CASE("Accepted puzzles are written as JSON", "[writer]") {
    auto candidates = parse_string(R"(
        candidate "plus" {
            palette = [#1f2937];
            grid = ["..1..", "..1..", "11111", "..1..", "..1.."];
        }
        candidate "pair" {
            palette = [#1f2937];
            grid = ["1.", ".1"];
        }
    )");

    PuzzleBuilder builder(Config{});
    std::vector<BuildOutcome> outcomes;
    for (const auto& c : candidates) {
        outcomes.push_back(builder.build(c));
    }
    REQUIRE(outcomes[0].status == BuildStatus::Accepted);
    REQUIRE(outcomes[1].status == BuildStatus::Rejected);

    auto j = to_json(*outcomes[0].puzzle);
    REQUIRE(j["name"] == "plus");
    REQUIRE(j["w"] == 5);
    REQUIRE(j["h"] == 5);
    REQUIRE(j["p"].size() == 1);
    REQUIRE(j["p"][0] == "#1f2937");
    REQUIRE(j["r"].size() == 5);
    REQUIRE(j["c"].size() == 5);
    REQUIRE(j["r"][2] == nlohmann::json::parse("[[5, 1]]"));
    REQUIRE(j["s"][2] == nlohmann::json::parse("[1, 1, 1, 1, 1]"));
    REQUIRE(j["s"][0][0] == 0);
    REQUIRE(j["tier"] == to_string(outcomes[0].puzzle->difficulty.tier));
    REQUIRE(j["score"].is_number());

    const auto& quality = outcomes[0].puzzle->quality;
    REQUIRE(j["quality"]["grade"] == to_string(quality.grade));
    REQUIRE(j["quality"]["score"].is_number());
    REQUIRE(j["quality"]["score"].get<double>() >= 0.0);
    REQUIRE(j["quality"]["score"].get<double>() <= 100.0);
    REQUIRE(j["quality"]["notes"].is_array());
    REQUIRE(j["quality"]["notes"].size() == quality.notes.size());
    REQUIRE(j["quality"]["notes"].get<std::vector<std::string>>() == quality.notes);

    std::ostringstream out;
    write_puzzles(out, outcomes);
    auto written = nlohmann::json::parse(out.str());
    REQUIRE(written.is_array());
    REQUIRE(written.size() == 1);
    REQUIRE(written[0]["name"] == "plus");
}
