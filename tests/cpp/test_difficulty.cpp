#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "irodori/difficulty.hpp"
#include "irodori/quality.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

using namespace irodori;

namespace {

DifficultyFeatures base_features() {
    DifficultyFeatures f;
    f.fill_ratio = 0.45;
    f.color_count = 2;
    f.clue_fragmentation = 1.5;
    f.max_dimension = 10;
    f.total_cells = 100;
    f.simple_cells = 60;
    f.edge_cells = 30;
    f.cross_line_cells = 10;
    f.propagation_passes = 3;
    return f;
}

ColorGrid plus_sign() {
    return ColorGrid::from_rows({
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
        {1, 1, 1, 1, 1},
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
    });
}

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("Config defaults are valid", "[config]") {
    Config config;
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.min_color_distance == 35.0);
    REQUIRE(config.max_colors == 6);
    REQUIRE(config.max_runs_per_line == 15);
    REQUIRE(config.timeout == std::chrono::seconds(30));
}

TEST_CASE("Config rejects inconsistent values", "[config]") {
    Config config;

    SECTION("palette limit beyond the mask width") {
        config.max_colors = MAX_PALETTE_COLORS + 1;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("zero colors") {
        config.max_colors = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("non-positive timeout") {
        config.timeout = std::chrono::milliseconds(0);
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("thresholds out of order") {
        config.tier_thresholds[3] = config.tier_thresholds[2];
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("negative weight") {
        config.weights.depth = -0.1;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
}

TEST_CASE("Tier names round trip", "[config]") {
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        auto tier = static_cast<Tier>(i);
        REQUIRE(parse_tier(to_string(tier)) == tier);
    }
    REQUIRE_FALSE(parse_tier("impossible").has_value());
}

// ============================================================================
// Tier mapping
// ============================================================================

TEST_CASE("Tier thresholds are inclusive lower bounds", "[difficulty]") {
    Config config;
    REQUIRE(tier_for_score(0.0, config) == Tier::Trivial);
    REQUIRE(tier_for_score(11.99, config) == Tier::Trivial);
    REQUIRE(tier_for_score(12.0, config) == Tier::Easy);
    REQUIRE(tier_for_score(40.0, config) == Tier::Hard);
    REQUIRE(tier_for_score(159.0, config) == Tier::Expert);
    REQUIRE(tier_for_score(1e6, config) == Tier::Master);

    config.tier_thresholds = {{0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0}};
    REQUIRE(tier_for_score(3.5, config) == Tier::Hard);
}

// ============================================================================
// Monotonicity
// ============================================================================

TEST_CASE("Difficulty score is monotonic", "[difficulty]") {
    Config config;
    auto base = base_features();
    double base_score = score_difficulty(base, config).score;

    SECTION("any backtracking") {
        auto f = base;
        f.branch_count = 1;
        f.backtrack_depth = 1;
        auto report = score_difficulty(f, config);
        REQUIRE(report.score > base_score);
        REQUIRE(report.score >= config.weights.backtrack_score_floor);
    }

    SECTION("deeper backtracking") {
        auto f = base;
        f.branch_count = 4;
        double previous = 0.0;
        for (size_t depth = 1; depth <= 8; ++depth) {
            f.backtrack_depth = depth;
            double score = score_difficulty(f, config).score;
            REQUIRE(score >= previous);
            previous = score;
        }
    }

    SECTION("more branches") {
        auto f = base;
        f.backtrack_depth = 3;
        double previous = 0.0;
        for (size_t branches : {1, 2, 5, 20, 100}) {
            f.branch_count = branches;
            double score = score_difficulty(f, config).score;
            REQUIRE(score >= previous);
            previous = score;
        }
    }

    SECTION("larger grid") {
        auto f = base;
        f.max_dimension = 20;
        REQUIRE(score_difficulty(f, config).score > base_score);
    }

    SECTION("more colors") {
        auto f = base;
        f.color_count = 4;
        REQUIRE(score_difficulty(f, config).score > base_score);
    }

    SECTION("more expensive techniques") {
        auto f = base;
        f.edge_cells += 10;
        double with_edge = score_difficulty(f, config).score;
        REQUIRE(with_edge > base_score);
        f.cross_line_cells += 10;
        REQUIRE(score_difficulty(f, config).score > with_edge);
    }

    SECTION("the floor never lowers a score") {
        auto f = base;
        f.max_dimension = 60;
        f.branch_count = 10;
        f.backtrack_depth = 5;
        auto report = score_difficulty(f, config);
        REQUIRE_FALSE(report.factors.floored);
        REQUIRE(report.score > config.weights.backtrack_score_floor);
    }
}

TEST_CASE("Difficulty factors multiply", "[difficulty]") {
    Config config;
    auto report = score_difficulty(base_features(), config);
    const auto& f = report.factors;
    REQUIRE(f.backtracking == Catch::Approx(1.0));
    REQUIRE(f.fill_balance == Catch::Approx(0.9));
    REQUIRE(report.score == Catch::Approx(f.baseline * f.technique * f.backtracking));
}

// ============================================================================
// Feature extraction
// ============================================================================

TEST_CASE("Features of the plus sign", "[difficulty]") {
    auto grid = plus_sign();
    auto clues = derive_clues(grid);
    SolveTrace trace;
    trace.simple_overlap_cells = 9;
    trace.edge_alignment_cells = 16;
    trace.propagation_passes = 2;

    auto f = extract_features(grid, clues, trace);
    REQUIRE(f.total_cells == 25);
    REQUIRE(f.max_dimension == 5);
    REQUIRE(f.color_count == 1);
    REQUIRE(f.fill_ratio == Catch::Approx(9.0 / 25.0));
    REQUIRE(f.clue_fragmentation == Catch::Approx(1.0));
    REQUIRE(f.branch_count == 0);

    Config config;
    auto report = score_difficulty(f, config);
    REQUIRE(report.score == Catch::Approx(12.44 * 1.42));
    REQUIRE(report.tier == Tier::Easy);
}

// ============================================================================
// Quality
// ============================================================================

TEST_CASE("Quality report of a small single-color puzzle", "[quality]") {
    auto grid = plus_sign();
    auto report = score_quality(grid, derive_clues(grid), 1);

    REQUIRE(report.score >= 0.0);
    REQUIRE(report.score <= 100.0);
    REQUIRE(report.factors.fill_ratio == Catch::Approx(1.0));
    REQUIRE(report.factors.grid_size == Catch::Approx(0.5));
    REQUIRE(report.factors.color_effectiveness == Catch::Approx(0.5));

    auto has_note = [&](const std::string& text) {
        return std::find(report.notes.begin(), report.notes.end(), text) != report.notes.end();
    };
    REQUIRE(has_note("Small grid (5x5)"));
    REQUIRE(has_note("Single color puzzle"));
}

TEST_CASE("Quality grades follow the score", "[quality]") {
    // 10x10, two balanced colors, content touching every edge
    ColorGrid grid(10, 10);
    for (size_t r = 0; r < 10; ++r) {
        for (size_t c = 0; c < 10; ++c) {
            if ((r + c) % 3 != 0) {
                grid.set(r, c, static_cast<ColorIndex>(r < 5 ? 1 : 2));
            }
        }
    }
    auto report = score_quality(grid, derive_clues(grid), 2);

    REQUIRE(report.factors.grid_size == Catch::Approx(1.0));
    REQUIRE(report.factors.aspect_ratio == Catch::Approx(1.0));
    if (report.score >= 85.0) {
        REQUIRE(report.grade == QualityGrade::Excellent);
    } else if (report.score >= 70.0) {
        REQUIRE(report.grade == QualityGrade::Good);
    } else {
        REQUIRE(report.score < 70.0);
    }
    REQUIRE(std::string(to_string(QualityGrade::Fair)) == "fair");
}
