#include <catch2/catch_test_macros.hpp>
#include "irodori/search.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <random>
#include <stdexcept>
#include <vector>

using namespace irodori;

namespace {

ColorGrid random_grid(std::mt19937& rng, size_t width, size_t height, size_t colors,
                      double empty_prob) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<int> color_dist(1, static_cast<int>(colors));
    ColorGrid grid(width, height);
    for (size_t r = 0; r < height; ++r) {
        for (size_t c = 0; c < width; ++c) {
            if (coin(rng) >= empty_prob) {
                grid.set(r, c, static_cast<ColorIndex>(color_dist(rng)));
            }
        }
    }
    return grid;
}

// All lines of the given length over colors 0..colors that encode to the clue
std::vector<std::vector<ColorIndex>> line_placements(const Clue& clue, size_t n, size_t colors) {
    std::vector<std::vector<ColorIndex>> result;
    std::vector<ColorIndex> line(n, 0);
    for (;;) {
        if (encode_line(line) == clue) result.push_back(line);
        size_t pos = 0;
        while (pos < n && line[pos] == colors) {
            line[pos] = 0;
            ++pos;
        }
        if (pos == n) break;
        line[pos]++;
    }
    return result;
}

/**
 * Count grids consistent with the clues (stops at 2). Rows are chosen from
 * their placements and columns are checked once every row is chosen.
 */
size_t brute_force_count(const ClueSet& clues, size_t colors) {
    size_t width = clues.width();
    size_t height = clues.height();
    std::vector<std::vector<std::vector<ColorIndex>>> options;
    for (size_t r = 0; r < height; ++r) {
        options.push_back(line_placements(clues.rows[r], width, colors));
    }

    size_t count = 0;
    ColorGrid grid(width, height);

    std::function<void(size_t)> dfs = [&](size_t row) {
        if (count >= 2) return;
        if (row == height) {
            for (size_t c = 0; c < width; ++c) {
                if (encode_line(grid.column(c)) != clues.columns[c]) return;
            }
            count++;
            return;
        }
        for (const auto& line : options[row]) {
            for (size_t c = 0; c < width; ++c) grid.set(row, c, line[c]);
            dfs(row + 1);
        }
    };
    dfs(0);
    return count;
}

SearchLimits quick_limits() {
    SearchLimits limits;
    limits.timeout = std::chrono::milliseconds(10000);
    limits.max_nodes = 1000000;
    return limits;
}

}  // namespace

// ============================================================================
// Grid trail
// ============================================================================

TEST_CASE("Grid restrict and rewind", "[grid]") {
    Grid grid(3, 2, full_mask(2));
    REQUIRE(grid.determined_count() == 0);

    REQUIRE(grid.restrict(1, 0, color_bit(1) | color_bit(2)));
    REQUIRE(grid.assign(2, 0, 2));
    REQUIRE(grid.is_determined(0));
    REQUIRE(grid.value(0) == 2);
    REQUIRE(grid.determined_count() == 1);

    SECTION("empty intersection is rejected without change") {
        REQUIRE_FALSE(grid.restrict(3, 0, color_bit(1)));
        REQUIRE(grid.mask(0) == color_bit(2));
    }

    SECTION("rewind restores each level") {
        grid.rewind_to(1);
        REQUIRE(grid.mask(0) == (color_bit(1) | color_bit(2)));
        REQUIRE(grid.determined_count() == 0);
        grid.rewind_to(0);
        REQUIRE(grid.mask(0) == full_mask(2));
        REQUIRE(grid.trail_size() == 0);
    }

    SECTION("incomplete grid cannot be committed") {
        REQUIRE_THROWS_AS(grid.to_color_grid(), std::logic_error);
    }
}

// ============================================================================
// Grid propagation loop
// ============================================================================

TEST_CASE("GridPropagator solves the plus sign without search", "[propagation]") {
    auto truth = ColorGrid::from_rows({
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
        {1, 1, 1, 1, 1},
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
    });
    auto clues = derive_clues(truth);

    Grid grid(5, 5, full_mask(1));
    GridPropagator prop(clues);
    SolveTrace trace;
    prop.mark_all_dirty();
    auto result = prop.run(grid, 0, trace, true, StopToken());

    REQUIRE(result.status == PropagationStatus::Fixpoint);
    REQUIRE(grid.is_complete());
    REQUIRE(grid.to_color_grid() == truth);
    REQUIRE(trace.logic_cells() == 25);
    REQUIRE(trace.simple_overlap_cells > 0);
    REQUIRE(trace.search_deductions == 0);
}

TEST_CASE("GridPropagator fixpoint is idempotent", "[propagation]") {
    std::mt19937 rng(12345);

    for (int iter = 0; iter < 30; ++iter) {
        auto truth = random_grid(rng, 8, 7, 2, 0.5);
        auto clues = derive_clues(truth);

        Grid grid(8, 7, full_mask(2));
        GridPropagator prop(clues);
        SolveTrace trace;
        prop.mark_all_dirty();
        auto first = prop.run(grid, 0, trace, true, StopToken());
        REQUIRE(first.status == PropagationStatus::Fixpoint);

        std::vector<ColorMask> before;
        for (size_t i = 0; i < grid.size(); ++i) before.push_back(grid.mask(i));
        size_t trail = grid.trail_size();

        prop.mark_all_dirty();
        auto second = prop.run(grid, 0, trace, true, StopToken());
        REQUIRE(second.status == PropagationStatus::Fixpoint);
        REQUIRE(second.passes == 1);
        REQUIRE(grid.trail_size() == trail);
        for (size_t i = 0; i < grid.size(); ++i) {
            REQUIRE(grid.mask(i) == before[i]);
            // The ground truth is never ruled out
            REQUIRE((grid.mask(i) & color_bit(truth.cells()[i])) != 0);
        }
    }
}

TEST_CASE("GridPropagator reports the contradicting line", "[propagation]") {
    ClueSet clues;
    clues.rows = {Clue{{1, 1}, {1, 1}}, Clue{}};
    clues.columns = {Clue{}, Clue{}};

    Grid grid(2, 2, full_mask(1));
    GridPropagator prop(clues);
    SolveTrace trace;
    prop.mark_all_dirty();
    auto result = prop.run(grid, 0, trace, true, StopToken());

    REQUIRE(result.status == PropagationStatus::Contradiction);
    REQUIRE(result.axis == Axis::Row);
    REQUIRE(result.line == 0);
}

TEST_CASE("GridPropagator stops on a cancelled token", "[propagation]") {
    auto clues = derive_clues(ColorGrid::from_rows({{1, 0}, {0, 1}}));
    std::atomic<bool> cancel{true};

    Grid grid(2, 2, full_mask(1));
    GridPropagator prop(clues);
    SolveTrace trace;
    prop.mark_all_dirty();
    auto result = prop.run(grid, 0, trace, true, StopToken(&cancel));

    REQUIRE(result.status == PropagationStatus::Stopped);
    REQUIRE(grid.determined_count() == 0);
}

// ============================================================================
// Uniqueness checker
// ============================================================================

TEST_CASE("UniquenessChecker unique puzzle", "[search]") {
    auto truth = ColorGrid::from_rows({
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
        {1, 1, 1, 1, 1},
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
    });
    auto clues = derive_clues(truth);
    UniquenessChecker checker(clues, 1);
    auto result = checker.check(quick_limits());

    REQUIRE(result.verdict == Verdict::Unique);
    REQUIRE(result.solution.has_value());
    REQUIRE(*result.solution == truth);
    REQUIRE(result.trace.branch_count == 0);
    REQUIRE(result.trace.backtrack_depth == 0);
}

TEST_CASE("UniquenessChecker multiple solutions", "[search]") {
    auto truth = ColorGrid::from_rows({{1, 0}, {0, 1}});
    auto clues = derive_clues(truth);
    UniquenessChecker checker(clues, 1);
    auto result = checker.check(quick_limits());

    REQUIRE(result.verdict == Verdict::Multiple);
    REQUIRE(result.solution.has_value());
    REQUIRE(result.second_solution.has_value());
    REQUIRE(*result.solution != *result.second_solution);
    REQUIRE(result.trace.branch_count >= 1);
}

TEST_CASE("UniquenessChecker infeasible clues", "[search]") {
    SECTION("contradiction before branching") {
        ClueSet clues;
        clues.rows = {Clue{{1, 1}, {1, 1}}, Clue{}};
        clues.columns = {Clue{}, Clue{}};
        UniquenessChecker checker(clues, 1);
        auto result = checker.check(quick_limits());

        REQUIRE(result.verdict == Verdict::Infeasible);
        REQUIRE(result.root_contradiction);
        REQUIRE(result.trace.node_count == 0);
    }

    SECTION("exhausted search") {
        // Three rows with one cell each, but only two columns may hold one
        ClueSet clues;
        clues.rows = {Clue{{1, 1}}, Clue{{1, 1}}, Clue{{1, 1}}};
        clues.columns = {Clue{{1, 1}}, Clue{{1, 1}}, Clue{}};
        UniquenessChecker checker(clues, 1);
        auto result = checker.check(quick_limits());

        REQUIRE(result.verdict == Verdict::Infeasible);
        REQUIRE_FALSE(result.root_contradiction);
        REQUIRE(result.trace.node_count > 0);
        REQUIRE(result.trace.contradiction_count > 0);
        REQUIRE_FALSE(result.solution.has_value());
    }
}

TEST_CASE("UniquenessChecker node budget", "[search]") {
    ClueSet clues;
    clues.rows = {Clue{{1, 1}}, Clue{{1, 1}}, Clue{{1, 1}}};
    clues.columns = {Clue{{1, 1}}, Clue{{1, 1}}, Clue{}};
    UniquenessChecker checker(clues, 1);

    SearchLimits limits = quick_limits();
    limits.max_nodes = 1;
    auto result = checker.check(limits);

    REQUIRE(result.verdict == Verdict::TooComplex);
    REQUIRE(result.trace.node_count == 1);
}

TEST_CASE("UniquenessChecker is deterministic", "[search]") {
    auto truth = ColorGrid::from_rows({
        {1, 0, 0, 1},
        {0, 1, 1, 0},
        {0, 1, 1, 0},
        {1, 0, 0, 1},
    });
    auto clues = derive_clues(truth);

    UniquenessChecker a(clues, 1);
    UniquenessChecker b(clues, 1);
    auto ra = a.check(quick_limits());
    auto rb = b.check(quick_limits());

    REQUIRE(ra.verdict == rb.verdict);
    REQUIRE(ra.trace.node_count == rb.trace.node_count);
    REQUIRE(ra.solution.has_value() == rb.solution.has_value());
    if (ra.solution) {
        REQUIRE(*ra.solution == *rb.solution);
    }
}

TEST_CASE("UniquenessChecker matches brute force on small grids", "[search][brute]") {
    std::mt19937 rng(424242);

    auto run_case = [&](size_t width, size_t height, size_t colors, double empty_prob) {
        auto truth = random_grid(rng, width, height, colors, empty_prob);
        auto clues = derive_clues(truth);

        size_t expected = brute_force_count(clues, colors);
        UniquenessChecker checker(clues, colors);
        auto result = checker.check(quick_limits());

        // Clues come from a real grid, so there is at least one solution
        REQUIRE(expected >= 1);
        if (expected == 1) {
            REQUIRE(result.verdict == Verdict::Unique);
            REQUIRE(*result.solution == truth);
        } else {
            REQUIRE(result.verdict == Verdict::Multiple);
        }
    };

    SECTION("single color") {
        for (int iter = 0; iter < 60; ++iter) {
            run_case(4 + iter % 2, 4 + (iter / 2) % 2, 1, 0.5);
        }
    }

    SECTION("two colors") {
        for (int iter = 0; iter < 60; ++iter) {
            run_case(4, 4 + iter % 2, 2, 0.4);
        }
    }

    SECTION("three colors") {
        for (int iter = 0; iter < 30; ++iter) {
            run_case(4, 4, 3, 0.3);
        }
    }
}

// ============================================================================
// Timeout safety
// ============================================================================

TEST_CASE("UniquenessChecker honours a short deadline", "[search][timeout]") {
    std::mt19937 rng(99);
    auto truth = random_grid(rng, 150, 150, 4, 0.3);
    auto clues = derive_clues(truth);
    UniquenessChecker checker(clues, 4);

    SearchLimits limits;
    limits.timeout = std::chrono::milliseconds(2);
    limits.max_nodes = 1000000000;

    auto start = std::chrono::steady_clock::now();
    auto result = checker.check(limits);
    auto took = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    REQUIRE(result.verdict == Verdict::Timeout);
    REQUIRE(took.count() < 1000.0);
    REQUIRE_FALSE(result.solution.has_value());
}

TEST_CASE("UniquenessChecker stops on request", "[search][timeout]") {
    auto clues = derive_clues(ColorGrid::from_rows({{1, 0}, {0, 1}}));
    UniquenessChecker checker(clues, 1);

    SECTION("external flag") {
        std::atomic<bool> cancel{true};
        SearchLimits limits = quick_limits();
        limits.cancel = &cancel;
        REQUIRE(checker.check(limits).verdict == Verdict::Timeout);
    }

    SECTION("stop()") {
        checker.stop();
        REQUIRE(checker.is_stopped());
        // The flag is seen by root propagation before any node is expanded
        auto stopped = checker.check(quick_limits());
        REQUIRE(stopped.verdict == Verdict::Timeout);
        REQUIRE(stopped.trace.node_count == 0);
        REQUIRE(stopped.trace.branch_count == 0);
        checker.reset_stop();
        REQUIRE(checker.check(quick_limits()).verdict == Verdict::Multiple);
    }
}

TEST_CASE("stop() interrupts root propagation", "[search][timeout]") {
    // Solved by propagation alone, so only the propagator can see the flag
    auto clues = derive_clues(ColorGrid::from_rows({
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
        {1, 1, 1, 1, 1},
        {0, 0, 1, 0, 0},
        {0, 0, 1, 0, 0},
    }));
    UniquenessChecker checker(clues, 1);

    checker.stop();
    auto stopped = checker.check(quick_limits());
    REQUIRE(stopped.verdict == Verdict::Timeout);
    REQUIRE_FALSE(stopped.solution.has_value());

    checker.reset_stop();
    auto result = checker.check(quick_limits());
    REQUIRE(result.verdict == Verdict::Unique);
    REQUIRE(result.trace.branch_count == 0);
}

TEST_CASE("StopToken observes both flags", "[search][timeout]") {
    std::atomic<bool> external{false};
    std::atomic<bool> local{false};
    StopToken token(StopToken::clock::now() + std::chrono::hours(1), &external, &local);
    REQUIRE_FALSE(token.stop_requested());

    local = true;
    REQUIRE(token.cancelled());
    local = false;
    external = true;
    REQUIRE(token.cancelled());
    external = false;
    REQUIRE_FALSE(token.stop_requested());

    StopToken expired(StopToken::clock::now() - std::chrono::milliseconds(1), nullptr);
    REQUIRE(expired.expired());
    REQUIRE_FALSE(expired.cancelled());
}
