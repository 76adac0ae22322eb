#include "irodori/puzzle.hpp"
#include "irodori/search.hpp"
#include "irodori/validation.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <utility>

namespace irodori {

namespace {

/**
 * @brief 2つの解が最初に異なるセル（行優先）
 */
std::pair<size_t, size_t> first_difference(const ColorGrid& a, const ColorGrid& b) {
    for (size_t r = 0; r < a.height(); ++r) {
        for (size_t c = 0; c < a.width(); ++c) {
            if (a.at(r, c) != b.at(r, c)) {
                return {r, c};
            }
        }
    }
    return {0, 0};
}

}  // namespace

const char* to_string(BuildStatus status) {
    switch (status) {
    case BuildStatus::Accepted: return "accepted";
    case BuildStatus::Rejected: return "rejected";
    case BuildStatus::Error: return "error";
    }
    return "unknown";
}

PuzzleBuilder::PuzzleBuilder(const Config& config)
    : config_(config) {
    config_.validate();
}

BuildOutcome PuzzleBuilder::build(const Candidate& candidate,
                                  const std::atomic<bool>* cancel) const {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
            .count();
    };

    BuildOutcome outcome;
    outcome.name = candidate.name;

    ClueSet clues = derive_clues(candidate.grid);

    // 検証（ソルバーを呼ぶ前に打ち切る）
    if (auto rejection = validate_candidate(candidate.grid, candidate.palette, clues, config_)) {
        outcome.status = BuildStatus::Rejected;
        outcome.rejection = std::move(rejection);
        outcome.elapsed_ms = elapsed();
        if (verbose_) {
            std::ostringstream oss;
            oss << "% [verbose] " << candidate.name << ": " << describe(*outcome.rejection) << "\n";
            std::cerr << oss.str();
        }
        return outcome;
    }

    // 一意性判定
    outcome.solver_invoked = true;
    solve_count_.fetch_add(1, std::memory_order_relaxed);

    UniquenessChecker checker(clues, candidate.palette.size());
    checker.set_verbose(verbose_);

    SearchLimits limits;
    limits.timeout = config_.timeout;
    limits.max_nodes = config_.max_search_nodes;
    limits.cancel = cancel;
    auto result = checker.check(limits);

    outcome.trace = result.trace;
    const auto& trace = result.trace;

    switch (result.verdict) {
    case Verdict::Unique: {
        Puzzle puzzle;
        puzzle.name = candidate.name;
        puzzle.palette = candidate.palette;
        puzzle.solution = *result.solution;
        puzzle.difficulty =
            score_difficulty(extract_features(puzzle.solution, clues, trace), config_);
        puzzle.quality = score_quality(puzzle.solution, clues, candidate.palette.size());
        puzzle.clues = std::move(clues);
        outcome.status = BuildStatus::Accepted;
        outcome.puzzle = std::move(puzzle);
        break;
    }
    case Verdict::Multiple: {
        auto cell = first_difference(*result.solution, *result.second_solution);
        outcome.status = BuildStatus::Rejected;
        outcome.rejection = Rejection{NonUnique{trace.node_count, cell.first, cell.second}};
        break;
    }
    case Verdict::Timeout:
        outcome.status = BuildStatus::Rejected;
        outcome.rejection = Rejection{Timeout{result.elapsed_ms, trace.node_count}};
        break;
    case Verdict::TooComplex:
        outcome.status = BuildStatus::Rejected;
        outcome.rejection =
            Rejection{TooComplex{trace.node_count, config_.max_search_nodes, result.elapsed_ms}};
        break;
    case Verdict::Infeasible:
        outcome.status = BuildStatus::Rejected;
        outcome.rejection =
            Rejection{Infeasible{!result.root_contradiction, result.contradiction_axis,
                                 result.contradiction_line, trace.node_count}};
        break;
    }

    outcome.elapsed_ms = elapsed();

    if (verbose_) {
        std::ostringstream oss;
        oss << "% [verbose] " << candidate.name << ": ";
        if (outcome.status == BuildStatus::Accepted) {
            const auto& d = outcome.puzzle->difficulty;
            const auto& q = outcome.puzzle->quality;
            oss << "accepted score=" << d.score << " tier=" << to_string(d.tier)
                << " quality=" << q.score << " (" << to_string(q.grade) << ")";
        } else {
            oss << describe(*outcome.rejection);
        }
        oss << " (" << outcome.elapsed_ms << "ms)\n";
        std::cerr << oss.str();
    }
    return outcome;
}

} // namespace irodori
