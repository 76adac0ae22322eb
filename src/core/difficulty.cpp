#include "irodori/difficulty.hpp"
#include <algorithm>
#include <cmath>

namespace irodori {

DifficultyFeatures extract_features(const ColorGrid& solution, const ClueSet& clues,
                                    const SolveTrace& trace) {
    DifficultyFeatures f;
    f.total_cells = solution.size();
    f.max_dimension = std::max(solution.width(), solution.height());
    if (f.total_cells > 0) {
        f.fill_ratio = static_cast<double>(solution.filled_count()) / f.total_cells;
    }

    bool used[MAX_PALETTE_COLORS + 1] = {};
    for (ColorIndex c : solution.cells()) {
        if (c != BACKGROUND && c <= MAX_PALETTE_COLORS) {
            used[c] = true;
        }
    }
    f.color_count = static_cast<size_t>(std::count(std::begin(used), std::end(used), true));

    size_t lines = clues.width() + clues.height();
    if (lines > 0) {
        f.clue_fragmentation = static_cast<double>(clues.total_runs()) / lines;
    }

    f.simple_cells = trace.simple_overlap_cells;
    f.edge_cells = trace.edge_alignment_cells;
    f.cross_line_cells = trace.cross_line_cells;
    f.propagation_passes = trace.propagation_passes;
    f.branch_count = trace.branch_count;
    f.backtrack_depth = trace.backtrack_depth;
    return f;
}

Tier tier_for_score(double score, const Config& config) {
    size_t tier = 0;
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        if (score >= config.tier_thresholds[i]) {
            tier = i;
        }
    }
    return static_cast<Tier>(tier);
}

DifficultyReport score_difficulty(const DifficultyFeatures& features, const Config& config) {
    const auto& w = config.weights;
    DifficultyReport report;
    report.features = features;
    auto& factors = report.factors;

    // ベースライン
    factors.fill_balance = 1.0 - std::abs(features.fill_ratio - 0.5) * 2.0;
    factors.baseline = w.dimension * static_cast<double>(features.max_dimension) +
                       w.colors * static_cast<double>(features.color_count) +
                       w.fragmentation * features.clue_fragmentation +
                       w.fill * factors.fill_balance;

    // 推論手法
    double total = features.total_cells > 0 ? static_cast<double>(features.total_cells) : 1.0;
    double extra_passes = features.propagation_passes > 1
                              ? static_cast<double>(features.propagation_passes - 1)
                              : 0.0;
    factors.technique = 1.0 + w.edge * features.edge_cells / total +
                        w.cross_line * features.cross_line_cells / total +
                        w.pass * extra_passes;

    // バックトラック
    bool branched = features.branch_count > 0;
    factors.backtracking = 1.0 + (branched ? w.backtrack : 0.0) +
                           w.depth * static_cast<double>(features.backtrack_depth) +
                           w.branches * std::log2(1.0 + features.branch_count);

    report.score = factors.baseline * factors.technique * factors.backtracking;
    if (branched && report.score < w.backtrack_score_floor) {
        report.score = w.backtrack_score_floor;
        factors.floored = true;
    }

    report.tier = tier_for_score(report.score, config);
    return report;
}

} // namespace irodori
