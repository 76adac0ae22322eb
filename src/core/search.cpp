#include "irodori/search.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace irodori {

const char* to_string(Verdict verdict) {
    switch (verdict) {
    case Verdict::Unique: return "unique";
    case Verdict::Multiple: return "multiple";
    case Verdict::Infeasible: return "infeasible";
    case Verdict::Timeout: return "timeout";
    case Verdict::TooComplex: return "too_complex";
    }
    return "unknown";
}

UniquenessChecker::UniquenessChecker(const ClueSet& clues, size_t palette_size)
    : clues_(clues)
    , palette_size_(palette_size)
    , propagator_(clues) {}

UniquenessResult UniquenessChecker::check(const SearchLimits& limits) {
    using clock = std::chrono::steady_clock;
    auto start = clock::now();

    // 初期化
    current_decision_ = 0;
    trace_ = SolveTrace{};
    solutions_.clear();
    max_nodes_ = limits.max_nodes;
    abort_verdict_ = Verdict::Timeout;
    stop_ = StopToken(start + limits.timeout, limits.cancel, &stopped_);

    UniquenessResult result;
    auto finish = [&]() {
        result.trace = trace_;
        result.elapsed_ms =
            std::chrono::duration<double, std::milli>(clock::now() - start).count();
        if (verbose_) {
            std::ostringstream oss;
            oss << "% [verbose] search done: verdict=" << to_string(result.verdict)
                << " branches=" << trace_.branch_count
                << " nodes=" << trace_.node_count
                << " max_depth=" << trace_.backtrack_depth
                << " elapsed=" << result.elapsed_ms << "ms\n";
            std::cerr << oss.str();
        }
        return result;
    };

    Grid grid(clues_.width(), clues_.height(), full_mask(palette_size_));

    // ルート伝播
    propagator_.mark_all_dirty();
    auto root = propagator_.run(grid, current_decision_, trace_, true, stop_);
    if (verbose_) {
        std::ostringstream oss;
        oss << "% [verbose] root propagation: passes=" << root.passes
            << " determined=" << grid.determined_count() << "/" << grid.size() << "\n";
        std::cerr << oss.str();
    }
    if (root.status == PropagationStatus::Stopped) {
        result.verdict = Verdict::Timeout;
        return finish();
    }
    if (root.status == PropagationStatus::Contradiction) {
        result.verdict = Verdict::Infeasible;
        result.root_contradiction = true;
        result.contradiction_axis = root.axis;
        result.contradiction_line = root.line;
        return finish();
    }

    auto res = run_search(grid, 0);

    if (!solutions_.empty()) {
        result.solution = solutions_[0];
    }
    if (res == SearchResult::Aborted) {
        result.verdict = abort_verdict_;
    } else if (solutions_.size() >= 2) {
        result.verdict = Verdict::Multiple;
        result.second_solution = solutions_[1];
    } else if (solutions_.size() == 1) {
        result.verdict = Verdict::Unique;
    } else {
        result.verdict = Verdict::Infeasible;
    }
    return finish();
}

UniquenessChecker::SearchResult UniquenessChecker::run_search(Grid& grid, size_t depth) {
    // 全セルが確定していれば解
    if (grid.is_complete()) {
        solutions_.push_back(grid.to_color_grid());
        return solutions_.size() >= 2 ? SearchResult::Enough : SearchResult::Continue;
    }

    size_t cell = select_cell(grid);
    ColorMask candidates = grid.mask(cell);

    trace_.branch_count++;
    trace_.backtrack_depth = std::max(trace_.backtrack_depth, depth + 1);

    int save_point = current_decision_;

    for (ColorIndex color = 0; candidates >> color != 0; ++color) {
        if ((candidates & color_bit(color)) == 0) continue;

        // 期限を先に確認し、その後ノード数を確認する
        if (should_stop()) {
            abort_verdict_ = Verdict::Timeout;
            return SearchResult::Aborted;
        }
        if (trace_.node_count >= max_nodes_) {
            abort_verdict_ = Verdict::TooComplex;
            return SearchResult::Aborted;
        }
        trace_.node_count++;

        current_decision_++;
        PropagationResult prop;
        if (grid.assign(current_decision_, cell, color)) {
            propagator_.mark_cell_dirty(grid, cell);
            prop = propagator_.run(grid, current_decision_, trace_, false, stop_);
        } else {
            prop.status = PropagationStatus::Contradiction;
        }
        if (prop.status == PropagationStatus::Stopped) {
            current_decision_--;
            backtrack(grid, save_point);
            abort_verdict_ = Verdict::Timeout;
            return SearchResult::Aborted;
        }

        if (prop.status == PropagationStatus::Contradiction) {
            trace_.contradiction_count++;
        } else {
            auto res = run_search(grid, depth + 1);
            if (res != SearchResult::Continue) {
                current_decision_--;
                backtrack(grid, save_point);
                return res;
            }
        }

        current_decision_--;
        backtrack(grid, save_point);
    }

    return SearchResult::Continue;
}

size_t UniquenessChecker::select_cell(const Grid& grid) const {
    size_t best = grid.size();
    size_t best_size = 0;
    for (size_t i = 0; i < grid.size(); ++i) {
        ColorMask m = grid.mask(i);
        if (is_single(m)) continue;
        size_t n = mask_size(m);
        if (best == grid.size() || n < best_size) {
            best = i;
            best_size = n;
            if (n == 2) break;  // 2 より小さい未確定セルはない
        }
    }
    return best;
}

void UniquenessChecker::backtrack(Grid& grid, int save_point) {
    grid.rewind_to(save_point);
}

} // namespace irodori
