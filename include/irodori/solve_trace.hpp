/**
 * @file solve_trace.hpp
 * @brief 1回の求解で集計するカウンタ
 */
#ifndef IRODORI_SOLVE_TRACE_HPP
#define IRODORI_SOLVE_TRACE_HPP

#include <cstddef>
#include <cstdint>

namespace irodori {

/**
 * @brief 求解トレース
 *
 * ルート（分岐前）の伝播で確定したセルを推論手法ごとに数え、
 * 探索側では分岐・ノード・枝刈り・深さを数える。難易度評価の入力になる。
 */
struct SolveTrace {
    // ===== ルート伝播 =====
    size_t simple_overlap_cells = 0;   // 単一ランの重なりで確定
    size_t edge_alignment_cells = 0;   // 確定済みセルを使う複数ラン/端寄せで確定（1パス目）
    size_t cross_line_cells = 0;       // 2パス目以降（交差ラインの情報待ち）で確定
    size_t propagation_passes = 0;     // ルート伝播のパス数
    size_t line_visits = 0;            // ライン推論の呼び出し回数（探索中も含む）

    // ===== 探索 =====
    size_t search_deductions = 0;      // 分岐後の伝播で確定したセル数
    size_t branch_count = 0;           // 分岐（推測）したセル数
    uint64_t node_count = 0;           // 試した割り当ての数
    size_t contradiction_count = 0;    // 矛盾で枝刈りした割り当ての数
    size_t backtrack_depth = 0;        // 最大の分岐深さ

    /**
     * @brief ルート伝播で確定したセル数
     */
    size_t logic_cells() const {
        return simple_overlap_cells + edge_alignment_cells + cross_line_cells;
    }
};

} // namespace irodori

#endif // IRODORI_SOLVE_TRACE_HPP
