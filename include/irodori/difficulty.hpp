/**
 * @file difficulty.hpp
 * @brief 難易度スコアとティア
 */
#ifndef IRODORI_DIFFICULTY_HPP
#define IRODORI_DIFFICULTY_HPP

#include "irodori/clue.hpp"
#include "irodori/config.hpp"
#include "irodori/solve_trace.hpp"

namespace irodori {

/**
 * @brief 難易度評価の入力特徴量
 */
struct DifficultyFeatures {
    // ===== 構造 =====
    double fill_ratio = 0.0;           // 色付きセル / 全セル
    size_t color_count = 0;            // 使われている色の種類数
    double clue_fragmentation = 0.0;   // 総ラン数 / (width + height)
    size_t max_dimension = 0;
    size_t total_cells = 0;

    // ===== 求解トレース =====
    size_t simple_cells = 0;
    size_t edge_cells = 0;
    size_t cross_line_cells = 0;
    size_t propagation_passes = 0;
    size_t branch_count = 0;
    size_t backtrack_depth = 0;
};

/**
 * @brief スコアの内訳
 */
struct DifficultyFactors {
    double baseline = 0.0;      // 構造的ベースライン
    double fill_balance = 0.0;  // 1 - |fill - 0.5| * 2
    double technique = 1.0;     // 推論手法の倍率
    double backtracking = 1.0;  // バックトラックの倍率
    bool floored = false;       // 分岐ありの下限が適用された
};

/**
 * @brief 難易度評価の結果
 */
struct DifficultyReport {
    double score = 0.0;
    Tier tier = Tier::Trivial;
    DifficultyFeatures features;
    DifficultyFactors factors;
};

/**
 * @brief 解とトレースから特徴量を取り出す
 */
DifficultyFeatures extract_features(const ColorGrid& solution, const ClueSet& clues,
                                    const SolveTrace& trace);

/**
 * @brief スコアからティアを決める（下限を含む）
 */
Tier tier_for_score(double score, const Config& config);

/**
 * @brief 難易度を評価する
 *
 * score = baseline × technique × backtracking
 *
 * - baseline = w_dim·max_dimension + w_colors·color_count
 *              + w_frag·clue_fragmentation + w_fill·fill_balance
 * - technique = 1 + w_edge·edge/total_cells + w_cross·cross/total_cells
 *               + w_pass·(passes - 1)
 * - backtracking = 1 + (branches > 0 ? w_backtrack : 0) + w_depth·depth
 *                  + w_branches·log2(1 + branches)
 *
 * 分岐が1回でもあれば backtrack_score_floor まで引き上げる。
 * 重みは全て非負なので、他を固定して深さ・サイズ・色数・重い手法の
 * 使用量を増やしてもスコアは下がらない。
 */
DifficultyReport score_difficulty(const DifficultyFeatures& features, const Config& config);

} // namespace irodori

#endif // IRODORI_DIFFICULTY_HPP
