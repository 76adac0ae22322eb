/**
 * @file puzzle.hpp
 * @brief 候補1件の検証パイプライン（検証 → 伝播 → 探索 → 評価）
 */
#ifndef IRODORI_PUZZLE_HPP
#define IRODORI_PUZZLE_HPP

#include "irodori/config.hpp"
#include "irodori/difficulty.hpp"
#include "irodori/quality.hpp"
#include "irodori/rejection.hpp"
#include "irodori/solve_trace.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace irodori {

/**
 * @brief 入力候補（正解グリッドとパレット）
 */
struct Candidate {
    std::string name;
    ColorGrid grid;
    Palette palette;
};

/**
 * @brief 採用されたパズル
 *
 * solution は clues を満たす唯一のグリッド。
 */
struct Puzzle {
    std::string name;
    Palette palette;
    ClueSet clues;
    ColorGrid solution;
    DifficultyReport difficulty;
    QualityReport quality;

    size_t width() const { return solution.width(); }
    size_t height() const { return solution.height(); }
};

enum class BuildStatus {
    Accepted,
    Rejected,
    Error  // 例外（不正な入力）
};

const char* to_string(BuildStatus status);

/**
 * @brief 候補1件の処理結果
 *
 * Accepted なら puzzle、Rejected なら rejection、Error なら error が有効。
 */
struct BuildOutcome {
    std::string name;
    BuildStatus status = BuildStatus::Error;
    std::optional<Puzzle> puzzle;
    std::optional<Rejection> rejection;
    std::string error;

    SolveTrace trace;
    double elapsed_ms = 0.0;
    bool solver_invoked = false;
};

/**
 * @brief パズルビルダー
 *
 * 設定は構築時にコピーして以後変更しない。build() は const な状態しか
 * 読まないため、複数スレッドから同時に呼び出せる。
 */
class PuzzleBuilder {
public:
    /**
     * @throws std::invalid_argument 設定が不正な場合
     */
    explicit PuzzleBuilder(const Config& config);

    /**
     * @brief 候補を検証・評価する
     *
     * 検証ルールに違反した候補ではソルバーを呼ばない。
     *
     * @param cancel 外部からの停止フラグ（任意）。立つと Timeout で戻る
     * @throws std::invalid_argument グリッドがパレット外の色を使っている場合
     */
    BuildOutcome build(const Candidate& candidate,
                       const std::atomic<bool>* cancel = nullptr) const;

    /**
     * @brief ソルバーを呼び出した回数
     */
    uint64_t solve_count() const { return solve_count_.load(); }

    const Config& config() const { return config_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    Config config_;
    bool verbose_ = false;
    mutable std::atomic<uint64_t> solve_count_{0};
};

} // namespace irodori

#endif // IRODORI_PUZZLE_HPP
