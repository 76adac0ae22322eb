/**
 * @file batch.hpp
 * @brief 候補のバッチ処理（ワーカープール）とレポート
 */
#ifndef IRODORI_BATCH_HPP
#define IRODORI_BATCH_HPP

#include "irodori/puzzle.hpp"
#include <array>
#include <atomic>
#include <string>
#include <vector>

namespace irodori {

/**
 * @brief バッチ全体の集計
 */
struct BatchReport {
    size_t total = 0;
    size_t accepted = 0;
    size_t rejected = 0;
    size_t errors = 0;
    size_t solver_runs = 0;
    double elapsed_ms = 0.0;  // 候補ごとの処理時間の合計

    std::array<size_t, TIER_COUNT> by_tier{};
    std::array<size_t, REJECT_REASON_COUNT> by_reason{};
    std::array<size_t, QUALITY_GRADE_COUNT> by_grade{};  // 採用分の出来栄え
};

/**
 * @brief 処理結果を集計する
 */
BatchReport summarize(const std::vector<BuildOutcome>& outcomes);

/**
 * @brief 人が読むためのレポート
 *
 * 合計、ティア別・出来栄え別の採用数、理由別の不採用数に続けて、不採用・エラーの
 * 候補を診断情報付きで1行ずつ並べる。
 */
std::string format_report(const BatchReport& report, const std::vector<BuildOutcome>& outcomes);

/**
 * @brief バッチランナー
 *
 * ワーカースレッドがアトミックなカウンタから次の候補番号を取り出して処理する。
 * 結果は候補と同じ順序で返す。1件の処理で例外が出ても Error として記録し、
 * 残りの処理は続ける。
 */
class BatchRunner {
public:
    /**
     * @param jobs ワーカー数（0 なら hardware_concurrency）
     * @throws std::invalid_argument 設定が不正な場合
     */
    BatchRunner(const Config& config, size_t jobs = 0);

    /**
     * @brief 全候補を処理する
     */
    std::vector<BuildOutcome> run(const std::vector<Candidate>& candidates);

    /**
     * @brief 処理中の探索を打ち切る（別スレッド・シグナルハンドラから呼び出し可能）
     *
     * 以降の候補は Timeout として記録される。
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled);

    size_t jobs() const { return jobs_; }

    const PuzzleBuilder& builder() const { return builder_; }

private:
    PuzzleBuilder builder_;
    size_t jobs_;
    bool verbose_ = false;
    std::atomic<bool> stopped_{false};
};

} // namespace irodori

#endif // IRODORI_BATCH_HPP
