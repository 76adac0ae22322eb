/**
 * @file search.hpp
 * @brief バックトラック探索による一意解判定
 */
#ifndef IRODORI_SEARCH_HPP
#define IRODORI_SEARCH_HPP

#include "irodori/propagation.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

namespace irodori {

/**
 * @brief 一意性判定の結論
 */
enum class Verdict {
    Unique,      // 解がちょうど1つ
    Multiple,    // 解が2つ以上
    Infeasible,  // 解が存在しない
    Timeout,     // 期限切れ（または停止要求）
    TooComplex   // ノード数上限に到達
};

const char* to_string(Verdict verdict);

/**
 * @brief 探索予算
 */
struct SearchLimits {
    std::chrono::milliseconds timeout{30000};
    uint64_t max_nodes = 200000;
    const std::atomic<bool>* cancel = nullptr;  // 外部からの停止フラグ（任意）
};

/**
 * @brief 一意性判定の結果
 */
struct UniquenessResult {
    Verdict verdict = Verdict::Infeasible;
    std::optional<ColorGrid> solution;         // Unique / Multiple: 最初に見つけた解
    std::optional<ColorGrid> second_solution;  // Multiple: 2つ目の解
    SolveTrace trace;
    double elapsed_ms = 0.0;

    // Infeasible のうち、分岐前の伝播で矛盾した場合
    bool root_contradiction = false;
    Axis contradiction_axis = Axis::Row;
    size_t contradiction_line = 0;
};

/**
 * @brief 一意解判定器
 *
 * 伝播で固定点に達した後、未確定セルで分岐して再伝播する深さ優先探索。
 * 2つ目の解を見つけた時点で停止する（全解列挙はしない）。
 *
 * - 変数選択: 候補色が最も少ないセル、同数なら行優先で最小インデックス。
 *   乱数は使わず、同じ入力に対して常に同じ順で探索する。
 * - 値選択: 候補色の昇順。候補マスクはライン推論で不可能と分かった色を
 *   既に除いている。
 * - バックトラック: Grid の Trail をセーブポイントまで巻き戻す。
 * - 打ち切り: ノード展開・ライン推論ごとに期限と停止フラグを確認し、
 *   期限切れは Timeout、ノード数超過は TooComplex として戻る。
 */
class UniquenessChecker {
public:
    /**
     * @param clues 行・列のヒント（判定中は参照を保持する）
     * @param palette_size 背景を除く色数
     */
    UniquenessChecker(const ClueSet& clues, size_t palette_size);

    /**
     * @brief 一意性を判定
     */
    UniquenessResult check(const SearchLimits& limits);

    /**
     * @brief 探索を停止する（別スレッドから呼び出し可能）
     *
     * ルート伝播中も含め、次のライン推論またはノード展開で Timeout として戻る。
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    enum class SearchResult {
        Continue,  // この部分木は探索し終えた
        Enough,    // 解が2つ見つかった
        Aborted    // 期限切れ・停止・ノード超過
    };

    SearchResult run_search(Grid& grid, size_t depth);

    /**
     * @brief 次に分岐するセルを選択（候補数最小、同数なら行優先）
     */
    size_t select_cell(const Grid& grid) const;

    /**
     * @brief バックトラック
     */
    void backtrack(Grid& grid, int save_point);

    bool should_stop() const { return stop_.stop_requested(); }

    const ClueSet& clues_;
    size_t palette_size_;
    GridPropagator propagator_;

    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    // 状態
    int current_decision_ = 0;
    StopToken stop_;
    uint64_t max_nodes_ = 0;
    Verdict abort_verdict_ = Verdict::Timeout;
    SolveTrace trace_;
    std::vector<ColorGrid> solutions_;
};

} // namespace irodori

#endif // IRODORI_SEARCH_HPP
