/**
 * @file propagation.hpp
 * @brief 全ライン伝播ループ（固定点まで行→列を繰り返す）
 */
#ifndef IRODORI_PROPAGATION_HPP
#define IRODORI_PROPAGATION_HPP

#include "irodori/line_propagator.hpp"
#include "irodori/solve_trace.hpp"
#include "irodori/stop_token.hpp"
#include <vector>
#include <cstdint>

namespace irodori {

/**
 * @brief 伝播ループの終了状態
 */
enum class PropagationStatus {
    Fixpoint,       // 変化なしで停止（未確定セルが残っている場合も含む）
    Contradiction,  // いずれかのラインで矛盾
    Stopped         // 期限切れ・停止要求
};

/**
 * @brief 伝播ループの結果
 */
struct PropagationResult {
    PropagationStatus status = PropagationStatus::Fixpoint;
    Axis axis = Axis::Row;   // 矛盾したライン（Contradiction 時のみ有効）
    size_t line = 0;
    size_t passes = 0;       // 実行したパス数
};

/**
 * @brief グリッド伝播ループ
 *
 * 行→列の順にライン推論を適用し、1パスで何も変わらなくなるまで繰り返す。
 * セルが変化したラインだけを dirty として再推論する。ライン推論は冪等なので、
 * 変化のないラインを再推論しても新しい推論は出ない（全ライン再走査と等価）。
 *
 * 伝播は各ラインのマスクを単調に狭めるだけなので、パス数はセル数 ×
 * 色数で抑えられ、必ず停止する。
 */
class GridPropagator {
public:
    explicit GridPropagator(const ClueSet& clues);

    /**
     * @brief 全ラインを dirty にする（ルート伝播の前に呼ぶ）
     */
    void mark_all_dirty();

    /**
     * @brief セルを含む行と列を dirty にする（分岐で割り当てた後に呼ぶ）
     */
    void mark_cell_dirty(const Grid& grid, size_t index);

    /**
     * @brief 固定点まで伝播する
     * @param grid 対象グリッド
     * @param save_point 変更を記録するセーブポイント
     * @param trace カウンタの加算先
     * @param root true ならルート伝播として推論手法別に数える
     * @param stop 中断判定（ライン推論ごとにポーリング）
     */
    PropagationResult run(Grid& grid, int save_point, SolveTrace& trace, bool root,
                          const StopToken& stop);

private:
    bool has_dirty() const;
    void clear_dirty();

    /**
     * @brief 1ラインを推論してグリッドに反映
     * @return 矛盾があれば false
     */
    bool process_line(Grid& grid, Axis axis, size_t line, int save_point,
                      SolveTrace& trace, bool root, size_t pass);

    const ClueSet& clues_;
    LinePropagator line_;
    std::vector<uint8_t> row_dirty_;
    std::vector<uint8_t> col_dirty_;

    // 作業バッファ
    std::vector<ColorMask> buffer_;
    std::vector<LineDeduction> deductions_;
};

} // namespace irodori

#endif // IRODORI_PROPAGATION_HPP
