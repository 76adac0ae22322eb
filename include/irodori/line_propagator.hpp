/**
 * @file line_propagator.hpp
 * @brief 1ライン分のヒントからの強制セル推論（色付き重なり法）
 */
#ifndef IRODORI_LINE_PROPAGATOR_HPP
#define IRODORI_LINE_PROPAGATOR_HPP

#include "irodori/grid.hpp"
#include <vector>
#include <cstdint>

namespace irodori {

/**
 * @brief ライン推論の結果
 */
enum class LineStatus {
    Consistent,     // 推論成功（推論が0件の場合も含む）
    Contradiction   // 確定済みセルと矛盾しない配置が存在しない
};

/**
 * @brief 推論の種類
 */
enum class DeductionKind {
    SimpleOverlap,  // 単一ランの左詰め/右詰めの重なり（盤面状態に依存しない）
    EdgeAlignment   // 確定済みセルを使った複数ラン/端寄せの推論
};

/**
 * @brief 1セル分の推論
 */
struct LineDeduction {
    size_t position;     // ライン上の位置
    ColorMask mask;      // 絞り込み後の候補色マスク
    bool determined;     // この推論でセルが確定したか
    DeductionKind kind;
};

/**
 * @brief ライン推論器
 *
 * ランをヒント順に、同色ラン間は1マス以上、異色ラン間は0マス以上空けて
 * 配置するという規則のもとで、現在の候補色と矛盾しない全配置に共通する
 * 事実を求める。
 *
 * 左詰め側（prefix 表）と右詰め側（suffix 表）の配置可能性を動的計画法で
 * 求め、各ランの各開始位置が両側と両立するかを判定する。これは各ランの
 * [右詰め開始, 左詰め終了] 区間の重なり推論を、確定済みセル・空白強制・
 * 端寄せまで含めて厳密化したもので、O(ラン数 × ライン長) で動作する。
 *
 * 作業バッファはメンバとして再利用するため、インスタンスはスレッド間で
 * 共有しないこと。
 */
class LinePropagator {
public:
    LinePropagator() = default;

    /**
     * @brief ラインを推論する
     * @param clue ラインのヒント
     * @param cells 現在の候補色マスク（ライン順）
     * @param deductions 推論結果の出力先（呼び出し時にクリアされる）
     * @return 矛盾があれば Contradiction
     */
    LineStatus propagate(const Clue& clue, const std::vector<ColorMask>& cells,
                         std::vector<LineDeduction>& deductions);

private:
    bool fits(size_t run, size_t start) const;
    bool placeable_before(size_t run, size_t start) const;
    bool placeable_after(size_t run, size_t end) const;

    bool prefix(size_t runs, size_t pos) const { return prefix_[runs * (n_ + 1) + pos] != 0; }
    bool suffix(size_t run, size_t pos) const { return suffix_[run * (n_ + 1) + pos] != 0; }

    /**
     * @brief 全セル未知のラインで強制される色（-1 = 強制なし）を求める
     */
    void compute_simple_overlap();

    // 現在のライン
    const Clue* clue_ = nullptr;
    const std::vector<ColorMask>* cells_ = nullptr;
    size_t n_ = 0;
    size_t k_ = 0;

    // 作業バッファ（ヒープ確保を避けるため再利用）
    std::vector<uint8_t> prefix_;         // prefix_[j][i]: ラン 0..j-1 が [0, i) に収まる
    std::vector<uint8_t> suffix_;         // suffix_[j][i]: ラン j..k-1 が [i, n) に収まる
    std::vector<size_t> compatible_;      // compatible_[j][i]: i から続くラン j の色を許すセル数
    std::vector<int> coverage_;           // ランごとの被覆差分
    std::vector<ColorMask> possible_;     // 各セルで実現可能な色
    std::vector<int> simple_forced_;      // 状態に依存しない強制色
};

} // namespace irodori

#endif // IRODORI_LINE_PROPAGATOR_HPP
