/**
 * @file validation.hpp
 * @brief ソルバー実行前の検証ルール
 */
#ifndef IRODORI_VALIDATION_HPP
#define IRODORI_VALIDATION_HPP

#include "irodori/config.hpp"
#include "irodori/rejection.hpp"
#include <optional>

namespace irodori {

/**
 * @brief グリッドがパレットの範囲内の色だけを使っているか確認
 * @throws std::invalid_argument パレット外の色インデックスがある場合
 */
void check_palette_consistency(const ColorGrid& grid, const Palette& palette);

/**
 * @brief 幅・高さ 0、または色付きセルがない
 */
std::optional<Rejection> check_not_empty(const ColorGrid& grid);

/**
 * @brief 色数が上限を超えていないか
 */
std::optional<Rejection> check_color_budget(const Palette& palette, const Config& config);

/**
 * @brief 全ての色の組が十分離れているか（最も近い組を報告）
 */
std::optional<Rejection> check_color_separation(const Palette& palette, const Config& config);

/**
 * @brief ラン数が上限を超えるラインがないか（最もラン数の多いラインを報告）
 *
 * 同数なら行を先に、各軸では小さいインデックスを報告する。
 */
std::optional<Rejection> check_density(const ClueSet& clues, const Config& config);

/**
 * @brief 全ルールを順に適用する（最初に違反したルールで打ち切る）
 *
 * 順序: 色数 → 空グリッド → 色差 → 密度。いずれも純粋関数でソルバーは呼ばない。
 * 色数の確認を整合性チェックより先に行うため、32 色以上のパレットも
 * too_many_colors として棄却される。
 *
 * @throws std::invalid_argument グリッドとパレットが不整合な場合
 */
std::optional<Rejection> validate_candidate(const ColorGrid& grid, const Palette& palette,
                                            const ClueSet& clues, const Config& config);

} // namespace irodori

#endif // IRODORI_VALIDATION_HPP
