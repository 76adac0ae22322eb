/**
 * @file quality.hpp
 * @brief パズルの出来栄え評価（難易度とは独立）
 */
#ifndef IRODORI_QUALITY_HPP
#define IRODORI_QUALITY_HPP

#include "irodori/clue.hpp"
#include <string>
#include <vector>

namespace irodori {

enum class QualityGrade {
    Excellent,  // 85 以上
    Good,       // 70 以上
    Fair,       // 55 以上
    Poor,       // 40 以上
    Bad
};

constexpr size_t QUALITY_GRADE_COUNT = 5;

const char* to_string(QualityGrade grade);

/**
 * @brief 各要素のスコア（0〜1）
 */
struct QualityFactors {
    double fill_ratio = 0.0;           // 35〜65% が理想
    double aspect_ratio = 0.0;         // 正方形に近いほど良い
    double grid_size = 0.0;            // 8〜25 が適正
    double color_effectiveness = 0.0;  // 各色が意味のある量を占めるか
    double clue_variety = 0.0;         // ラン長のばらつき
    double edge_utilization = 0.0;     // 外周まで絵が届いているか
    double line_balance = 0.0;         // 易しいラインと難しいラインの混在
    double clue_density = 0.0;         // 1ラインのラン数（多すぎると表示できない）
};

struct QualityReport {
    double score = 0.0;  // 0〜100
    QualityGrade grade = QualityGrade::Bad;
    QualityFactors factors;
    std::vector<std::string> notes;
};

/**
 * @brief 採用済みパズルの出来栄えを評価する
 *
 * 不採用の判断には使わない。
 *
 * @param palette_size 背景を除くパレットの色数
 */
QualityReport score_quality(const ColorGrid& solution, const ClueSet& clues,
                            size_t palette_size);

} // namespace irodori

#endif // IRODORI_QUALITY_HPP
