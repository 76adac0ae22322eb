/**
 * @file config.hpp
 * @brief 検証閾値・探索予算・難易度重みの設定
 */
#ifndef IRODORI_CONFIG_HPP
#define IRODORI_CONFIG_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <cstddef>
#include <cstdint>

namespace irodori {

/**
 * @brief 難易度ティア（昇順）
 */
enum class Tier {
    Trivial,
    Easy,
    Medium,
    Hard,
    Challenging,
    Expert,
    Master
};

constexpr size_t TIER_COUNT = 7;

/**
 * @brief "trivial" 〜 "master"
 */
const char* to_string(Tier tier);

/**
 * @brief ティア名を解析
 * @return 不明な名前なら std::nullopt
 */
std::optional<Tier> parse_tier(const std::string& name);

/**
 * @brief 難易度スコアの重み
 *
 * 全て非負であること（スコアの単調性はこれに依存する）。
 */
struct DifficultyWeights {
    // 構造的ベースライン
    double dimension = 1.0;       // max(width, height)
    double colors = 2.0;          // 使用色数
    double fragmentation = 4.0;   // 総ラン数 / (width + height)
    double fill = 2.0;            // 塗り率 50% で最大になるバランス項

    // 推論手法の倍率
    double edge = 0.5;            // 端寄せ推論で確定したセルの割合
    double cross_line = 1.0;      // 交差ライン待ちで確定したセルの割合
    double pass = 0.1;            // 2パス目以降のパス数

    // バックトラックの倍率
    double backtrack = 1.0;       // 分岐が1回でもあれば加算
    double depth = 0.25;          // 最大分岐深さ
    double branches = 0.1;        // log2(1 + 分岐数)

    /// 分岐を要したパズルのスコア下限
    double backtrack_score_floor = 40.0;
};

/**
 * @brief 実行設定
 *
 * 全コンポーネントに明示的に渡す不変値。バッチのワーカー間で読み取り専用に共有する。
 */
struct Config {
    // ===== 検証 =====
    double min_color_distance = 35.0;   // 知覚色差の下限（0〜約255）
    size_t max_colors = 6;              // 背景を除く色数の上限
    size_t max_runs_per_line = 15;      // 1ラインのラン数の上限

    // ===== 探索予算 =====
    std::chrono::milliseconds timeout{30000};
    uint64_t max_search_nodes = 200000;

    // ===== 難易度 =====
    /// 各ティアの下限スコア（昇順、trivial は 0）
    std::array<double, TIER_COUNT> tier_thresholds{{0.0, 12.0, 24.0, 40.0, 65.0, 100.0, 160.0}};
    DifficultyWeights weights;

    /**
     * @brief 設定値の整合性を検証
     * @throws std::invalid_argument 不正な値がある場合
     */
    void validate() const;
};

} // namespace irodori

#endif // IRODORI_CONFIG_HPP
