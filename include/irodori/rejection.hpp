/**
 * @file rejection.hpp
 * @brief 不採用理由（タグ付き共用体）
 */
#ifndef IRODORI_REJECTION_HPP
#define IRODORI_REJECTION_HPP

#include "irodori/clue.hpp"
#include <variant>
#include <string>
#include <cstddef>
#include <cstdint>

namespace irodori {

/**
 * @brief ラン数が多すぎるライン
 */
struct TooDense {
    Axis axis;
    size_t line;
    size_t run_count;
    size_t limit;
};

/**
 * @brief 見分けにくい色の組（最も近い組を報告）
 */
struct ColorsTooSimilar {
    ColorIndex color_a;
    ColorIndex color_b;
    double distance;
    double minimum;
};

/**
 * @brief 色数超過
 */
struct TooManyColors {
    size_t count;
    size_t limit;
};

/**
 * @brief 空のグリッド（幅・高さ 0、または色付きセルなし）
 */
struct EmptyCandidate {
    size_t width;
    size_t height;
};

/**
 * @brief 解が複数ある（最初に見つかった2解の相違セル）
 */
struct NonUnique {
    uint64_t nodes;
    size_t row;
    size_t col;
};

/**
 * @brief 時間切れ
 */
struct Timeout {
    double elapsed_ms;
    uint64_t nodes;
};

/**
 * @brief 探索ノード数の上限に到達
 */
struct TooComplex {
    uint64_t nodes;
    uint64_t limit;
    double elapsed_ms;
};

/**
 * @brief 解なし
 *
 * during_search が false のときはルート伝播で矛盾したラインを axis/line に持つ。
 */
struct Infeasible {
    bool during_search;
    Axis axis;
    size_t line;
    uint64_t nodes;
};

using Rejection = std::variant<TooDense, ColorsTooSimilar, TooManyColors, EmptyCandidate,
                               NonUnique, Timeout, TooComplex, Infeasible>;

/**
 * @brief 不採用理由の種別（レポート集計用）
 */
enum class RejectReason {
    TooDense,
    ColorsTooSimilar,
    TooManyColors,
    InvalidEmpty,
    ValidMultiple,
    Timeout,
    TooComplex,
    Infeasible
};

constexpr size_t REJECT_REASON_COUNT = 8;

RejectReason reason_of(const Rejection& rejection);

/**
 * @brief 理由文字列（"too_dense", "valid_multiple" など）
 */
const char* to_string(RejectReason reason);

/**
 * @brief 診断情報付きの説明文
 */
std::string describe(const Rejection& rejection);

} // namespace irodori

#endif // IRODORI_REJECTION_HPP
