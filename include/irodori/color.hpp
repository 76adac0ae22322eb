/**
 * @file color.hpp
 * @brief 色・パレット・知覚色差
 */
#ifndef IRODORI_COLOR_HPP
#define IRODORI_COLOR_HPP

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace irodori {

/**
 * @brief 色インデックス（0 は背景 = 空セル）
 */
using ColorIndex = uint8_t;

/// 背景（空セル）の色インデックス
constexpr ColorIndex BACKGROUND = 0;

/// 色マスクで扱える最大の前景色数（ビット 0 は背景）
constexpr size_t MAX_PALETTE_COLORS = 31;

/**
 * @brief RGB 色
 */
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

/**
 * @brief 知覚色差（輝度重み付きユークリッド距離）
 *
 * sqrt(0.30*dR^2 + 0.59*dG^2 + 0.11*dB^2)。緑 > 赤 > 青 の重み。
 * 黒と白の距離は約 255。
 */
double perceptual_distance(const Rgb& a, const Rgb& b);

/**
 * @brief "#rrggbb" 形式に変換
 */
std::string to_hex(const Rgb& color);

/**
 * @brief "#rrggbb" / "rrggbb" 形式を解析
 * @throws std::invalid_argument 形式が不正な場合
 */
Rgb parse_hex(const std::string& text);

/**
 * @brief パレット
 *
 * 前景色の順序付きリスト。色インデックス i (1..size()) が colors_[i-1] に対応し、
 * インデックス 0 は背景として予約される（RGB を持たない）。
 */
class Palette {
public:
    Palette() = default;

    /**
     * @brief 前景色リストからパレットを作成
     */
    explicit Palette(std::vector<Rgb> colors);

    /**
     * @brief 前景色の数（背景を除く）
     */
    size_t size() const { return colors_.size(); }

    bool empty() const { return colors_.empty(); }

    /**
     * @brief 色インデックスに対応する RGB
     * @throws std::out_of_range index が 0 または size() を超える場合
     */
    const Rgb& color(ColorIndex index) const;

    /**
     * @brief 前景色リスト
     */
    const std::vector<Rgb>& colors() const { return colors_; }

private:
    std::vector<Rgb> colors_;
};

} // namespace irodori

#endif // IRODORI_COLOR_HPP
