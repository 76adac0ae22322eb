/**
 * @file grid.hpp
 * @brief 探索用グリッド（候補色マスク + 集中Trail）
 */
#ifndef IRODORI_GRID_HPP
#define IRODORI_GRID_HPP

#include "irodori/clue.hpp"
#include <vector>
#include <utility>
#include <cstdint>

namespace irodori {

/**
 * @brief セルの候補色集合（ビット c = 色 c が候補）
 */
using ColorMask = uint32_t;

inline ColorMask color_bit(ColorIndex color) { return ColorMask{1} << color; }

/**
 * @brief 背景 + 色 1..palette_size の全候補マスク
 */
inline ColorMask full_mask(size_t palette_size) {
    return palette_size >= 31 ? ~ColorMask{0} : (ColorMask{1} << (palette_size + 1)) - 1;
}

/**
 * @brief 候補が1色だけか（= Determined）
 */
inline bool is_single(ColorMask mask) { return mask != 0 && (mask & (mask - 1)) == 0; }

/**
 * @brief 候補数
 */
inline size_t mask_size(ColorMask mask) {
    size_t n = 0;
    while (mask != 0) {
        mask &= mask - 1;
        ++n;
    }
    return n;
}

/**
 * @brief 最小の候補色
 */
inline ColorIndex lowest_color(ColorMask mask) {
    ColorIndex c = 0;
    while (mask != 0 && (mask & 1u) == 0) {
        mask >>= 1;
        ++c;
    }
    return c;
}

/**
 * @brief セル用 Trail エントリ
 */
struct CellTrailEntry {
    size_t index;
    ColorMask old_mask;
};

/**
 * @brief 探索中のグリッド状態
 *
 * セル状態は row * width + col のフラット配列に候補色マスクとして保持する。
 * 候補が1色なら Determined、2色以上なら Unknown。空マスクは矛盾。
 * 変更は (セーブポイント, 変更前マスク) として Trail に積み、
 * rewind_to() で変更量に比例するコストで巻き戻す。
 */
class Grid {
public:
    /**
     * @brief 全セルを initial で初期化
     */
    Grid(size_t width, size_t height, ColorMask initial);

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t size() const { return masks_.size(); }

    /**
     * @brief セルの候補色マスク
     */
    ColorMask mask(size_t index) const { return masks_[index]; }
    ColorMask mask(size_t row, size_t col) const { return masks_[row * width_ + col]; }

    /**
     * @brief セルが確定しているか
     */
    bool is_determined(size_t index) const { return is_single(masks_[index]); }

    /**
     * @brief 確定したセルの色（確定している場合のみ有効）
     */
    ColorIndex value(size_t index) const { return lowest_color(masks_[index]); }

    /**
     * @brief 確定セル数を取得（O(1)）
     */
    size_t determined_count() const { return determined_count_; }

    /**
     * @brief 全セルが確定したか
     */
    bool is_complete() const { return determined_count_ == masks_.size(); }

    /**
     * @brief ライン上の位置からセルインデックスを求める
     */
    size_t cell_index(Axis axis, size_t line, size_t pos) const {
        return axis == Axis::Row ? line * width_ + pos : pos * width_ + line;
    }

    /**
     * @brief ラインの長さ
     */
    size_t line_length(Axis axis) const { return axis == Axis::Row ? width_ : height_; }

    /**
     * @brief ラインのマスクを out にコピー
     */
    void load_line(Axis axis, size_t line, std::vector<ColorMask>& out) const;

    // ===== ドメイン操作（Trail 付き） =====

    /**
     * @brief 候補色を allowed との共通部分に絞る
     * @param save_point バックトラック用セーブポイント
     * @param index セルインデックス
     * @param allowed 許可する色のマスク
     * @return 候補が空にならなければ true（空になる場合は変更しない）
     */
    bool restrict(int save_point, size_t index, ColorMask allowed);

    /**
     * @brief セルを特定の色に固定
     * @return 色が候補に含まれていれば true
     */
    bool assign(int save_point, size_t index, ColorIndex color);

    // ===== Trail 管理 =====

    /**
     * @brief 指定セーブポイントまで巻き戻す
     */
    void rewind_to(int save_point);

    /**
     * @brief Trail のサイズを取得
     */
    size_t trail_size() const { return trail_.size(); }

    /**
     * @brief 確定グリッドに変換
     * @throws std::logic_error 未確定セルが残っている場合
     */
    ColorGrid to_color_grid() const;

private:
    /**
     * @brief セル状態を Trail に保存
     */
    void save_cell_state(int save_point, size_t index);

    size_t width_;
    size_t height_;
    std::vector<ColorMask> masks_;
    std::vector<int> last_saved_level_;

    // 集中 Trail
    std::vector<std::pair<int, CellTrailEntry>> trail_;

    size_t determined_count_ = 0;
};

} // namespace irodori

#endif // IRODORI_GRID_HPP
