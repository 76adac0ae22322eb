/**
 * @file clue.hpp
 * @brief 確定グリッドとラン長ヒント
 */
#ifndef IRODORI_CLUE_HPP
#define IRODORI_CLUE_HPP

#include "irodori/color.hpp"
#include <vector>
#include <string>
#include <cstddef>

namespace irodori {

/**
 * @brief ラインの向き
 */
enum class Axis {
    Row,
    Column
};

/**
 * @brief "row" / "column"
 */
const char* to_string(Axis axis);

/**
 * @brief 同色セルの連続（ラン）
 */
struct Run {
    size_t length;
    ColorIndex color;  // 1 以上（背景はランにならない）

    bool operator==(const Run& other) const {
        return length == other.length && color == other.color;
    }
    bool operator!=(const Run& other) const { return !(*this == other); }
};

/**
 * @brief 1ライン分のヒント（左→右 / 上→下の順のラン列）
 */
using Clue = std::vector<Run>;

/**
 * @brief ヒントの最小占有長
 *
 * ラン長の合計 + 同色が隣接する箇所ごとの必須空白 1。
 * これがライン長を超えるヒントは充足不能。
 */
size_t min_span(const Clue& clue);

/**
 * @brief セル列をラン長符号化してヒントを作る
 */
Clue encode_line(const std::vector<ColorIndex>& cells);

/**
 * @brief 確定グリッド（0 = 空、1 以上 = 色）
 *
 * 入力候補（正解画像）と検証済みの解の両方に使う。
 * セルは row * width + col のフラット配列で保持する。
 */
class ColorGrid {
public:
    ColorGrid() = default;
    ColorGrid(size_t width, size_t height);

    /**
     * @brief 行ベクタから作成
     * @throws std::invalid_argument 行の長さが揃っていない場合
     */
    static ColorGrid from_rows(const std::vector<std::vector<ColorIndex>>& rows);

    size_t width() const { return width_; }
    size_t height() const { return height_; }
    size_t size() const { return cells_.size(); }

    ColorIndex at(size_t row, size_t col) const { return cells_[row * width_ + col]; }
    void set(size_t row, size_t col, ColorIndex color) { cells_[row * width_ + col] = color; }

    const std::vector<ColorIndex>& cells() const { return cells_; }

    std::vector<ColorIndex> row(size_t r) const;
    std::vector<ColorIndex> column(size_t c) const;

    /**
     * @brief 色付きセル数
     */
    size_t filled_count() const;

    /**
     * @brief 使われている最大の色インデックス
     */
    ColorIndex max_color() const;

    bool operator==(const ColorGrid& other) const {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }
    bool operator!=(const ColorGrid& other) const { return !(*this == other); }

private:
    size_t width_ = 0;
    size_t height_ = 0;
    std::vector<ColorIndex> cells_;
};

/**
 * @brief 全行・全列のヒント
 */
struct ClueSet {
    std::vector<Clue> rows;
    std::vector<Clue> columns;

    size_t width() const { return columns.size(); }
    size_t height() const { return rows.size(); }

    const Clue& line(Axis axis, size_t index) const {
        return axis == Axis::Row ? rows[index] : columns[index];
    }

    /**
     * @brief 全ラインのラン数の合計
     */
    size_t total_runs() const;

    /**
     * @brief 全ラインのラン数の最大値
     */
    size_t max_runs() const;
};

/**
 * @brief 確定グリッドの各行・各列をラン長符号化する
 */
ClueSet derive_clues(const ColorGrid& grid);

} // namespace irodori

#endif // IRODORI_CLUE_HPP
