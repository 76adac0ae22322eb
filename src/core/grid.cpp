#include "irodori/grid.hpp"
#include <stdexcept>

namespace irodori {

Grid::Grid(size_t width, size_t height, ColorMask initial)
    : width_(width)
    , height_(height)
    , masks_(width * height, initial)
    , last_saved_level_(width * height, -1) {
    if (is_single(initial)) {
        determined_count_ = masks_.size();
    }
}

void Grid::load_line(Axis axis, size_t line, std::vector<ColorMask>& out) const {
    size_t n = line_length(axis);
    out.resize(n);
    for (size_t pos = 0; pos < n; ++pos) {
        out[pos] = masks_[cell_index(axis, line, pos)];
    }
}

void Grid::save_cell_state(int save_point, size_t index) {
    // 同じレベルで既に保存済みならスキップ
    if (last_saved_level_[index] == save_point) {
        return;
    }
    last_saved_level_[index] = save_point;
    trail_.push_back({save_point, CellTrailEntry{index, masks_[index]}});
}

bool Grid::restrict(int save_point, size_t index, ColorMask allowed) {
    ColorMask current = masks_[index];
    ColorMask next = current & allowed;
    if (next == current) {
        return true;  // 変更不要
    }
    if (next == 0) {
        return false;  // 候補が空になる
    }

    save_cell_state(save_point, index);
    masks_[index] = next;
    if (!is_single(current) && is_single(next)) {
        determined_count_++;
    }
    return true;
}

bool Grid::assign(int save_point, size_t index, ColorIndex color) {
    return restrict(save_point, index, color_bit(color));
}

void Grid::rewind_to(int save_point) {
    while (!trail_.empty() && trail_.back().first > save_point) {
        const auto& entry = trail_.back().second;
        ColorMask current = masks_[entry.index];

        // 確定カウンタ調整
        bool was_determined = is_single(current);
        bool will_be_determined = is_single(entry.old_mask);
        if (was_determined && !will_be_determined) {
            determined_count_--;
        } else if (!was_determined && will_be_determined) {
            determined_count_++;
        }

        masks_[entry.index] = entry.old_mask;
        last_saved_level_[entry.index] = -1;
        trail_.pop_back();
    }
}

ColorGrid Grid::to_color_grid() const {
    if (!is_complete()) {
        throw std::logic_error("Grid has undetermined cells");
    }
    ColorGrid result(width_, height_);
    for (size_t r = 0; r < height_; ++r) {
        for (size_t c = 0; c < width_; ++c) {
            result.set(r, c, value(r * width_ + c));
        }
    }
    return result;
}

} // namespace irodori
