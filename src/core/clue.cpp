#include "irodori/clue.hpp"
#include <algorithm>
#include <stdexcept>

namespace irodori {

const char* to_string(Axis axis) {
    return axis == Axis::Row ? "row" : "column";
}

size_t min_span(const Clue& clue) {
    size_t span = 0;
    for (size_t i = 0; i < clue.size(); ++i) {
        span += clue[i].length;
        if (i + 1 < clue.size() && clue[i].color == clue[i + 1].color) {
            span += 1;
        }
    }
    return span;
}

Clue encode_line(const std::vector<ColorIndex>& cells) {
    Clue clue;
    size_t i = 0;
    while (i < cells.size()) {
        if (cells[i] == BACKGROUND) {
            ++i;
            continue;
        }
        ColorIndex color = cells[i];
        size_t length = 0;
        while (i < cells.size() && cells[i] == color) {
            ++length;
            ++i;
        }
        clue.push_back({length, color});
    }
    return clue;
}

ColorGrid::ColorGrid(size_t width, size_t height)
    : width_(width)
    , height_(height)
    , cells_(width * height, BACKGROUND) {}

ColorGrid ColorGrid::from_rows(const std::vector<std::vector<ColorIndex>>& rows) {
    size_t height = rows.size();
    size_t width = height > 0 ? rows[0].size() : 0;
    ColorGrid grid(width, height);
    for (size_t r = 0; r < height; ++r) {
        if (rows[r].size() != width) {
            throw std::invalid_argument("Row " + std::to_string(r) + " has length " +
                                        std::to_string(rows[r].size()) + ", expected " +
                                        std::to_string(width));
        }
        for (size_t c = 0; c < width; ++c) {
            grid.set(r, c, rows[r][c]);
        }
    }
    return grid;
}

std::vector<ColorIndex> ColorGrid::row(size_t r) const {
    auto first = cells_.begin() + static_cast<std::ptrdiff_t>(r * width_);
    return std::vector<ColorIndex>(first, first + static_cast<std::ptrdiff_t>(width_));
}

std::vector<ColorIndex> ColorGrid::column(size_t c) const {
    std::vector<ColorIndex> result(height_);
    for (size_t r = 0; r < height_; ++r) {
        result[r] = at(r, c);
    }
    return result;
}

size_t ColorGrid::filled_count() const {
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
                                             [](ColorIndex c) { return c != BACKGROUND; }));
}

ColorIndex ColorGrid::max_color() const {
    if (cells_.empty()) return BACKGROUND;
    return *std::max_element(cells_.begin(), cells_.end());
}

size_t ClueSet::total_runs() const {
    size_t total = 0;
    for (const auto& clue : rows) total += clue.size();
    for (const auto& clue : columns) total += clue.size();
    return total;
}

size_t ClueSet::max_runs() const {
    size_t result = 0;
    for (const auto& clue : rows) result = std::max(result, clue.size());
    for (const auto& clue : columns) result = std::max(result, clue.size());
    return result;
}

ClueSet derive_clues(const ColorGrid& grid) {
    ClueSet clues;
    clues.rows.reserve(grid.height());
    clues.columns.reserve(grid.width());
    for (size_t r = 0; r < grid.height(); ++r) {
        clues.rows.push_back(encode_line(grid.row(r)));
    }
    for (size_t c = 0; c < grid.width(); ++c) {
        clues.columns.push_back(encode_line(grid.column(c)));
    }
    return clues;
}

} // namespace irodori
