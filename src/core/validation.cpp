#include "irodori/validation.hpp"
#include <stdexcept>
#include <string>

namespace irodori {

void check_palette_consistency(const ColorGrid& grid, const Palette& palette) {
    if (palette.size() > MAX_PALETTE_COLORS) {
        throw std::invalid_argument("palette has more than " +
                                    std::to_string(MAX_PALETTE_COLORS) + " colors");
    }
    ColorIndex max = grid.max_color();
    if (max > palette.size()) {
        throw std::invalid_argument("color index " + std::to_string(max) +
                                    " is beyond the palette (" +
                                    std::to_string(palette.size()) + " colors)");
    }
}

std::optional<Rejection> check_not_empty(const ColorGrid& grid) {
    if (grid.width() == 0 || grid.height() == 0 || grid.filled_count() == 0) {
        return Rejection{EmptyCandidate{grid.width(), grid.height()}};
    }
    return std::nullopt;
}

std::optional<Rejection> check_color_budget(const Palette& palette, const Config& config) {
    if (palette.size() > config.max_colors) {
        return Rejection{TooManyColors{palette.size(), config.max_colors}};
    }
    return std::nullopt;
}

std::optional<Rejection> check_color_separation(const Palette& palette, const Config& config) {
    const auto& colors = palette.colors();
    bool found = false;
    ColorsTooSimilar closest{0, 0, 0.0, config.min_color_distance};

    for (size_t i = 0; i < colors.size(); ++i) {
        for (size_t j = i + 1; j < colors.size(); ++j) {
            double d = perceptual_distance(colors[i], colors[j]);
            if (d >= config.min_color_distance) continue;
            if (!found || d < closest.distance) {
                found = true;
                closest.color_a = static_cast<ColorIndex>(i + 1);
                closest.color_b = static_cast<ColorIndex>(j + 1);
                closest.distance = d;
            }
        }
    }

    if (found) {
        return Rejection{closest};
    }
    return std::nullopt;
}

std::optional<Rejection> check_density(const ClueSet& clues, const Config& config) {
    bool found = false;
    TooDense densest{Axis::Row, 0, 0, config.max_runs_per_line};

    for (int a = 0; a < 2; ++a) {
        Axis axis = a == 0 ? Axis::Row : Axis::Column;
        const auto& lines = axis == Axis::Row ? clues.rows : clues.columns;
        for (size_t i = 0; i < lines.size(); ++i) {
            size_t runs = lines[i].size();
            if (runs > config.max_runs_per_line && runs > densest.run_count) {
                found = true;
                densest.axis = axis;
                densest.line = i;
                densest.run_count = runs;
            }
        }
    }

    if (found) {
        return Rejection{densest};
    }
    return std::nullopt;
}

std::optional<Rejection> validate_candidate(const ColorGrid& grid, const Palette& palette,
                                            const ClueSet& clues, const Config& config) {
    // max_colors <= MAX_PALETTE_COLORS なので、マスク幅を超えるパレットはここで棄却される
    if (auto r = check_color_budget(palette, config)) return r;
    check_palette_consistency(grid, palette);

    if (auto r = check_not_empty(grid)) return r;
    if (auto r = check_color_separation(palette, config)) return r;
    if (auto r = check_density(clues, config)) return r;
    return std::nullopt;
}

} // namespace irodori
