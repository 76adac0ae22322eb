#include "irodori/config.hpp"
#include "irodori/color.hpp"
#include <stdexcept>

namespace irodori {

namespace {
const char* const TIER_NAMES[TIER_COUNT] = {
    "trivial", "easy", "medium", "hard", "challenging", "expert", "master"
};
}  // namespace

const char* to_string(Tier tier) {
    return TIER_NAMES[static_cast<size_t>(tier)];
}

std::optional<Tier> parse_tier(const std::string& name) {
    for (size_t i = 0; i < TIER_COUNT; ++i) {
        if (name == TIER_NAMES[i]) {
            return static_cast<Tier>(i);
        }
    }
    return std::nullopt;
}

void Config::validate() const {
    if (min_color_distance < 0.0) {
        throw std::invalid_argument("min_color_distance must be non-negative");
    }
    if (max_colors == 0 || max_colors > MAX_PALETTE_COLORS) {
        throw std::invalid_argument("max_colors must be in 1.." + std::to_string(MAX_PALETTE_COLORS));
    }
    if (max_runs_per_line == 0) {
        throw std::invalid_argument("max_runs_per_line must be positive");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }
    if (max_search_nodes == 0) {
        throw std::invalid_argument("max_search_nodes must be positive");
    }
    if (tier_thresholds[0] != 0.0) {
        throw std::invalid_argument("tier threshold of 'trivial' must be 0");
    }
    for (size_t i = 1; i < TIER_COUNT; ++i) {
        if (tier_thresholds[i] <= tier_thresholds[i - 1]) {
            throw std::invalid_argument(std::string("tier thresholds must be ascending at '") +
                                        TIER_NAMES[i] + "'");
        }
    }

    const auto& w = weights;
    const double all[] = {w.dimension, w.colors, w.fragmentation, w.fill, w.edge, w.cross_line,
                          w.pass, w.backtrack, w.depth, w.branches, w.backtrack_score_floor};
    for (double v : all) {
        if (v < 0.0) {
            throw std::invalid_argument("difficulty weights must be non-negative");
        }
    }
}

} // namespace irodori
