#include "puzzle_writer.hpp"
#include <cmath>

namespace irodori {
namespace tool {

namespace {

nlohmann::json clues_to_json(const std::vector<Clue>& lines) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& clue : lines) {
        nlohmann::json runs = nlohmann::json::array();
        for (const auto& run : clue) {
            runs.push_back({run.length, static_cast<int>(run.color)});
        }
        out.push_back(std::move(runs));
    }
    return out;
}

}  // namespace

nlohmann::json to_json(const Puzzle& puzzle) {
    nlohmann::json j;
    j["name"] = puzzle.name;
    j["w"] = puzzle.width();
    j["h"] = puzzle.height();
    j["r"] = clues_to_json(puzzle.clues.rows);
    j["c"] = clues_to_json(puzzle.clues.columns);

    nlohmann::json palette = nlohmann::json::array();
    for (const auto& color : puzzle.palette.colors()) {
        palette.push_back(to_hex(color));
    }
    j["p"] = std::move(palette);

    nlohmann::json solution = nlohmann::json::array();
    for (size_t r = 0; r < puzzle.height(); ++r) {
        nlohmann::json row = nlohmann::json::array();
        for (size_t c = 0; c < puzzle.width(); ++c) {
            row.push_back(static_cast<int>(puzzle.solution.at(r, c)));
        }
        solution.push_back(std::move(row));
    }
    j["s"] = std::move(solution);

    // 小数第2位まで
    j["score"] = std::round(puzzle.difficulty.score * 100.0) / 100.0;
    j["tier"] = to_string(puzzle.difficulty.tier);
    j["quality"] = {
        {"score", std::round(puzzle.quality.score * 100.0) / 100.0},
        {"grade", to_string(puzzle.quality.grade)},
        {"notes", puzzle.quality.notes},
    };
    return j;
}

void write_puzzles(std::ostream& out, const std::vector<BuildOutcome>& outcomes) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        if (outcome.status == BuildStatus::Accepted) {
            array.push_back(to_json(*outcome.puzzle));
        }
    }
    out << array.dump(2) << "\n";
}

} // namespace tool
} // namespace irodori
