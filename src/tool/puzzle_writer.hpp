/**
 * @file puzzle_writer.hpp
 * @brief 採用パズルの JSON 出力
 */
#ifndef IRODORI_TOOL_PUZZLE_WRITER_HPP
#define IRODORI_TOOL_PUZZLE_WRITER_HPP

#include "irodori/puzzle.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <vector>

namespace irodori {
namespace tool {

/**
 * @brief パズル1件を JSON に変換
 *
 * キー: name, w, h, r（行ヒント）, c（列ヒント）, p（パレット "#rrggbb"）,
 * s（解、0 = 空）, score, tier, quality（score, grade, notes）。
 * ヒントは [長さ, 色] の組の配列。
 */
nlohmann::json to_json(const Puzzle& puzzle);

/**
 * @brief 採用されたパズルだけを入力順の配列で書き出す
 */
void write_puzzles(std::ostream& out, const std::vector<BuildOutcome>& outcomes);

} // namespace tool
} // namespace irodori

#endif // IRODORI_TOOL_PUZZLE_WRITER_HPP
