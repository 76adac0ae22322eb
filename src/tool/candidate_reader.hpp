/**
 * @file candidate_reader.hpp
 * @brief 候補ファイルパーサーのインターフェース
 *
 * 書式:
 * @code
 * # コメント（# の直後が16進数字でないもの）
 * candidate "plus" {
 *     palette = [#1f2937];
 *     grid = [
 *         "..1..",
 *         "11111",
 *         "..1..",
 *     ];
 * }
 * @endcode
 * '.' は空セル、'1'〜'9' と 'a'〜'v' が色インデックス 1〜31。
 */
#ifndef IRODORI_TOOL_CANDIDATE_READER_HPP
#define IRODORI_TOOL_CANDIDATE_READER_HPP

#include "irodori/puzzle.hpp"
#include <cstdio>
#include <string>
#include <vector>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

namespace irodori {
namespace tool {

/**
 * @brief 構文解析直後の候補（文字列のまま）
 */
struct CandidateSource {
    std::string name;
    std::vector<std::string> palette;  // "#rrggbb"
    std::vector<std::string> rows;
    int line = 0;                      // candidate の行番号
};

/**
 * @brief セル文字を色インデックスに変換
 * @return 不正な文字なら -1
 */
int decode_cell(char ch);

/**
 * @brief 色インデックスをセル文字に変換（'.'、'1'〜'9'、'a'〜'v'）
 */
char encode_cell(ColorIndex color);

/**
 * @brief 文字列の候補をグリッドとパレットに変換
 * @throws std::runtime_error 行の長さが揃っていない、または不正な文字がある場合
 */
Candidate decode_candidate(const CandidateSource& source);

/**
 * @throws std::runtime_error ファイルが開けない、または構文エラーの場合
 */
std::vector<Candidate> parse_file(const std::string& filename);

/**
 * @throws std::runtime_error 構文エラーの場合
 */
std::vector<Candidate> parse_string(const std::string& input);

} // namespace tool
} // namespace irodori

#endif // IRODORI_TOOL_CANDIDATE_READER_HPP
