#include "candidate_reader.hpp"
#include "parser.hpp"
#include <stdexcept>
#include <utility>
#include <cstdio>

namespace irodori {
namespace tool {

namespace {

std::string where(const CandidateSource& source) {
    return "candidate \"" + source.name + "\" (line " + std::to_string(source.line) + ")";
}

std::vector<Candidate> decode_all(const ParserContext& ctx) {
    std::vector<Candidate> candidates;
    candidates.reserve(ctx.sources.size());
    for (const auto& source : ctx.sources) {
        candidates.push_back(decode_candidate(source));
    }
    return candidates;
}

}  // namespace

int decode_cell(char ch) {
    if (ch == '.') return 0;
    if (ch >= '1' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'v') return ch - 'a' + 10;
    return -1;
}

char encode_cell(ColorIndex color) {
    if (color == BACKGROUND) return '.';
    if (color <= 9) return static_cast<char>('0' + color);
    return static_cast<char>('a' + (color - 10));
}

Candidate decode_candidate(const CandidateSource& source) {
    Candidate candidate;
    candidate.name = source.name;

    std::vector<Rgb> colors;
    for (const auto& hex : source.palette) {
        colors.push_back(parse_hex(hex));
    }
    candidate.palette = Palette(std::move(colors));

    std::vector<std::vector<ColorIndex>> rows;
    for (size_t r = 0; r < source.rows.size(); ++r) {
        const auto& text = source.rows[r];
        if (!rows.empty() && text.size() != rows[0].size()) {
            throw std::runtime_error(where(source) + ": row " + std::to_string(r) + " has " +
                                     std::to_string(text.size()) + " cells, expected " +
                                     std::to_string(rows[0].size()));
        }
        std::vector<ColorIndex> row;
        row.reserve(text.size());
        for (char ch : text) {
            int value = decode_cell(ch);
            if (value < 0) {
                throw std::runtime_error(where(source) + ": invalid cell '" + std::string(1, ch) +
                                         "' in row " + std::to_string(r));
            }
            row.push_back(static_cast<ColorIndex>(value));
        }
        rows.push_back(std::move(row));
    }
    candidate.grid = ColorGrid::from_rows(rows);
    return candidate;
}

std::vector<Candidate> parse_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error in " + filename + ": " + ctx.error_message);
    }

    return decode_all(ctx);
}

std::vector<Candidate> parse_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }

    return decode_all(ctx);
}

} // namespace tool
} // namespace irodori
