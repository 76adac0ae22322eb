#include "irodori/quality.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace irodori {

namespace {

std::string percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << ratio * 100.0 << "%";
    return oss.str();
}

std::string dims(const ColorGrid& g) {
    return std::to_string(g.width()) + "x" + std::to_string(g.height());
}

void add_note(std::vector<std::string>& notes, const std::string& note) {
    if (!note.empty()) notes.push_back(note);
}

double mean(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / v.size();
}

// 標本分散
double variance(const std::vector<double>& v) {
    double m = mean(v);
    double sum = 0.0;
    for (double x : v) sum += (x - m) * (x - m);
    return sum / (v.size() - 1);
}

double score_fill(const ColorGrid& g, std::string& note) {
    double ratio = g.size() > 0 ? static_cast<double>(g.filled_count()) / g.size() : 0.0;
    if (ratio >= 0.35 && ratio <= 0.65) return 1.0;
    if (ratio < 0.20) {
        note = "Very sparse (" + percent(ratio) + " filled)";
        return ratio / 0.20 * 0.5;
    }
    if (ratio < 0.35) {
        note = "Sparse (" + percent(ratio) + " filled)";
        return 0.5 + (ratio - 0.20) / 0.15 * 0.5;
    }
    if (ratio > 0.80) {
        note = "Very dense (" + percent(ratio) + " filled)";
        return std::max(0.3, 1.0 - (ratio - 0.80) / 0.20);
    }
    return 1.0 - (ratio - 0.65) / 0.15 * 0.3;
}

double score_aspect(const ColorGrid& g, std::string& note) {
    double ratio = static_cast<double>(std::max(g.width(), g.height())) /
                   std::min(g.width(), g.height());
    std::ostringstream r;
    r << std::fixed << std::setprecision(1) << ratio << ":1";
    if (ratio <= 1.5) return 1.0;
    if (ratio <= 2.0) return 1.0 - (ratio - 1.5) / 0.5 * 0.2;
    if (ratio <= 3.0) {
        note = "Elongated aspect ratio (" + r.str() + ")";
        return 0.8 - (ratio - 2.0) * 0.3;
    }
    note = "Very elongated aspect ratio (" + r.str() + ")";
    return std::max(0.3, 0.5 - (ratio - 3.0) / 2.0 * 0.2);
}

double score_size(const ColorGrid& g, std::string& note) {
    size_t min_dim = std::min(g.width(), g.height());
    size_t max_dim = std::max(g.width(), g.height());
    if (min_dim < 5) {
        note = "Very small grid (" + dims(g) + ")";
        return 0.3;
    }
    if (min_dim < 8) {
        note = "Small grid (" + dims(g) + ")";
        return 0.5 + (min_dim - 5) / 3.0 * 0.3;
    }
    if (max_dim > 35) {
        note = "Very large grid (" + dims(g) + ")";
        return 0.4;
    }
    if (max_dim > 25) {
        note = "Large grid (" + dims(g) + ")";
        return 0.7 - (max_dim - 25) / 10.0 * 0.3;
    }
    return 1.0;
}

double score_colors(const ColorGrid& g, size_t palette_size, std::string& note) {
    if (palette_size <= 1) {
        note = "Single color puzzle";
        return 0.5;
    }

    std::map<ColorIndex, size_t> counts;
    for (ColorIndex c : g.cells()) {
        if (c != BACKGROUND) counts[c]++;
    }
    size_t filled = g.filled_count();
    if (filled == 0) {
        note = "No filled cells";
        return 0.3;
    }

    size_t tiny = 0;
    double max_ratio = 0.0;
    bool balanced = true;
    for (const auto& [color, count] : counts) {
        double r = static_cast<double>(count) / filled;
        if (r < 0.03 && count < 5) tiny++;
        max_ratio = std::max(max_ratio, r);
        if (r < 0.10 || r > 0.60) balanced = false;
    }

    std::vector<std::string> issues;
    double score = 1.0;
    if (tiny > 0) {
        issues.push_back(std::to_string(tiny) + " colors with minimal use");
        score -= 0.15 * std::min<size_t>(tiny, 3) / 3.0;
    }
    if (max_ratio > 0.85) {
        issues.push_back("One color dominates (" + percent(max_ratio) + ")");
    } else if (max_ratio > 0.75) {
        issues.push_back("Color imbalance (" + percent(max_ratio) + " from one)");
    }
    if (max_ratio > 0.75) {
        score -= (max_ratio - 0.75) / 0.25 * 0.3;
    }
    if (balanced) {
        score = std::min(1.0, score + 0.1);
    }

    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) note += "; ";
        note += issues[i];
    }
    return std::max(0.2, score);
}

double score_variety(const ClueSet& clues, std::string& note) {
    std::vector<double> lengths;
    for (const auto* lines : {&clues.rows, &clues.columns}) {
        for (const auto& clue : *lines) {
            for (const auto& run : clue) lengths.push_back(static_cast<double>(run.length));
        }
    }
    if (lengths.empty()) {
        note = "No clues";
        return 0.5;
    }

    std::vector<double> distinct(lengths);
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    double max_length = distinct.back();

    if (distinct.size() == 1) {
        note = "All clues are length " + std::to_string(static_cast<size_t>(lengths[0]));
        return 0.3;
    }
    if (distinct.size() <= 2 && max_length <= 2) {
        note = "Limited clue variety (all short)";
        return 0.5;
    }
    if (max_length <= 2) {
        note = "No long clues";
        return 0.6;
    }

    // 変動係数 0.3〜1.5 を良しとする
    double avg = mean(lengths);
    double cv = avg > 0.0 ? std::sqrt(variance(lengths)) / avg : 0.0;
    if (cv < 0.3) {
        note = "Low clue variety";
        return 0.7;
    }
    return cv > 1.5 ? 0.8 : 1.0;
}

double score_edges(const ColorGrid& g, std::string& note) {
    size_t edge_filled = 0, edge_total = 0, center_filled = 0, center_total = 0;
    for (size_t r = 0; r < g.height(); ++r) {
        for (size_t c = 0; c < g.width(); ++c) {
            bool edge = r == 0 || r == g.height() - 1 || c == 0 || c == g.width() - 1;
            bool filled = g.at(r, c) != BACKGROUND;
            if (edge) {
                edge_total++;
                edge_filled += filled;
            } else {
                center_total++;
                center_filled += filled;
            }
        }
    }

    double edge_ratio = static_cast<double>(edge_filled) / edge_total;
    double center_ratio = center_total > 0 ? static_cast<double>(center_filled) / center_total : 0.0;

    if (edge_ratio < 0.1 && center_ratio > 0.3) {
        note = "Content doesn't reach edges (floating)";
        return 0.5;
    }
    if (edge_ratio < 0.2 && center_ratio > edge_ratio * 2) {
        note = "Sparse edges";
        return 0.7;
    }

    double balance = edge_ratio;
    if (center_ratio > 0.0) {
        balance = edge_ratio > 0.0 ? std::min(edge_ratio / center_ratio, center_ratio / edge_ratio)
                                   : 0.0;
    }
    return std::min(1.0, 0.6 + balance * 0.4);
}

double score_line_balance(const ClueSet& clues, std::string& note) {
    std::vector<double> runs;
    for (const auto& c : clues.rows) runs.push_back(static_cast<double>(c.size()));
    for (const auto& c : clues.columns) runs.push_back(static_cast<double>(c.size()));
    if (runs.empty() || *std::max_element(runs.begin(), runs.end()) == 0.0) {
        note = "Empty puzzle";
        return 0.5;
    }

    double n = static_cast<double>(runs.size());
    double trivial = std::count_if(runs.begin(), runs.end(), [](double r) { return r <= 1; }) / n;
    double complex_ratio = std::count_if(runs.begin(), runs.end(), [](double r) { return r >= 4; }) / n;

    std::vector<std::string> issues;
    double score = 1.0;
    if (trivial > 0.5) {
        score -= 0.3;
        issues.push_back(percent(trivial) + " trivial lines");
    } else if (trivial > 0.3) {
        score -= 0.1;
    }
    if (complex_ratio > 0.1 && trivial < 0.4) {
        score = std::min(1.0, score + 0.1);
    }
    if (runs.size() > 1 && variance(runs) < 0.5 && mean(runs) > 1.0) {
        issues.push_back("Monotonous line complexity");
        score -= 0.15;
    }

    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) note += "; ";
        note += issues[i];
    }
    return std::max(0.3, score);
}

double score_clue_density(const ClueSet& clues, std::string& note) {
    size_t lines = clues.width() + clues.height();
    if (lines == 0) {
        note = "No clues";
        return 0.5;
    }

    size_t max_runs = clues.max_runs();
    size_t many = 0;
    for (const auto* side : {&clues.rows, &clues.columns}) {
        for (const auto& clue : *side) {
            if (clue.size() >= 10) many++;
        }
    }
    double many_ratio = static_cast<double>(many) / lines;
    std::string max_text = "(max " + std::to_string(max_runs) + "/line)";

    double score;
    if (max_runs <= 8) {
        score = 1.0;
    } else if (max_runs <= 10) {
        score = 0.95;
    } else if (max_runs <= 12) {
        score = 0.85;
        note = "Dense clues " + max_text;
    } else if (max_runs <= 15) {
        score = 0.65;
        note = "Very dense clues " + max_text;
    } else if (max_runs <= 20) {
        score = 0.4;
        note = "Overcrowded clues " + max_text;
    } else {
        score = 0.2;
        note = "Unplayable clue density " + max_text;
    }

    if (many_ratio > 0.3 && max_runs > 10) {
        score *= 0.9;
        if (!note.empty()) note += "; ";
        note += percent(many_ratio) + " lines have 10+ clues";
    }
    return std::max(0.1, score);
}

QualityGrade grade_for(double score) {
    if (score >= 85.0) return QualityGrade::Excellent;
    if (score >= 70.0) return QualityGrade::Good;
    if (score >= 55.0) return QualityGrade::Fair;
    if (score >= 40.0) return QualityGrade::Poor;
    return QualityGrade::Bad;
}

}  // namespace

const char* to_string(QualityGrade grade) {
    switch (grade) {
    case QualityGrade::Excellent: return "excellent";
    case QualityGrade::Good: return "good";
    case QualityGrade::Fair: return "fair";
    case QualityGrade::Poor: return "poor";
    case QualityGrade::Bad: return "bad";
    }
    return "unknown";
}

QualityReport score_quality(const ColorGrid& solution, const ClueSet& clues,
                            size_t palette_size) {
    QualityReport report;
    if (solution.width() == 0 || solution.height() == 0) {
        report.notes.push_back("Empty puzzle");
        return report;
    }

    auto& f = report.factors;
    std::string note;

    f.fill_ratio = score_fill(solution, note);
    add_note(report.notes, note);
    note.clear();
    f.aspect_ratio = score_aspect(solution, note);
    add_note(report.notes, note);
    note.clear();
    f.grid_size = score_size(solution, note);
    add_note(report.notes, note);
    note.clear();
    f.color_effectiveness = score_colors(solution, palette_size, note);
    add_note(report.notes, note);
    note.clear();
    f.clue_variety = score_variety(clues, note);
    add_note(report.notes, note);
    note.clear();
    f.edge_utilization = score_edges(solution, note);
    add_note(report.notes, note);
    note.clear();
    f.line_balance = score_line_balance(clues, note);
    add_note(report.notes, note);
    note.clear();
    f.clue_density = score_clue_density(clues, note);
    add_note(report.notes, note);

    // 重み: 塗り率とラン密度を重視
    const std::pair<double, double> weighted[] = {
        {f.fill_ratio, 1.5},          {f.aspect_ratio, 0.8},
        {f.grid_size, 1.0},           {f.color_effectiveness, 1.2},
        {f.clue_variety, 1.0},        {f.edge_utilization, 1.0},
        {f.line_balance, 0.8},        {f.clue_density, 1.5},
    };
    double sum = 0.0, total = 0.0;
    for (const auto& [value, weight] : weighted) {
        sum += value * weight;
        total += weight;
    }
    report.score = std::round(sum / total * 1000.0) / 10.0;
    report.grade = grade_for(report.score);
    return report;
}

} // namespace irodori
