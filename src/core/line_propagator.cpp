#include "irodori/line_propagator.hpp"

namespace irodori {

namespace {
const ColorMask EMPTY_BIT = color_bit(BACKGROUND);
}  // namespace

bool LinePropagator::fits(size_t run, size_t start) const {
    size_t len = (*clue_)[run].length;
    if (start + len > n_) return false;
    return compatible_[run * (n_ + 1) + start] >= len;
}

bool LinePropagator::placeable_before(size_t run, size_t start) const {
    // ラン run を start に置いたとき、ラン 0..run-1 が手前に収まるか
    if (run == 0) {
        return prefix(0, start);
    }
    if ((*clue_)[run - 1].color == (*clue_)[run].color) {
        // 同色: 直前に空白が1マス必要
        return start >= 1 && ((*cells_)[start - 1] & EMPTY_BIT) != 0 && prefix(run, start - 1);
    }
    return prefix(run, start);
}

bool LinePropagator::placeable_after(size_t run, size_t end) const {
    // ラン run が end で終わるとき、ラン run+1..k-1 が後ろに収まるか
    if (run + 1 == k_) {
        return suffix(k_, end);
    }
    if ((*clue_)[run].color == (*clue_)[run + 1].color) {
        return end < n_ && ((*cells_)[end] & EMPTY_BIT) != 0 && suffix(run + 1, end + 1);
    }
    return suffix(run + 1, end);
}

LineStatus LinePropagator::propagate(const Clue& clue, const std::vector<ColorMask>& cells,
                                     std::vector<LineDeduction>& deductions) {
    deductions.clear();
    clue_ = &clue;
    cells_ = &cells;
    n_ = cells.size();
    k_ = clue.size();

    // ランのないライン: 全セルが空
    if (k_ == 0) {
        for (size_t i = 0; i < n_; ++i) {
            if ((cells[i] & EMPTY_BIT) == 0) {
                return LineStatus::Contradiction;
            }
        }
        for (size_t i = 0; i < n_; ++i) {
            if (cells[i] != EMPTY_BIT) {
                deductions.push_back({i, EMPTY_BIT, true, DeductionKind::SimpleOverlap});
            }
        }
        return LineStatus::Consistent;
    }

    if (min_span(clue) > n_) {
        return LineStatus::Contradiction;
    }

    const size_t w = n_ + 1;

    // 各ランの色を許す連続セル数
    compatible_.assign(k_ * w, 0);
    for (size_t j = 0; j < k_; ++j) {
        ColorMask bit = color_bit(clue[j].color);
        for (size_t i = n_; i-- > 0;) {
            compatible_[j * w + i] = (cells[i] & bit) != 0 ? compatible_[j * w + i + 1] + 1 : 0;
        }
    }

    // suffix 表（右詰め側）
    suffix_.assign((k_ + 1) * w, 0);
    suffix_[k_ * w + n_] = 1;
    for (size_t i = n_; i-- > 0;) {
        suffix_[k_ * w + i] = ((cells[i] & EMPTY_BIT) != 0 && suffix(k_, i + 1)) ? 1 : 0;
    }
    for (size_t j = k_; j-- > 0;) {
        for (size_t i = n_; i-- > 0;) {
            bool ok = (cells[i] & EMPTY_BIT) != 0 && suffix(j, i + 1);
            if (!ok && fits(j, i)) {
                ok = placeable_after(j, i + clue[j].length);
            }
            suffix_[j * w + i] = ok ? 1 : 0;
        }
    }

    if (!suffix(0, 0)) {
        return LineStatus::Contradiction;
    }

    // prefix 表（左詰め側）
    prefix_.assign((k_ + 1) * w, 0);
    prefix_[0] = 1;
    for (size_t i = 1; i <= n_; ++i) {
        prefix_[i] = (prefix(0, i - 1) && (cells[i - 1] & EMPTY_BIT) != 0) ? 1 : 0;
    }
    for (size_t j = 1; j <= k_; ++j) {
        size_t len = clue[j - 1].length;
        for (size_t i = 1; i <= n_; ++i) {
            bool ok = (cells[i - 1] & EMPTY_BIT) != 0 && prefix(j, i - 1);
            if (!ok && i >= len && fits(j - 1, i - len)) {
                ok = placeable_before(j - 1, i - len);
            }
            prefix_[j * w + i] = ok ? 1 : 0;
        }
    }

    // 両側と両立する配置から各セルの実現可能な色を集める
    possible_.assign(n_, 0);
    for (size_t j = 0; j < k_; ++j) {
        size_t len = clue[j].length;
        coverage_.assign(w, 0);
        for (size_t s = 0; s + len <= n_; ++s) {
            if (fits(j, s) && placeable_before(j, s) && placeable_after(j, s + len)) {
                coverage_[s]++;
                coverage_[s + len]--;
            }
        }
        ColorMask bit = color_bit(clue[j].color);
        int depth = 0;
        for (size_t i = 0; i < n_; ++i) {
            depth += coverage_[i];
            if (depth > 0) {
                possible_[i] |= bit;
            }
        }
    }
    for (size_t i = 0; i < n_; ++i) {
        if ((cells[i] & EMPTY_BIT) == 0) continue;
        // セル i を空にして、ラン 0..j-1 を手前、ラン j..k-1 を後ろに置けるか
        for (size_t j = 0; j <= k_; ++j) {
            if (prefix(j, i) && suffix(j, i + 1)) {
                possible_[i] |= EMPTY_BIT;
                break;
            }
        }
    }

    compute_simple_overlap();

    for (size_t i = 0; i < n_; ++i) {
        ColorMask next = cells[i] & possible_[i];
        if (next == 0) {
            return LineStatus::Contradiction;
        }
        if (next == cells[i]) continue;

        bool determined = is_single(next);
        DeductionKind kind = DeductionKind::EdgeAlignment;
        if (determined && simple_forced_[i] == static_cast<int>(lowest_color(next))) {
            kind = DeductionKind::SimpleOverlap;
        }
        deductions.push_back({i, next, determined, kind});
    }

    return LineStatus::Consistent;
}

void LinePropagator::compute_simple_overlap() {
    const Clue& clue = *clue_;
    simple_forced_.assign(n_, -1);
    coverage_.assign(n_ + 1, 0);

    // 左詰め開始位置
    std::vector<size_t> leftmost(k_);
    size_t pos = 0;
    for (size_t j = 0; j < k_; ++j) {
        leftmost[j] = pos;
        pos += clue[j].length;
        if (j + 1 < k_ && clue[j].color == clue[j + 1].color) {
            pos += 1;
        }
    }

    // 右詰め開始位置（min_span <= n_ は呼び出し側で保証済み）
    std::vector<size_t> rightmost(k_);
    size_t end = n_;
    for (size_t j = k_; j-- > 0;) {
        if (j + 1 < k_ && clue[j].color == clue[j + 1].color) {
            end -= 1;
        }
        rightmost[j] = end - clue[j].length;
        end = rightmost[j];
    }

    for (size_t j = 0; j < k_; ++j) {
        size_t len = clue[j].length;
        coverage_[leftmost[j]]++;
        coverage_[rightmost[j] + len]--;
        for (size_t i = rightmost[j]; i < leftmost[j] + len; ++i) {
            simple_forced_[i] = clue[j].color;
        }
    }

    // どのランも届かないセルは空
    int depth = 0;
    for (size_t i = 0; i < n_; ++i) {
        depth += coverage_[i];
        if (depth == 0) {
            simple_forced_[i] = BACKGROUND;
        }
    }
}

} // namespace irodori
