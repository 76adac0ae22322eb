#include "irodori/propagation.hpp"
#include <algorithm>

namespace irodori {

GridPropagator::GridPropagator(const ClueSet& clues)
    : clues_(clues)
    , row_dirty_(clues.height(), 0)
    , col_dirty_(clues.width(), 0) {}

void GridPropagator::mark_all_dirty() {
    std::fill(row_dirty_.begin(), row_dirty_.end(), 1);
    std::fill(col_dirty_.begin(), col_dirty_.end(), 1);
}

void GridPropagator::mark_cell_dirty(const Grid& grid, size_t index) {
    row_dirty_[index / grid.width()] = 1;
    col_dirty_[index % grid.width()] = 1;
}

bool GridPropagator::has_dirty() const {
    return std::find(row_dirty_.begin(), row_dirty_.end(), 1) != row_dirty_.end() ||
           std::find(col_dirty_.begin(), col_dirty_.end(), 1) != col_dirty_.end();
}

void GridPropagator::clear_dirty() {
    std::fill(row_dirty_.begin(), row_dirty_.end(), 0);
    std::fill(col_dirty_.begin(), col_dirty_.end(), 0);
}

PropagationResult GridPropagator::run(Grid& grid, int save_point, SolveTrace& trace, bool root,
                                      const StopToken& stop) {
    PropagationResult result;

    while (has_dirty()) {
        result.passes++;
        if (root) {
            trace.propagation_passes++;
        }

        for (int a = 0; a < 2; ++a) {
            Axis axis = a == 0 ? Axis::Row : Axis::Column;
            auto& dirty = axis == Axis::Row ? row_dirty_ : col_dirty_;

            for (size_t line = 0; line < dirty.size(); ++line) {
                if (!dirty[line]) continue;

                if (stop.stop_requested()) {
                    clear_dirty();
                    result.status = PropagationStatus::Stopped;
                    return result;
                }

                dirty[line] = 0;
                if (!process_line(grid, axis, line, save_point, trace, root, result.passes)) {
                    // 矛盾: 残りの dirty は巻き戻し後に意味を持たない
                    clear_dirty();
                    result.status = PropagationStatus::Contradiction;
                    result.axis = axis;
                    result.line = line;
                    return result;
                }
            }
        }
    }

    result.status = PropagationStatus::Fixpoint;
    return result;
}

bool GridPropagator::process_line(Grid& grid, Axis axis, size_t line, int save_point,
                                  SolveTrace& trace, bool root, size_t pass) {
    trace.line_visits++;
    grid.load_line(axis, line, buffer_);

    if (line_.propagate(clues_.line(axis, line), buffer_, deductions_) == LineStatus::Contradiction) {
        return false;
    }

    for (const auto& d : deductions_) {
        size_t index = grid.cell_index(axis, line, d.position);
        if (!grid.restrict(save_point, index, d.mask)) {
            return false;
        }

        // 交差するラインを dirty にする
        if (axis == Axis::Row) {
            col_dirty_[d.position] = 1;
        } else {
            row_dirty_[d.position] = 1;
        }

        if (!d.determined) continue;
        if (!root) {
            trace.search_deductions++;
        } else if (d.kind == DeductionKind::SimpleOverlap) {
            trace.simple_overlap_cells++;
        } else if (pass == 1) {
            trace.edge_alignment_cells++;
        } else {
            trace.cross_line_cells++;
        }
    }
    return true;
}

} // namespace irodori
