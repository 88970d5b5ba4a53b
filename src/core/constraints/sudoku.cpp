#include "tansaku_csp/constraints/sudoku.hpp"

namespace tansaku_csp {

SudokuConstraint::SudokuConstraint()
    : peers_(NUM_CELLS) {
    for (size_t var = 0; var < NUM_CELLS; ++var) {
        size_t row = row_of(var);
        size_t column = column_of(var);
        auto& peers = peers_[var];

        // 行 → 列 → ボックス（行・列と重複しないもの）の順
        for (size_t c = 0; c < SIZE; ++c) {
            if (c != column) peers.push_back(cell_index(row, c));
        }
        for (size_t r = 0; r < SIZE; ++r) {
            if (r != row) peers.push_back(cell_index(r, column));
        }
        size_t box_row = (row / BOX) * BOX;
        size_t box_column = (column / BOX) * BOX;
        for (size_t r = box_row; r < box_row + BOX; ++r) {
            for (size_t c = box_column; c < box_column + BOX; ++c) {
                if (r == row || c == column) continue;
                peers.push_back(cell_index(r, c));
            }
        }
    }
}

std::string SudokuConstraint::name() const {
    return "sudoku";
}

bool SudokuConstraint::is_consistent(const Assignment& assignment,
                                     size_t var_idx, Domain::value_type value) const {
    size_t row = row_of(var_idx);
    size_t column = column_of(var_idx);

    auto holds = [&](size_t r, size_t c) {
        const auto& v = assignment.value(cell_index(r, c));
        return v && *v == value;
    };

    for (size_t c = 0; c < SIZE; ++c) {
        if (c != column && holds(row, c)) return false;
    }
    for (size_t r = 0; r < SIZE; ++r) {
        if (r != row && holds(r, column)) return false;
    }
    size_t box_row = (row / BOX) * BOX;
    size_t box_column = (column / BOX) * BOX;
    for (size_t r = box_row; r < box_row + BOX; ++r) {
        for (size_t c = box_column; c < box_column + BOX; ++c) {
            if ((r != row || c != column) && holds(r, c)) return false;
        }
    }
    return true;
}

} // namespace tansaku_csp
