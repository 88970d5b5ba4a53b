/**
 * @file sudoku.hpp
 * @brief Sudoku 制約（行・列・3x3 ボックスの all-different）
 */
#ifndef TANSAKU_CSP_CONSTRAINTS_SUDOKU_HPP
#define TANSAKU_CSP_CONSTRAINTS_SUDOKU_HPP

#include "tansaku_csp/constraint.hpp"

namespace tansaku_csp {

/**
 * @brief 9x9 Sudoku の暗黙的な制約グラフ
 *
 * 変数 (row, column) のインデックスは row * 9 + column（行優先）。
 * 各マスの peer は同じ行・同じ列・同じボックスの 20 マス。
 */
class SudokuConstraint : public Constraint {
public:
    static constexpr size_t SIZE = 9;
    static constexpr size_t BOX = 3;
    static constexpr size_t NUM_CELLS = SIZE * SIZE;

    SudokuConstraint();

    std::string name() const override;
    size_t num_variables() const override { return NUM_CELLS; }
    const std::vector<size_t>& peers(size_t var_idx) const override { return peers_[var_idx]; }

    /**
     * @brief 行・列・ボックスを走査して value の重複を検出
     */
    bool is_consistent(const Assignment& assignment,
                       size_t var_idx, Domain::value_type value) const override;

    static size_t cell_index(size_t row, size_t column) { return row * SIZE + column; }
    static size_t row_of(size_t var_idx) { return var_idx / SIZE; }
    static size_t column_of(size_t var_idx) { return var_idx % SIZE; }

private:
    std::vector<std::vector<size_t>> peers_;
};

} // namespace tansaku_csp

#endif // TANSAKU_CSP_CONSTRAINTS_SUDOKU_HPP
