/**
 * @file sudoku.hpp
 * @brief 9x9 Sudoku 盤面と CSP モデルの相互変換
 */
#ifndef TANSAKU_CSP_PROBLEMS_SUDOKU_HPP
#define TANSAKU_CSP_PROBLEMS_SUDOKU_HPP

#include "tansaku_csp/constraints/sudoku.hpp"
#include "tansaku_csp/model.hpp"
#include "tansaku_csp/solver.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>

namespace tansaku_csp {

/**
 * @brief 9x9 盤面（0 = 空きマス、1..9 = 数字）
 */
using Grid = std::array<std::array<int, SudokuConstraint::SIZE>, SudokuConstraint::SIZE>;

/**
 * @brief Sudoku 問題
 */
class SudokuPuzzle {
public:
    /**
     * @brief 盤面から問題を作成
     * @throws std::runtime_error 0..9 以外の値を含む場合
     */
    explicit SudokuPuzzle(const Grid& grid);

    const Grid& grid() const { return grid_; }

    /**
     * @brief CSP モデルを構築
     *
     * マス (row, column) は変数 "r{row+1}c{column+1}"（インデックス row * 9 + column）。
     * 数字が入っているマスは固定変数、空きマスは定義域 1..9。
     */
    std::unique_ptr<Model> to_model() const;

    /**
     * @brief 割り当てを盤面に変換（未割り当てのマスは 0）
     */
    static Grid to_grid(const Assignment& assignment);

    /**
     * @brief 解く
     * @return 解の盤面、解がなければstd::nullopt
     */
    std::optional<Grid> solve(Solver& solver) const;

    /**
     * @brief solution がこの問題の正しい解か
     *
     * 全ての行・列・ボックスに 1..9 が1回ずつ現れ、与えられた数字が変わっていないこと。
     */
    bool is_solution(const Grid& solution) const;

private:
    Grid grid_;
};

/**
 * @brief 盤面を表示用文字列に変換（空きマスは '.'）
 */
std::string format_grid(const Grid& grid);

} // namespace tansaku_csp

#endif // TANSAKU_CSP_PROBLEMS_SUDOKU_HPP
