/**
 * @file problem_file.hpp
 * @brief 問題ファイルの中間表現
 */
#ifndef TANSAKU_CSP_IO_PROBLEM_FILE_HPP
#define TANSAKU_CSP_IO_PROBLEM_FILE_HPP

#include "tansaku_csp/problems/map_coloring.hpp"
#include "tansaku_csp/problems/sudoku.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tansaku_csp {
namespace io {

/**
 * @brief 問題の種類
 */
enum class ProblemKind {
    Sudoku,
    MapColoring
};

/**
 * @brief region 宣言: region NAME : [ NEIGHBOR, ... ];
 */
struct RegionDecl {
    std::string name;
    std::vector<std::string> neighbors;
    int line = 0;
};

/**
 * @brief 問題ファイルの中間表現
 *
 * sudoku 文を1つ持つか、region 文（と任意の palette 文）を持つ。
 */
class ProblemFile {
public:
    void set_grid(std::vector<Domain::value_type> cells) { grid_ = std::move(cells); }
    bool has_grid() const { return grid_.has_value(); }

    void set_palette(std::vector<std::string> colors) { palette_ = std::move(colors); }
    bool has_palette() const { return palette_.has_value(); }

    void add_region_decl(RegionDecl decl) { region_decls_.push_back(std::move(decl)); }
    const std::vector<RegionDecl>& region_decls() const { return region_decls_; }

    /**
     * @brief 問題の種類を判定
     * @throws std::runtime_error 空のファイル、sudoku と region/palette の混在
     */
    ProblemKind kind() const;

    /**
     * @brief Sudoku 問題に変換
     * @throws std::runtime_error マス数が 81 でない、値が 0..9 の範囲外
     */
    SudokuPuzzle to_sudoku() const;

    /**
     * @brief 地図彩色問題に変換
     *
     * 同じ領域の region 文が複数あれば隣接リストを併合する。
     * パレットはファイルの palette 文、なければ default_palette()。
     *
     * @param num_colors 0 でなければパレットの先頭 num_colors 色だけを使う
     * @throws std::runtime_error 隣接リストが不正、num_colors がパレットより大きい
     */
    MapColoring to_map_coloring(size_t num_colors = 0) const;

private:
    std::optional<std::vector<Domain::value_type>> grid_;
    std::optional<std::vector<std::string>> palette_;
    std::vector<RegionDecl> region_decls_;
};

} // namespace io
} // namespace tansaku_csp

#endif // TANSAKU_CSP_IO_PROBLEM_FILE_HPP
