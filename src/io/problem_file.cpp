#include "tansaku_csp/io/problem_file.hpp"
#include <stdexcept>

namespace tansaku_csp {
namespace io {

ProblemKind ProblemFile::kind() const {
    bool has_map = !region_decls_.empty() || palette_.has_value();
    if (grid_ && has_map) {
        throw std::runtime_error("A problem file cannot contain both a sudoku grid and regions");
    }
    if (grid_) {
        return ProblemKind::Sudoku;
    }
    if (!region_decls_.empty()) {
        return ProblemKind::MapColoring;
    }
    throw std::runtime_error("Problem file contains no sudoku grid and no regions");
}

SudokuPuzzle ProblemFile::to_sudoku() const {
    if (kind() != ProblemKind::Sudoku) {
        throw std::runtime_error("Problem file does not describe a sudoku");
    }
    const auto& cells = *grid_;
    constexpr size_t N = SudokuConstraint::SIZE;
    if (cells.size() != N * N) {
        throw std::runtime_error("Sudoku grid must have 81 cells, got " + std::to_string(cells.size()));
    }

    Grid grid{};
    for (size_t i = 0; i < cells.size(); ++i) {
        auto v = cells[i];
        if (v < 0 || v > static_cast<Domain::value_type>(N)) {
            throw std::runtime_error("Sudoku cell " + std::to_string(i + 1) + " has value " +
                                     std::to_string(v) + " outside 0..9");
        }
        grid[i / N][i % N] = static_cast<int>(v);
    }
    return SudokuPuzzle(grid);
}

MapColoring ProblemFile::to_map_coloring(size_t num_colors) const {
    if (kind() != ProblemKind::MapColoring) {
        throw std::runtime_error("Problem file does not describe a map coloring");
    }

    Adjacency adjacency;
    for (const auto& decl : region_decls_) {
        auto& neighbors = adjacency[decl.name];
        neighbors.insert(neighbors.end(), decl.neighbors.begin(), decl.neighbors.end());
    }

    // 宣言位置つきで報告する（normalize_adjacency の検査より先に）
    for (const auto& decl : region_decls_) {
        for (const auto& neighbor : decl.neighbors) {
            if (neighbor == decl.name) {
                throw std::runtime_error("line " + std::to_string(decl.line) + ": region " +
                                         decl.name + " is adjacent to itself");
            }
            if (!adjacency.count(neighbor)) {
                throw std::runtime_error("line " + std::to_string(decl.line) + ": region " +
                                         decl.name + " refers to unknown region " + neighbor);
            }
        }
    }

    auto palette = palette_ ? *palette_ : default_palette();
    if (num_colors > 0) {
        if (num_colors > palette.size()) {
            throw std::runtime_error("Requested " + std::to_string(num_colors) +
                                     " colors but the palette has " + std::to_string(palette.size()));
        }
        palette.resize(num_colors);
    }
    return MapColoring(adjacency, std::move(palette));
}

} // namespace io
} // namespace tansaku_csp
