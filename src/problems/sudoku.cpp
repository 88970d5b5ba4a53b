#include "tansaku_csp/problems/sudoku.hpp"
#include <stdexcept>

namespace tansaku_csp {

namespace {
constexpr size_t N = SudokuConstraint::SIZE;
constexpr size_t B = SudokuConstraint::BOX;
}  // namespace

SudokuPuzzle::SudokuPuzzle(const Grid& grid)
    : grid_(grid) {
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            int v = grid_[r][c];
            if (v < 0 || v > static_cast<int>(N)) {
                throw std::runtime_error("Sudoku cell r" + std::to_string(r + 1) + "c" +
                                         std::to_string(c + 1) + " has value " +
                                         std::to_string(v) + " outside 0..9");
            }
        }
    }
}

std::unique_ptr<Model> SudokuPuzzle::to_model() const {
    auto model = std::make_unique<Model>();
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            std::string name = "r" + std::to_string(r + 1) + "c" + std::to_string(c + 1);
            if (grid_[r][c] != 0) {
                model->create_variable(std::move(name), Domain::value_type{grid_[r][c]});
            } else {
                model->create_variable(std::move(name), 1, static_cast<Domain::value_type>(N));
            }
        }
    }
    model->add_constraint(std::make_shared<SudokuConstraint>());
    return model;
}

Grid SudokuPuzzle::to_grid(const Assignment& assignment) {
    Grid grid{};
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            const auto& v = assignment.value(SudokuConstraint::cell_index(r, c));
            grid[r][c] = v ? static_cast<int>(*v) : 0;
        }
    }
    return grid;
}

std::optional<Grid> SudokuPuzzle::solve(Solver& solver) const {
    auto model = to_model();
    auto result = solver.solve(*model);
    if (!result) {
        return std::nullopt;
    }
    return to_grid(*result);
}

bool SudokuPuzzle::is_solution(const Grid& solution) const {
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            if (grid_[r][c] != 0 && solution[r][c] != grid_[r][c]) {
                return false;
            }
        }
    }

    // unit ごとに 1..9 の出現をビットで数える
    auto check_unit = [&](auto cell_at) {
        unsigned seen = 0;
        for (size_t k = 0; k < N; ++k) {
            int v = cell_at(k);
            if (v < 1 || v > static_cast<int>(N)) return false;
            seen |= 1u << v;
        }
        return seen == 0x3FEu;
    };

    for (size_t i = 0; i < N; ++i) {
        if (!check_unit([&](size_t k) { return solution[i][k]; })) return false;
        if (!check_unit([&](size_t k) { return solution[k][i]; })) return false;
        size_t box_row = (i / B) * B;
        size_t box_column = (i % B) * B;
        if (!check_unit([&](size_t k) { return solution[box_row + k / B][box_column + k % B]; })) {
            return false;
        }
    }
    return true;
}

std::string format_grid(const Grid& grid) {
    std::string out;
    for (size_t r = 0; r < N; ++r) {
        for (size_t c = 0; c < N; ++c) {
            out += grid[r][c] != 0 ? static_cast<char>('0' + grid[r][c]) : '.';
            out += (c == 2 || c == 5) ? " | " : " ";
        }
        out += "\n";
        if (r == 2 || r == 5) {
            out += std::string(21, '-') + "\n";
        }
    }
    return out;
}

} // namespace tansaku_csp
