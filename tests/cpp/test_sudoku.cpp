#include <catch2/catch.hpp>
#include "tansaku_csp/problems/sudoku.hpp"

#include <stdexcept>
#include <string>
#include <utility>

using namespace tansaku_csp;

namespace {

const Grid kClassicPuzzle = {{
    {5, 3, 0, 0, 7, 0, 0, 0, 0},
    {6, 0, 0, 1, 9, 5, 0, 0, 0},
    {0, 9, 8, 0, 0, 0, 0, 6, 0},
    {8, 0, 0, 0, 6, 0, 0, 0, 3},
    {4, 0, 0, 8, 0, 3, 0, 0, 1},
    {7, 0, 0, 0, 2, 0, 0, 0, 6},
    {0, 6, 0, 0, 0, 0, 2, 8, 0},
    {0, 0, 0, 4, 1, 9, 0, 0, 5},
    {0, 0, 0, 0, 8, 0, 0, 7, 9},
}};

const Grid kClassicSolution = {{
    {5, 3, 4, 6, 7, 8, 9, 1, 2},
    {6, 7, 2, 1, 9, 5, 3, 4, 8},
    {1, 9, 8, 3, 4, 2, 5, 6, 7},
    {8, 5, 9, 7, 6, 1, 4, 2, 3},
    {4, 2, 6, 8, 5, 3, 7, 9, 1},
    {7, 1, 3, 9, 2, 4, 8, 5, 6},
    {9, 6, 1, 5, 3, 7, 2, 8, 4},
    {2, 8, 7, 4, 1, 9, 6, 3, 5},
    {3, 4, 5, 2, 8, 6, 1, 7, 9},
}};

size_t count_givens(const Grid& grid) {
    size_t n = 0;
    for (const auto& row : grid) {
        for (int v : row) {
            if (v != 0) ++n;
        }
    }
    return n;
}

}  // namespace

TEST_CASE("Sudoku model construction", "[sudoku]") {
    SudokuPuzzle puzzle(kClassicPuzzle);
    auto model = puzzle.to_model();

    REQUIRE(model->num_variables() == 81);
    REQUIRE(model->constraints().size() == 1);
    REQUIRE(model->variable_name(0) == "r1c1");
    REQUIRE(model->variable_name(SudokuConstraint::cell_index(8, 8)) == "r9c9");
    REQUIRE(model->assignment().assigned_count() == count_givens(kClassicPuzzle));

    // given cell: singleton and preassigned
    REQUIRE(model->assignment().value(0) == 5);
    REQUIRE(model->domains().domain(0).is_singleton());
    // empty cell: full range
    REQUIRE(!model->assignment().is_assigned(2));
    REQUIRE(model->domains().size(2) == 9);
}

TEST_CASE("Sudoku rejects out of range values", "[sudoku]") {
    Grid grid{};
    grid[3][4] = 10;
    REQUIRE_THROWS_AS(SudokuPuzzle(grid), std::runtime_error);
    grid[3][4] = -1;
    REQUIRE_THROWS_AS(SudokuPuzzle(grid), std::runtime_error);
}

TEST_CASE("Classic puzzle is solved by every configuration", "[sudoku][solver]") {
    SudokuPuzzle puzzle(kClassicPuzzle);
    Solver solver;

    SECTION("plain backtracking, static order") {
        auto solution = puzzle.solve(solver);
        REQUIRE(solution.has_value());
        REQUIRE(*solution == kClassicSolution);
        REQUIRE(puzzle.is_solution(*solution));
        REQUIRE(solver.stats().assignments >= 81 - count_givens(kClassicPuzzle));
    }

    SECTION("forward checking, static order") {
        solver.set_forward_checking(true);
        auto solution = puzzle.solve(solver);
        REQUIRE(solution.has_value());
        REQUIRE(*solution == kClassicSolution);
    }

    SECTION("forward checking, MRV") {
        solver.set_forward_checking(true);
        solver.set_selection_policy(SelectionPolicy::MRV);
        auto solution = puzzle.solve(solver);
        REQUIRE(solution.has_value());
        REQUIRE(puzzle.is_solution(*solution));
        REQUIRE(*solution == kClassicSolution);
    }

    SECTION("plain backtracking, MRV") {
        solver.set_selection_policy(SelectionPolicy::MRV);
        auto solution = puzzle.solve(solver);
        REQUIRE(solution.has_value());
        REQUIRE(*solution == kClassicSolution);
    }
}

TEST_CASE("Forward checking does not change the static-order search path", "[sudoku][solver]") {
    SudokuPuzzle puzzle(kClassicPuzzle);

    Solver plain;
    auto plain_solution = puzzle.solve(plain);

    Solver fc;
    fc.set_forward_checking(true);
    auto fc_solution = puzzle.solve(fc);

    REQUIRE(plain_solution.has_value());
    REQUIRE(fc_solution.has_value());
    REQUIRE(*plain_solution == *fc_solution);
    REQUIRE(fc.stats().assignments <= plain.stats().assignments);
}

TEST_CASE("Duplicate givens make the puzzle unsolvable", "[sudoku][solver]") {
    Grid grid = kClassicPuzzle;
    grid[0][2] = 5;  // second 5 in row 1
    SudokuPuzzle puzzle(grid);

    bool forward_checking = false;
    SECTION("plain backtracking") { forward_checking = false; }
    SECTION("forward checking") { forward_checking = true; }

    auto model = puzzle.to_model();
    const auto domains_before = model->domains();
    const auto assignment_before = model->assignment();

    Solver solver;
    solver.set_forward_checking(forward_checking);
    REQUIRE(!solver.solve(*model).has_value());
    REQUIRE(solver.last_result() == SearchResult::UNSAT);
    REQUIRE(solver.stats().assignments == 0);
    REQUIRE(model->domains() == domains_before);
    REQUIRE(model->assignment() == assignment_before);
}

TEST_CASE("Consistent givens without a completion are unsolvable", "[sudoku][solver]") {
    // r1c9 can only be 9, but column 9 already holds a 9
    Grid grid{};
    for (int c = 0; c < 8; ++c) {
        grid[0][c] = c + 1;
    }
    grid[4][8] = 9;
    SudokuPuzzle puzzle(grid);

    bool forward_checking = false;
    SECTION("plain backtracking") { forward_checking = false; }
    SECTION("forward checking") { forward_checking = true; }

    auto model = puzzle.to_model();
    const auto domains_before = model->domains();
    const auto assignment_before = model->assignment();

    Solver solver;
    solver.set_forward_checking(forward_checking);
    REQUIRE(!solver.solve(*model).has_value());
    REQUIRE(solver.last_result() == SearchResult::UNSAT);
    REQUIRE(model->domains() == domains_before);
    REQUIRE(model->assignment() == assignment_before);
}

TEST_CASE("Node limit on a sudoku", "[sudoku][solver]") {
    SudokuPuzzle puzzle(kClassicPuzzle);
    auto model = puzzle.to_model();
    const auto domains_before = model->domains();
    const auto assignment_before = model->assignment();

    Solver solver;
    solver.set_forward_checking(true);
    solver.set_node_limit(5);

    REQUIRE(!solver.solve(*model).has_value());
    REQUIRE(solver.last_result() == SearchResult::UNKNOWN);
    REQUIRE(solver.stats().assignments == 5);
    REQUIRE(model->domains() == domains_before);
    REQUIRE(model->assignment() == assignment_before);
}

TEST_CASE("Sudoku solution checker", "[sudoku]") {
    SudokuPuzzle puzzle(kClassicPuzzle);

    REQUIRE(puzzle.is_solution(kClassicSolution));

    SECTION("changed given") {
        Grid bad = kClassicSolution;
        std::swap(bad[0][0], bad[0][2]);
        REQUIRE(!puzzle.is_solution(bad));
    }

    SECTION("duplicate in a unit") {
        Grid bad = kClassicSolution;
        bad[0][2] = 5;  // r1c3 is not a given
        REQUIRE(!puzzle.is_solution(bad));
    }

    SECTION("incomplete grid") {
        REQUIRE(!puzzle.is_solution(kClassicPuzzle));
    }
}

TEST_CASE("Grid formatting", "[sudoku]") {
    auto text = format_grid(kClassicPuzzle);

    REQUIRE(text.rfind("5 3 . | . 7 . | . . . \n", 0) == 0);
    REQUIRE(text.find("---------------------\n") != std::string::npos);

    size_t lines = 0;
    for (char ch : text) {
        if (ch == '\n') ++lines;
    }
    REQUIRE(lines == 11);
}
