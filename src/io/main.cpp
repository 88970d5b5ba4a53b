#include "tansaku_csp/solver.hpp"
#include "problem_parser.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <unistd.h>

tansaku_csp::Solver* g_current_solver = nullptr;

void timeout_handler(int) {
    if (g_current_solver) {
        g_current_solver->stop();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-f] [-m] [-v] [-k N] [-n NODES] [-t SEC] <problem file>\n";
    std::cerr << "  -f        Forward checking\n";
    std::cerr << "  -m        MRV variable selection (default: static order)\n";
    std::cerr << "  -v        Verbose mode (print search trace to stderr)\n";
    std::cerr << "  -k N      Map coloring: use the first N palette colors\n";
    std::cerr << "  -n NODES  Stop after NODES trial assignments\n";
    std::cerr << "  -t SEC    Timeout in seconds\n";
}

void print_stats(const tansaku_csp::Solver& solver) {
    const auto& s = solver.stats();
    std::cout << "Assignments: " << s.assignments
              << ", Backtracks: " << s.backtracks
              << ", Time: " << std::fixed << std::setprecision(4) << s.elapsed_seconds << "s\n";
}

void print_failure(const tansaku_csp::Solver& solver) {
    if (solver.last_result() == tansaku_csp::SearchResult::UNKNOWN) {
        std::cout << "=====UNKNOWN=====\n";
    } else {
        std::cout << "=====UNSATISFIABLE=====\n";
    }
}

/**
 * @brief Sudoku を解く
 */
void solve_sudoku(const tansaku_csp::io::ProblemFile& problem, tansaku_csp::Solver& solver) {
    auto puzzle = problem.to_sudoku();

    std::cout << "=== Given puzzle ===\n" << tansaku_csp::format_grid(puzzle.grid()) << "\n";

    auto solution = puzzle.solve(solver);
    if (solution) {
        std::cout << "=== Solved puzzle ===\n" << tansaku_csp::format_grid(*solution) << "\n";
        std::cout << "==========\n";
    } else {
        print_failure(solver);
    }
    print_stats(solver);
}

/**
 * @brief 地図彩色を解く
 */
void solve_map_coloring(const tansaku_csp::io::ProblemFile& problem, tansaku_csp::Solver& solver,
                        size_t num_colors) {
    auto map = problem.to_map_coloring(num_colors);
    const auto& regions = map.regions();

    std::cout << "Detected " << regions.size() << " variables (regions)";
    if (!regions.empty()) {
        const auto& first = regions.front();
        const auto& neighbors = map.adjacency().at(first);
        std::cout << ", e.g. " << first << " ->";
        for (size_t i = 0; i < neighbors.size() && i < 8; ++i) {
            std::cout << " " << neighbors[i];
        }
    }
    std::cout << "\nPalette (" << map.palette().size() << " colors):";
    for (const auto& color : map.palette()) {
        std::cout << " " << color;
    }
    std::cout << "\n\n";

    auto coloring = map.solve(solver);
    if (coloring) {
        for (const auto& [region, color] : *coloring) {
            std::cout << region << ": " << color << "\n";
        }
        std::cout << "==========\n";
    } else {
        print_failure(solver);
    }
    print_stats(solver);
}

int main(int argc, char* argv[]) {
    const char* filename = nullptr;
    bool forward_checking = false;
    bool mrv = false;
    bool verbose = false;
    size_t num_colors = 0;
    size_t node_limit = 0;
    int timeout_sec = 0;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-f") == 0) {
            forward_checking = true;
        } else if (std::strcmp(argv[i], "-m") == 0) {
            mrv = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-k") == 0 && i + 1 < argc) {
            num_colors = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            node_limit = std::strtoul(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    tansaku_csp::Solver solver;
    solver.set_forward_checking(forward_checking);
    solver.set_selection_policy(mrv ? tansaku_csp::SelectionPolicy::MRV
                                    : tansaku_csp::SelectionPolicy::Static);
    solver.set_node_limit(node_limit);
    solver.set_verbose(verbose);
    g_current_solver = &solver;

    // Setup timeout
    if (timeout_sec > 0) {
        std::signal(SIGALRM, timeout_handler);
        alarm(static_cast<unsigned>(timeout_sec));
    }

    try {
        auto problem = tansaku_csp::io::parse_file(filename);

        switch (problem->kind()) {
            case tansaku_csp::io::ProblemKind::Sudoku:
                solve_sudoku(*problem, solver);
                break;
            case tansaku_csp::io::ProblemKind::MapColoring:
                solve_map_coloring(*problem, solver, num_colors);
                break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
