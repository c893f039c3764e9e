#include "puzzle_generator.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

#include "sudoku_solver.hpp"

PuzzleGenerator::PuzzleGenerator() : rng(std::random_device{}()) {}

PuzzleGenerator::PuzzleGenerator(uint32_t seed) : rng(seed) {}

Grid PuzzleGenerator::generate_solution() {
    SudokuSolver solver(rng);
    Grid empty{};

    std::optional<Grid> full = solver.solve(empty);
    if (!full.has_value()) {
        // An empty board always has a completion
        throw std::logic_error("failed to fill an empty grid");
    }
    return *full;
}

Puzzle PuzzleGenerator::generate_puzzle() {
    Puzzle p;
    p.solution = generate_solution();
    p.puzzle = carve(p.solution);
    return p;
}

// Single pass over the cells in random order. A removal is kept only if the
// grid still has exactly one solution afterwards; checking after every
// removal is what keeps the final puzzle unique.
Grid PuzzleGenerator::carve(const Grid& solution) {
    Grid g = solution;
    SudokuSolver checker;

    std::array<int, CELL_COUNT> order;
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    for (int idx : order) {
        const int removed = g[idx];
        g[idx] = 0;

        if (checker.count_solutions(g, 2) != 1) {
            g[idx] = removed; // ambiguous, put it back
        }
    }
    return g;
}
