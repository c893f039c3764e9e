#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "sudoku_grid.hpp"

class SudokuSolver {
public:
    SudokuSolver(); // Tries digits 1..9 in increasing order
    explicit SudokuSolver(std::mt19937& rng); // Shuffles 1..9 at every search node

    // nullopt means the grid has no solution
    std::optional<Grid> solve(const Grid& input);

    // Counts solutions, stopping as soon as `limit` of them are found
    int count_solutions(const Grid& input, int limit);

private:
    Grid grid;
    std::array<uint16_t, GRID_SIZE> row_mask;
    std::array<uint16_t, GRID_SIZE> col_mask;
    std::array<uint16_t, GRID_SIZE> box_mask;
    std::vector<int> empty_cells;
    std::mt19937* rng; // not owned, may be null
    int solution_count;
    int solution_limit;

    bool load(const Grid& input);
    void place(int idx, int val);
    void remove(int idx, int val);
    uint16_t get_candidates(int idx) const;
    std::array<int, GRID_SIZE> candidate_order();
    bool solve_recursive(size_t k);
    void count_recursive(size_t k);
};
