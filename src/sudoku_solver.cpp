#include "sudoku_solver.hpp"

#include <algorithm>
#include <bit> // Requires C++20
#include <numeric>
#include <stdexcept>

/**
 * Backtracking Sudoku solver
 * 1. Bitmasks: rows, cols and boxes keep the digits they hold, so a candidate
 *    check is three ORs. A digit is a candidate exactly when is_valid_placement
 *    would accept it: it appears nowhere else in the cell's row, column or box.
 * 2. solve() fills cells in row-major order, trying digits 1..9 (or a shuffled
 *    order per cell when built with a random engine).
 * 3. count_solutions() branches on the cell with the fewest candidates (MRV);
 *    the number of solutions does not depend on the order cells are visited.
 */

SudokuSolver::SudokuSolver() : grid{}, rng(nullptr), solution_count(0), solution_limit(0) {}

SudokuSolver::SudokuSolver(std::mt19937& engine)
    : grid{}, rng(&engine), solution_count(0), solution_limit(0) {}

std::optional<Grid> SudokuSolver::solve(const Grid& input) {
    if (!load(input)) return std::nullopt;

    if (solve_recursive(0)) {
        return grid;
    }
    return std::nullopt;
}

int SudokuSolver::count_solutions(const Grid& input, int limit) {
    if (limit < 1) {
        throw std::invalid_argument("solution limit must be at least 1");
    }
    if (!load(input)) return 0;

    solution_count = 0;
    solution_limit = limit;
    count_recursive(0);
    return solution_count;
}

// Resets the masks, places the givens and collects the empty cells in
// row-major order. Returns false when two givens already clash, in which
// case there is nothing to search.
bool SudokuSolver::load(const Grid& input) {
    check_grid(input);

    grid.fill(0);
    row_mask.fill(0);
    col_mask.fill(0);
    box_mask.fill(0);
    empty_cells.clear();
    empty_cells.reserve(CELL_COUNT);

    for (int i = 0; i < CELL_COUNT; ++i) {
        int v = input[i];
        if (v == 0) {
            empty_cells.push_back(i);
            continue;
        }
        if (!(get_candidates(i) & (1 << (v - 1)))) return false;
        place(i, v);
    }
    return true;
}

// Mark a number as used in the bitmasks and grid
void SudokuSolver::place(int idx, int val) {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    uint16_t bit = 1 << (val - 1);

    grid[idx] = val;
    row_mask[r] |= bit;
    col_mask[c] |= bit;
    box_mask[box_index(r, c)] |= bit;
}

// Unmark a number (backtracking)
void SudokuSolver::remove(int idx, int val) {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    uint16_t bit = 1 << (val - 1);

    grid[idx] = 0;
    row_mask[r] &= ~bit;
    col_mask[c] &= ~bit;
    box_mask[box_index(r, c)] &= ~bit;
}

// 9 bits where 1 means "available" for an empty cell
uint16_t SudokuSolver::get_candidates(int idx) const {
    int r = idx / GRID_SIZE;
    int c = idx % GRID_SIZE;
    return ~(row_mask[r] | col_mask[c] | box_mask[box_index(r, c)]) & 0x1FF;
}

std::array<int, GRID_SIZE> SudokuSolver::candidate_order() {
    std::array<int, GRID_SIZE> digits;
    std::iota(digits.begin(), digits.end(), 1);
    if (rng) std::shuffle(digits.begin(), digits.end(), *rng);
    return digits;
}

// k indexes empty_cells; everything before it is already placed
bool SudokuSolver::solve_recursive(size_t k) {
    if (k == empty_cells.size()) {
        return true; // All cells filled
    }

    const int idx = empty_cells[k];
    const uint16_t mask = get_candidates(idx);
    if (mask == 0) return false; // Dead end

    for (int val : candidate_order()) {
        if (!(mask & (1 << (val - 1)))) continue;

        place(idx, val);
        if (solve_recursive(k + 1)) {
            return true;
        }
        remove(idx, val);
    }
    return false;
}

void SudokuSolver::count_recursive(size_t k) {
    if (k == empty_cells.size()) {
        ++solution_count;
        return;
    }

    // MRV: swap the remaining cell with the fewest candidates to position k
    size_t best_idx = k;
    int min_candidates = 10;
    uint16_t best_mask = 0;

    for (size_t i = k; i < empty_cells.size(); ++i) {
        uint16_t mask = get_candidates(empty_cells[i]);
        int count = std::popcount(mask);

        if (count == 0) return; // Dead end

        if (count < min_candidates) {
            min_candidates = count;
            best_mask = mask;
            best_idx = i;
            if (count == 1) break;
        }
    }

    std::swap(empty_cells[k], empty_cells[best_idx]);
    const int cell = empty_cells[k];

    while (best_mask && solution_count < solution_limit) {
        int val = std::countr_zero(best_mask) + 1;

        place(cell, val);
        count_recursive(k + 1);
        remove(cell, val);

        // Clear the lowest set bit to move to the next candidate
        best_mask &= (best_mask - 1);
    }
}
