#pragma once

#include "sudoku_grid.hpp"

/**
 * Checks whether `digit` may go at (row, col) without repeating in the row,
 * column or box. Only the *other* cells are inspected, so the target cell may
 * already hold a value.
 *
 * @throws std::out_of_range if row/col are outside 0..8 or digit outside 1..9.
 */
bool is_valid_placement(const Grid& grid, int row, int col, int digit);
