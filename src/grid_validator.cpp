#include "grid_validator.hpp"

#include <stdexcept>
#include <string>

bool is_valid_placement(const Grid& grid, int row, int col, int digit) {
    if (row < 0 || row >= GRID_SIZE || col < 0 || col >= GRID_SIZE) {
        throw std::out_of_range("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                ") is outside the 9x9 grid");
    }
    if (digit < 1 || digit > 9) {
        throw std::out_of_range("digit " + std::to_string(digit) + " is outside 1..9");
    }

    for (int k = 0; k < GRID_SIZE; ++k) {
        if (k != col && grid[cell_index(row, k)] == digit) return false;
        if (k != row && grid[cell_index(k, col)] == digit) return false;
    }

    const int r0 = row - row % BOX_N;
    const int c0 = col - col % BOX_N;
    for (int r = r0; r < r0 + BOX_N; ++r) {
        for (int c = c0; c < c0 + BOX_N; ++c) {
            if ((r != row || c != col) && grid[cell_index(r, c)] == digit) return false;
        }
    }
    return true;
}
