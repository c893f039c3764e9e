#include "sudoku_grid.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>

Grid make_grid(const std::vector<std::vector<int>>& rows) {
    if (rows.size() != GRID_SIZE) {
        throw std::invalid_argument("grid must have 9 rows, got " + std::to_string(rows.size()));
    }

    Grid g{};
    for (int r = 0; r < GRID_SIZE; ++r) {
        if (rows[r].size() != GRID_SIZE) {
            throw std::invalid_argument("row " + std::to_string(r) + " must have 9 cells");
        }
        for (int c = 0; c < GRID_SIZE; ++c) g[cell_index(r, c)] = rows[r][c];
    }
    check_grid(g);
    return g;
}

void check_grid(const Grid& g) {
    for (int i = 0; i < CELL_COUNT; ++i) {
        if (g[i] < 0 || g[i] > 9) {
            throw std::invalid_argument("cell " + std::to_string(i) + " holds " +
                                        std::to_string(g[i]) + ", expected 0..9");
        }
    }
}

// Every row, column and box must be a permutation of 1..9
bool is_complete_solution(const Grid& g) {
    std::array<uint16_t, GRID_SIZE> row_mask{};
    std::array<uint16_t, GRID_SIZE> col_mask{};
    std::array<uint16_t, GRID_SIZE> box_mask{};

    for (int r = 0; r < GRID_SIZE; ++r) {
        for (int c = 0; c < GRID_SIZE; ++c) {
            int v = g[cell_index(r, c)];
            if (v < 1 || v > 9) return false;

            uint16_t bit = 1 << (v - 1);
            int b = box_index(r, c);
            if ((row_mask[r] & bit) || (col_mask[c] & bit) || (box_mask[b] & bit)) return false;

            row_mask[r] |= bit;
            col_mask[c] |= bit;
            box_mask[b] |= bit;
        }
    }
    return true;
}

int count_filled(const Grid& g) {
    return static_cast<int>(std::count_if(g.begin(), g.end(), [](int v) { return v != 0; }));
}

void print_grid(const Grid& g, std::ostream& out) {
    for (int r = 0; r < GRID_SIZE; ++r) {
        if (r > 0 && r % 3 == 0) out << "------+-------+------\n";
        for (int c = 0; c < GRID_SIZE; ++c) {
            if (c > 0 && c % 3 == 0) out << "| ";
            out << (g[r * GRID_SIZE + c] == 0 ? '.' : (char)('0' + g[r * GRID_SIZE + c])) << " ";
        }
        out << "\n";
    }
}
