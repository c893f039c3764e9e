#pragma once

#include <array>
#include <iostream>
#include <vector>

constexpr int GRID_SIZE = 9;
constexpr int BOX_N = 3;
constexpr int CELL_COUNT = GRID_SIZE * GRID_SIZE;

// Row-major 9x9 board, 0 = empty cell
using Grid = std::array<int, CELL_COUNT>;

inline int cell_index(int row, int col) {
    return row * GRID_SIZE + col;
}

inline int box_index(int row, int col) {
    return (row / BOX_N) * BOX_N + (col / BOX_N);
}

Grid make_grid(const std::vector<std::vector<int>>& rows);

// Throws std::invalid_argument if a value is outside 0..9
void check_grid(const Grid& g);

bool is_complete_solution(const Grid& g);
int count_filled(const Grid& g);

void print_grid(const Grid& g, std::ostream& out = std::cout);
