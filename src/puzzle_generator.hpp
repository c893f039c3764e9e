#pragma once

#include <cstdint>
#include <random>

#include "sudoku_grid.hpp"

struct Puzzle {
    Grid puzzle;   // givens, 0 = cell to fill
    Grid solution; // the unique completion of `puzzle`
};

class PuzzleGenerator {
public:
    PuzzleGenerator(); // Seeded from std::random_device
    explicit PuzzleGenerator(uint32_t seed);

    // Random complete board
    Grid generate_solution();

    // Random full board carved down to a puzzle with exactly one solution
    Puzzle generate_puzzle();

private:
    std::mt19937 rng;

    Grid carve(const Grid& solution);
};
